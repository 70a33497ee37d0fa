#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_factory.hpp"
#include <memory>
#include <string>

namespace sqlgateway {

/**
 * @brief Abstract database backend that creates the DB-specific components
 *
 * Each database type (PostgreSQL, MySQL, SQL Server) provides a concrete
 * implementation: its connection factory plus the dialect snippets the
 * executor needs (catalog listing, transaction control).
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto factory = backend->create_connection_factory();
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Create the factory that opens native connections */
    [[nodiscard]] virtual std::shared_ptr<IConnectionFactory> create_connection_factory() = 0;

    /** @brief Catalog query whose first column lists the visible databases */
    [[nodiscard]] virtual std::string list_databases_sql() const = 0;

    /** @brief Statement that opens an explicit transaction */
    [[nodiscard]] virtual std::string begin_transaction_sql() const = 0;

    [[nodiscard]] virtual std::string commit_sql() const { return "COMMIT"; }
    [[nodiscard]] virtual std::string rollback_sql() const { return "ROLLBACK"; }
};

} // namespace sqlgateway
