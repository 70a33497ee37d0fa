#pragma once

#include "db/idb_backend.hpp"

namespace sqlgateway {

/**
 * @brief PostgreSQL backend
 *
 * Creates PgConnectionFactory instances and supplies the PostgreSQL
 * catalog and transaction statements.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;

    [[nodiscard]] std::string list_databases_sql() const override;

    [[nodiscard]] std::string begin_transaction_sql() const override { return "BEGIN"; }
};

} // namespace sqlgateway
