#pragma once

#include "db/idb_backend.hpp"

namespace sqlgateway {

/**
 * @brief MySQL / MariaDB backend
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;

    [[nodiscard]] std::string list_databases_sql() const override { return "SHOW DATABASES"; }

    [[nodiscard]] std::string begin_transaction_sql() const override {
        return "START TRANSACTION";
    }
};

} // namespace sqlgateway
