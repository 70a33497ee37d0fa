#pragma once

#include "db/idb_backend.hpp"

namespace sqlgateway {

/**
 * @brief SQL Server backend over ODBC
 */
class MssqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MSSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;

    [[nodiscard]] std::string list_databases_sql() const override {
        return "SELECT name FROM sys.databases WHERE state = 0 ORDER BY name";
    }

    [[nodiscard]] std::string begin_transaction_sql() const override { return "BEGIN TRANSACTION"; }
    [[nodiscard]] std::string commit_sql() const override { return "COMMIT TRANSACTION"; }
    [[nodiscard]] std::string rollback_sql() const override { return "ROLLBACK TRANSACTION"; }
};

} // namespace sqlgateway
