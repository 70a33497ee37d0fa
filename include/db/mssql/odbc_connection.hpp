#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sql.h>
#include <sqlext.h>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgateway {

/**
 * @brief Wrap an ODBC connection-string value in braces, doubling '}'
 */
[[nodiscard]] std::string escape_odbc_value(std::string_view value);

/**
 * @brief Build the SQLDriverConnect string for a SQL Server profile
 *
 * Recognized options: odbc_driver, encrypt, trust_server_certificate,
 * trusted_connection. Other options are appended as Key=Value pairs.
 * Read-only profiles connect with ApplicationIntent=ReadOnly.
 */
[[nodiscard]] std::string build_odbc_connection_string(
    const ServerProfile& profile, const std::string& database);

/**
 * @brief SQL Server connection over ODBC implementing IDbConnection
 *
 * Owns one environment and one connection handle. Every execute()
 * allocates a fresh statement handle carrying the current query timeout.
 * Uses the narrow (SQL_C_CHAR) API; text arrives in the client locale.
 *
 * A batch returns its first result set (or the summed row counts when it
 * has none); every later result is drained so that an error raised by a
 * later statement fails the execution. Named parameters run through
 * sp_executesql.
 */
class OdbcConnection : public IDbConnection {
public:
    /**
     * @brief Take ownership of connected handles
     */
    OdbcConnection(SQLHENV env, SQLHDBC dbc, std::string database);
    ~OdbcConnection() override;

    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override;
    DbResultSet execute_with_params(const std::string& sql, const std::vector<QueryParam>& params,
                                    size_t max_rows = 0) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override { return connected_; }
    bool set_query_timeout(uint32_t timeout_ms) override;
    std::string switch_database(const std::string& database) override;
    const std::string& current_database() const override { return current_database_; }
    const std::string& home_database() const override { return home_database_; }
    bool in_transaction() override;
    void close() override;

private:
    DbResultSet run(SQLHSTMT stmt, const std::string& sql, const std::vector<QueryParam>& params,
                    size_t max_rows);
    void refresh_current_database();
    DbResultSet fetch_result_set(SQLHSTMT stmt, SQLSMALLINT num_cols, size_t max_rows);
    DbResultSet diagnostic_failure(SQLSMALLINT handle_type, SQLHANDLE handle);

    SQLHENV env_;
    SQLHDBC dbc_;
    bool connected_;
    std::string current_database_;
    std::string home_database_;
    SQLULEN query_timeout_seconds_ = 0;
};

/**
 * @brief SQL Server connection factory (SQLDriverConnect, no prompt)
 */
class OdbcConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(
        const ServerProfile& profile, const std::string& database) override;
};

} // namespace sqlgateway
