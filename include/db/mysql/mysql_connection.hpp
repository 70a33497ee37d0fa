#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <mysql/mysql.h>
#include <optional>
#include <string>
#include <vector>

namespace sqlgateway {

/**
 * @brief MySQL connection implementing IDbConnection
 *
 * Wraps MYSQL* handle (MariaDB Connector/C or libmysqlclient).
 * All MySQL C API calls are encapsulated here.
 *
 * Parameterized statements go through the prepared statement API; every
 * result column is fetched as text so both paths normalize the same way.
 */
class MysqlConnection : public IDbConnection {
public:
    /**
     * @param conn Connected handle (takes ownership)
     * @param profile Profile used to restore the session after a change of user
     * @param database Database selected at connect time, possibly empty
     */
    MysqlConnection(MYSQL* conn, ServerProfile profile, std::string database);
    ~MysqlConnection() override;

    MysqlConnection(const MysqlConnection&) = delete;
    MysqlConnection& operator=(const MysqlConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override;
    DbResultSet execute_with_params(const std::string& sql, const std::vector<QueryParam>& params,
                                    size_t max_rows = 0) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    std::string switch_database(const std::string& database) override;
    const std::string& current_database() const override { return current_database_; }
    const std::string& home_database() const override { return home_database_; }
    bool in_transaction() override;
    void close() override;

    /**
     * @brief Apply per-session settings of a profile to a fresh session
     * @return Empty string on success, otherwise the server's error text
     *
     * Read-only profiles get SET SESSION TRANSACTION READ ONLY.
     */
    static std::string prepare_session(MYSQL* conn, const ServerProfile& profile);

private:
    DbResultSet process_result_set(MYSQL_RES* res, size_t max_rows);
    DbResultSet process_affected_rows();
    DbResultSet process_error();
    DbResultSet process_statement(MYSQL_STMT* stmt, size_t max_rows);
    DbResultSet classify_error(unsigned int code, const char* message);
    void refresh_current_database(const std::string& sql);

    MYSQL* conn_;
    ServerProfile profile_;
    std::string current_database_;
    std::string home_database_;
    std::optional<uint32_t> applied_timeout_ms_;
    bool broken_ = false;
};

/**
 * @brief MySQL connection factory
 *
 * Creates MysqlConnection instances using mysql_real_connect.
 * The client read timeout is derived from the profile's query timeout so a
 * hung server cannot block a session forever.
 */
class MysqlConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(
        const ServerProfile& profile, const std::string& database) override;
};

} // namespace sqlgateway
