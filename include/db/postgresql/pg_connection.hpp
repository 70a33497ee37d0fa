#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

namespace sqlgateway {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 *
 * A PostgreSQL session is bound to one database, so switch_database()
 * opens a new PGconn for the target and replaces the current one.
 * Sessions of a read-only profile start with default_transaction_read_only.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     * @param conn Open connection
     * @param profile Profile used to reconnect on database switches
     */
    PgConnection(PGconn* conn, ServerProfile profile);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

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
     * @brief Open a libpq connection for a profile
     * @return Connection or the libpq error text
     */
    static Result<PGconn*> open(const ServerProfile& profile, const std::string& database);

    /**
     * @brief Value of the libpq `options` keyword for a profile
     *
     * The profile's own `options` entry, plus the read-only session default
     * when the profile is read-only.
     */
    static std::string session_options(const ServerProfile& profile);

private:
    DbResultSet process_result(PGresult* res, size_t max_rows);
    DbResultSet process_tuples_result(PGresult* res, size_t max_rows);
    DbResultSet process_command_result(PGresult* res);
    DbResultSet process_error(PGresult* res);

    PGconn* conn_;
    ServerProfile profile_;
    std::string current_database_;
    std::string home_database_;
    std::optional<uint32_t> applied_timeout_ms_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(
        const ServerProfile& profile, const std::string& database) override;
};

} // namespace sqlgateway
