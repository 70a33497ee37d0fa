#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlgateway {

/**
 * @brief How a failed execution went wrong
 *
 * STATEMENT errors leave the session usable. TIMEOUT and CONNECTION
 * errors mean the session must be validated before it is reused.
 */
enum class DbErrorKind {
    NONE,
    STATEMENT,
    TIMEOUT,
    CONNECTION
};

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 * A std::nullopt cell is SQL NULL.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    DbErrorKind error_kind = DbErrorKind::NONE;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    // Set when max_rows cut the fetch short
    bool truncated = false;

    static DbResultSet failure(std::string message, DbErrorKind kind) {
        DbResultSet rs;
        rs.success = false;
        rs.error_message = std::move(message);
        rs.error_kind = kind;
        return rs;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, SQLHDBC).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     * @param sql SQL text
     * @param max_rows Stop fetching after this many rows (0 = unlimited) and set truncated
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, size_t max_rows = 0) = 0;

    /**
     * @brief Execute a statement with bound parameters
     *
     * Positional parameters bind to the backend's own placeholders
     * ($1, $2 on PostgreSQL; ? on MySQL and SQL Server). Named parameters
     * are accepted only where supports_named_parameters() holds.
     */
    [[nodiscard]] virtual DbResultSet execute_with_params(
        const std::string& sql, const std::vector<QueryParam>& params, size_t max_rows = 0) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     * ODBC: SQL_ATTR_QUERY_TIMEOUT on each statement handle
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Make `database` the current database context of this session
     * @param database Target; empty returns the session to its home database
     * @return Empty string on success, otherwise the backend's error text
     */
    [[nodiscard]] virtual std::string switch_database(const std::string& database) = 0;

    /**
     * @brief Database the session currently runs against
     *
     * Kept current after statements that change it (USE on MySQL and SQL Server).
     */
    [[nodiscard]] virtual const std::string& current_database() const = 0;

    /**
     * @brief Database the session was opened on (empty for a MySQL login without one)
     */
    [[nodiscard]] virtual const std::string& home_database() const = 0;

    /**
     * @brief Whether a transaction is open on the session
     *
     * Returns true when the state cannot be determined.
     */
    [[nodiscard]] virtual bool in_transaction() = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlgateway
