#pragma once

#include "core/types.hpp"
#include "db/connection_manager.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sqlgateway {

/**
 * @brief Databases visible on a server, as listed by the backend's catalog
 */
struct DatabaseList {
    bool success = false;
    std::vector<std::string> databases;
    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] int64_t execution_ms() const {
        return (execution_time.count() + 500) / 1000;
    }
};

/**
 * @brief Query executor - runs statements on an acquired session
 *
 * Per execution:
 * - Switches the session's database context when the target differs; with
 *   no requested or default database the session returns to its home database
 * - Applies the profile's statement timeout
 * - Fetches at most max_result_rows rows
 * - Normalizes the rows into a Recordset
 *
 * Backend failures are returned in-band and never thrown. TIMEOUT and
 * CONNECTION failures mark the session suspect so the pool validates it
 * before it is handed out again.
 */
class QueryExecutor {
public:
    /**
     * @brief Execute a single statement (or multi-statement batch text)
     * @param database Target database; falls back to the profile's default
     * @param params Values bound to the statement's placeholders
     */
    [[nodiscard]] QueryResult execute(Session& session,
                                      const ServerProfile& profile,
                                      const std::string& sql,
                                      const std::optional<std::string>& database = std::nullopt,
                                      const std::vector<QueryParam>& params = {}) const;

    /**
     * @brief Run statements in order inside one transaction
     *
     * Commits when every statement succeeds, otherwise rolls back at the
     * first failure and reports its 1-based index.
     */
    [[nodiscard]] BatchResult execute_batch(Session& session,
                                            const ServerProfile& profile,
                                            const std::vector<SqlStatement>& statements,
                                            const std::optional<std::string>& database = std::nullopt) const;

    /**
     * @brief Run the backend's catalog query and return its first column
     */
    [[nodiscard]] DatabaseList list_databases(Session& session, const ServerProfile& profile) const;

    /**
     * @brief Database a request runs against (empty = the session's home database)
     */
    [[nodiscard]] static std::string target_database(const ServerProfile& profile,
                                                     const std::optional<std::string>& database);

private:
    struct Failure {
        ErrorCode code;
        std::string message;
    };

    /** @brief Switch database and apply the timeout; nullopt when ready */
    [[nodiscard]] static std::optional<Failure> prepare(Session& session,
                                                       const ServerProfile& profile,
                                                       const std::optional<std::string>& database);

    [[nodiscard]] static Failure classify_failure(Session& session, const DbResultSet& rs);

    [[nodiscard]] static DbResultSet run(Session& session, const std::string& sql,
                                         const std::vector<QueryParam>& params, size_t max_rows);

    [[nodiscard]] static QueryData to_query_data(const DbResultSet& rs);
};

} // namespace sqlgateway
