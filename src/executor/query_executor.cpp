#include "executor/query_executor.hpp"
#include "executor/result_normalizer.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgateway {

std::string QueryExecutor::target_database(const ServerProfile& profile,
                                           const std::optional<std::string>& database) {
    if (database && !database->empty()) {
        return *database;
    }
    return profile.default_database;
}

std::optional<QueryExecutor::Failure> QueryExecutor::prepare(
    Session& session, const ServerProfile& profile,
    const std::optional<std::string>& database) {

    std::string target = target_database(profile, database);
    if (target.empty()) {
        target = session->home_database();
    }
    if (target != session->current_database()) {
        std::string error = session->switch_database(target);
        if (!error.empty()) {
            utils::log::debug(std::format("Server '{}': switch to database '{}' failed: {}",
                profile.name, target, error));
            if (!session->is_connected()) {
                session.mark_suspect();
            }
            return Failure{ErrorCode::DATABASE_ERROR,
                           std::format("Cannot switch to database '{}': {}",
                                       target, utils::trim(error))};
        }
    }

    const auto timeout_ms = static_cast<uint32_t>(profile.query_timeout.count());
    if (!session->set_query_timeout(timeout_ms)) {
        utils::log::warn(std::format("Server '{}': could not apply query timeout of {}ms",
            profile.name, timeout_ms));
    }
    return std::nullopt;
}

QueryExecutor::Failure QueryExecutor::classify_failure(Session& session, const DbResultSet& rs) {
    std::string message = utils::trim(rs.error_message);
    switch (rs.error_kind) {
        case DbErrorKind::TIMEOUT:
            session.mark_suspect();
            return {ErrorCode::QUERY_TIMEOUT, "Query timeout: " + message};
        case DbErrorKind::CONNECTION:
            session.mark_suspect();
            return {ErrorCode::CONNECTION_ERROR, std::move(message)};
        default:
            return {ErrorCode::DATABASE_ERROR, std::move(message)};
    }
}

DbResultSet QueryExecutor::run(Session& session, const std::string& sql,
                               const std::vector<QueryParam>& params, size_t max_rows) {
    if (params.empty()) {
        return session->execute(sql, max_rows);
    }
    return session->execute_with_params(sql, params, max_rows);
}

QueryData QueryExecutor::to_query_data(const DbResultSet& rs) {
    QueryData data;
    data.has_rows = rs.has_rows;
    if (rs.has_rows) {
        data.recordset = ResultNormalizer::normalize(rs);
    } else {
        data.rows_affected = rs.affected_rows;
    }
    return data;
}

QueryResult QueryExecutor::execute(Session& session,
                                   const ServerProfile& profile,
                                   const std::string& sql,
                                   const std::optional<std::string>& database,
                                   const std::vector<QueryParam>& params) const {
    utils::Timer timer;

    try {
        if (auto failure = prepare(session, profile, database)) {
            return QueryResult::error(failure->code, std::move(failure->message), timer.elapsed_us());
        }

        const DbResultSet rs = run(session, sql, params, profile.max_result_rows);
        if (!rs.success) {
            auto failure = classify_failure(session, rs);
            utils::log::debug(std::format("Server '{}': query failed ({}): {}",
                profile.name, error_code_to_string(failure.code), failure.message));
            return QueryResult::error(failure.code, std::move(failure.message), timer.elapsed_us());
        }

        if (rs.truncated) {
            return QueryResult::error(ErrorCode::RESULT_TOO_LARGE,
                std::format("Result exceeds max_result_rows ({})", profile.max_result_rows),
                timer.elapsed_us());
        }

        return QueryResult::ok(to_query_data(rs), timer.elapsed_us());

    } catch (const std::exception& e) {
        utils::log::error(std::format("Server '{}': query execution threw: {}", profile.name, e.what()));
        return QueryResult::error(ErrorCode::INTERNAL_ERROR,
            std::format("Internal error: {}", e.what()), timer.elapsed_us());
    }
}

BatchResult QueryExecutor::execute_batch(Session& session,
                                         const ServerProfile& profile,
                                         const std::vector<SqlStatement>& statements,
                                         const std::optional<std::string>& database) const {
    utils::Timer timer;
    BatchResult result;

    auto fail = [&](ErrorCode code, std::string message) {
        result.success = false;
        result.results.clear();
        result.error_code = code;
        result.error_message = std::move(message);
        result.execution_time = timer.elapsed_us();
        return result;
    };

    auto rollback = [&]() {
        if (!session->is_connected()) {
            return;
        }
        const DbResultSet rs = session->execute(session.backend().rollback_sql());
        if (!rs.success) {
            utils::log::warn(std::format("Server '{}': rollback failed: {}",
                profile.name, utils::trim(rs.error_message)));
            session.mark_suspect();
        }
    };

    try {
        if (auto failure = prepare(session, profile, database)) {
            return fail(failure->code, "Transaction failed: " + failure->message);
        }

        const DbResultSet begin = session->execute(session.backend().begin_transaction_sql());
        if (!begin.success) {
            auto failure = classify_failure(session, begin);
            return fail(failure.code, "Transaction failed: " + failure.message);
        }

        result.results.reserve(statements.size());
        for (size_t i = 0; i < statements.size(); ++i) {
            const DbResultSet rs = run(session, statements[i].sql, statements[i].params,
                                       profile.max_result_rows);

            std::optional<Failure> failure;
            if (!rs.success) {
                failure = classify_failure(session, rs);
            } else if (rs.truncated) {
                failure = Failure{ErrorCode::RESULT_TOO_LARGE,
                    std::format("Result exceeds max_result_rows ({})", profile.max_result_rows)};
            }

            if (failure) {
                rollback();
                utils::log::debug(std::format("Server '{}': batch rolled back at statement {}",
                    profile.name, i + 1));
                return fail(failure->code, std::format("Transaction failed: statement {}: {}",
                    i + 1, failure->message));
            }
            result.results.push_back(to_query_data(rs));
        }

        const DbResultSet commit = session->execute(session.backend().commit_sql());
        if (!commit.success) {
            auto failure = classify_failure(session, commit);
            rollback();
            return fail(failure.code, "Transaction failed: commit: " + failure.message);
        }

        result.success = true;
        result.execution_time = timer.elapsed_us();
        return result;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Server '{}': batch execution threw: {}", profile.name, e.what()));
        session.mark_suspect();
        return fail(ErrorCode::INTERNAL_ERROR, std::format("Internal error: {}", e.what()));
    }
}

DatabaseList QueryExecutor::list_databases(Session& session, const ServerProfile& profile) const {
    utils::Timer timer;
    DatabaseList list;

    try {
        if (auto failure = prepare(session, profile, std::nullopt)) {
            list.error_code = failure->code;
            list.error_message = std::move(failure->message);
            list.execution_time = timer.elapsed_us();
            return list;
        }

        const DbResultSet rs = session->execute(session.backend().list_databases_sql());
        if (!rs.success) {
            auto failure = classify_failure(session, rs);
            list.error_code = failure.code;
            list.error_message = std::move(failure.message);
        } else {
            list.success = true;
            list.databases.reserve(rs.rows.size());
            for (const auto& row : rs.rows) {
                if (!row.empty() && row[0]) {
                    list.databases.push_back(*row[0]);
                }
            }
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Server '{}': listing databases threw: {}", profile.name, e.what()));
        list.success = false;
        list.error_code = ErrorCode::INTERNAL_ERROR;
        list.error_message = std::format("Internal error: {}", e.what());
    }

    list.execution_time = timer.elapsed_us();
    return list;
}

} // namespace sqlgateway
