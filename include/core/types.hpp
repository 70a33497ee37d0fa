#pragma once

#include "core/database_type.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlgateway {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Read/write class of a SQL batch, as decided by the permission enforcer
 */
enum class StatementClass {
    READ,
    WRITE
};

[[nodiscard]] inline const char* statement_class_to_string(StatementClass c) {
    return c == StatementClass::READ ? "READ" : "WRITE";
}

enum class ErrorCode {
    NONE,
    AUTH_ERROR,
    PROFILE_NOT_FOUND,
    ACCESS_DENIED,
    CONNECTION_ERROR,
    DATABASE_ERROR,
    QUERY_TIMEOUT,
    RESULT_TOO_LARGE,
    INVALID_REQUEST,
    SHUTTING_DOWN,
    INTERNAL_ERROR
};

// ============================================================================
// Server Profile
// ============================================================================

/**
 * @brief A named, pre-configured backend connection target
 *
 * Immutable once published by the ProfileRegistry. `name` is stored
 * uppercase; lookups are case-insensitive.
 */
struct ServerProfile {
    std::string name;
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string host;
    uint16_t port = 0;
    std::string user;
    std::string password;
    std::string default_database;       // Empty = the login's own default
    bool read_only = false;
    std::map<std::string, std::string> options;  // Backend extras (encrypt, odbc_driver, sslmode...)

    // Session settings
    size_t max_sessions = 1;
    size_t max_queue_depth = 64;
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds acquire_timeout{10000};
    std::chrono::milliseconds query_timeout{30000};
    std::chrono::milliseconds idle_timeout{60000};
    size_t max_result_rows = 0;          // 0 = unlimited
    std::string health_check_query{"SELECT 1"};

    bool operator==(const ServerProfile&) const = default;
};

// ============================================================================
// Normalized results
// ============================================================================

/**
 * @brief One normalized cell: null, bool, integer, floating point or text
 */
using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

// ============================================================================
// Bound parameters
// ============================================================================

/**
 * @brief One bound parameter value; `name` is empty for positional parameters
 */
struct QueryParam {
    std::string name;
    CellValue value;

    bool operator==(const QueryParam&) const = default;
};

/**
 * @brief A SQL statement and the parameters bound to its placeholders
 */
struct SqlStatement {
    std::string sql;
    std::vector<QueryParam> params;
};

/**
 * @brief Text form of a parameter for text-protocol binding
 * @return std::nullopt for NULL
 */
[[nodiscard]] inline std::optional<std::string> param_text(const CellValue& value) {
    return std::visit([](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::format("{}", v);
        }
    }, value);
}

/**
 * @brief Ordered rows sharing one ordered column list
 */
struct Recordset {
    std::vector<std::string> columns;
    std::vector<std::vector<CellValue>> rows;

    bool operator==(const Recordset&) const = default;
};

/**
 * @brief Payload of a statement that reached the backend and succeeded
 */
struct QueryData {
    Recordset recordset;
    uint64_t rows_affected = 0;
    bool has_rows = false;
};

/**
 * @brief Outcome of one execution: success xor error, always timed
 *
 * Constructed only through ok()/error() so a result can never carry
 * both data and an error message.
 */
class QueryResult {
public:
    static QueryResult ok(QueryData data, std::chrono::microseconds execution_time) {
        QueryResult r;
        r.data_ = std::move(data);
        r.execution_time_ = execution_time;
        return r;
    }

    static QueryResult error(ErrorCode code, std::string message,
                             std::chrono::microseconds execution_time) {
        QueryResult r;
        r.error_code_ = code;
        r.error_message_ = message.empty() ? std::string("Unknown error") : std::move(message);
        r.execution_time_ = execution_time;
        return r;
    }

    [[nodiscard]] bool success() const { return data_.has_value(); }
    [[nodiscard]] const QueryData& data() const { return *data_; }
    [[nodiscard]] ErrorCode error_code() const { return error_code_; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }
    [[nodiscard]] std::chrono::microseconds execution_time() const { return execution_time_; }

    /// Wall-clock milliseconds, rounded to nearest
    [[nodiscard]] int64_t execution_ms() const {
        return (execution_time_.count() + 500) / 1000;
    }

private:
    QueryResult() = default;

    std::optional<QueryData> data_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
    std::chrono::microseconds execution_time_{0};
};

/**
 * @brief Outcome of a transactional batch
 */
struct BatchResult {
    bool success = false;
    std::vector<QueryData> results;     // Filled only on commit
    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] int64_t execution_ms() const {
        return (execution_time.count() + 500) / 1000;
    }
};

// ============================================================================
// Helper Functions
// ============================================================================

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
        case ErrorCode::PROFILE_NOT_FOUND: return "PROFILE_NOT_FOUND";
        case ErrorCode::ACCESS_DENIED: return "ACCESS_DENIED";
        case ErrorCode::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCode::DATABASE_ERROR: return "DATABASE_ERROR";
        case ErrorCode::QUERY_TIMEOUT: return "QUERY_TIMEOUT";
        case ErrorCode::RESULT_TOO_LARGE: return "RESULT_TOO_LARGE";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace sqlgateway
