#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlgateway {

/**
 * @brief Error categories for the gateway
 */
enum class ErrorCategory {
    NONE,
    PROFILE_NOT_FOUND,
    CONNECTION_ERROR,
    POOL_EXHAUSTED,
    EXECUTION_ERROR,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value or an error, never both.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    Result() = default;

    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::PROFILE_NOT_FOUND: return "PROFILE_NOT_FOUND";
        case ErrorCategory::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCategory::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
        case ErrorCategory::EXECUTION_ERROR: return "EXECUTION_ERROR";
        case ErrorCategory::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace sqlgateway
