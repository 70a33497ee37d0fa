#pragma once

#include <string>
#include <string_view>

namespace sqlgateway::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kApiKeyHeader = "x-api-key";
inline constexpr const char* kJsonContentType = "application/json";

// Routes
inline constexpr const char* kHealthRoute = "/health";
inline constexpr const char* kServersRoute = "/v1/servers";
inline constexpr const char* kDatabasesRoute = "/v1/databases";
inline constexpr const char* kQueryRoute = "/v1/query";
inline constexpr const char* kBatchRoute = "/v1/query/batch";

} // namespace sqlgateway::http
