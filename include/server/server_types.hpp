#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sqlgateway {

// ============================================================================
// Request/Response Types
// ============================================================================

/**
 * @brief Transport-independent view of one HTTP request
 */
struct GatewayRequest {
    std::string body;
    std::optional<std::string> api_key;          // x-api-key header
    std::optional<std::string> authorization;    // Authorization header
    std::map<std::string, std::string> params;   // Query-string parameters

    [[nodiscard]] std::optional<std::string> param(const std::string& name) const {
        const auto it = params.find(name);
        if (it == params.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Status code plus JSON envelope
 */
struct GatewayResponse {
    int status = 200;
    nlohmann::ordered_json body;

    static GatewayResponse error(int status, std::string message) {
        GatewayResponse r;
        r.status = status;
        r.body = nlohmann::ordered_json{{"success", false}, {"error", std::move(message)}};
        return r;
    }
};

} // namespace sqlgateway
