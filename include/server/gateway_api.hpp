#pragma once

#include "db/connection_manager.hpp"
#include "db/profile_registry.hpp"
#include "executor/query_executor.hpp"
#include "server/server_types.hpp"
#include "server/shutdown_coordinator.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace sqlgateway {

/**
 * @brief Request handling for every endpoint, independent of the HTTP library
 *
 * Each request runs Authenticate → Resolve → PermissionCheck → Execute →
 * Normalize → Respond. A failing stage answers immediately with the error
 * envelope; nothing after it runs. Authentication and profile resolution
 * happen before any backend is touched.
 *
 * Status codes: 200 once the request reached a database (backend errors
 * are in-band and carry execution_ms), 400 for malformed requests, 401 for
 * authentication, 403 for READ-ONLY denials, 404 for unknown servers, 503
 * when no session can be had or shutdown is in progress, 500 for faults.
 *
 * Thread-safety: handlers may run concurrently. The API key and request
 * limits are hot-swappable.
 */
class GatewayApi {
public:
    struct Options {
        size_t max_sql_length = 1024 * 1024;
        size_t max_batch_size = 100;
        bool require_auth_for_health = false;
    };

    GatewayApi(std::shared_ptr<ProfileRegistry> registry,
               std::shared_ptr<ConnectionManager> connections,
               std::string api_key,
               Options options,
               std::shared_ptr<ShutdownCoordinator> shutdown = nullptr);

    GatewayResponse handle_health(const GatewayRequest& req);
    GatewayResponse handle_servers(const GatewayRequest& req);
    GatewayResponse handle_databases(const GatewayRequest& req);
    GatewayResponse handle_query(const GatewayRequest& req);
    GatewayResponse handle_batch(const GatewayRequest& req);

    /** @brief Replace the API key (config reload) */
    void update_api_key(std::string api_key);

    void update_options(const Options& options);

private:
    /**
     * @brief nullopt when the caller presented the configured key
     */
    [[nodiscard]] std::optional<GatewayResponse> authenticate(const GatewayRequest& req) const;

    /**
     * @brief Parse the body as a JSON object and read an optional string field
     */
    [[nodiscard]] static std::optional<GatewayResponse> read_optional_string(
        const nlohmann::json& body, const char* field, std::optional<std::string>& out);

    [[nodiscard]] static GatewayResponse acquire_failure(const Result<Session>& acquired);

    [[nodiscard]] static nlohmann::ordered_json query_data_json(const QueryData& data);

    [[nodiscard]] static nlohmann::ordered_json database_json(const std::string& database);

    std::shared_ptr<ProfileRegistry> registry_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;
    QueryExecutor executor_;

    std::atomic<std::shared_ptr<const std::string>> api_key_;
    std::atomic<size_t> max_sql_length_;
    std::atomic<size_t> max_batch_size_;
    std::atomic<bool> require_auth_for_health_;
};

} // namespace sqlgateway
