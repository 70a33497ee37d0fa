#pragma once

#include "config/config_types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlgateway {

class GatewayApi;

/**
 * @brief cpp-httplib binding for the GatewayApi
 *
 * Translates httplib requests into GatewayRequest, serializes the
 * GatewayResponse envelope, and turns any escaped exception into a 500.
 * Serves HTTPS when TLS is configured (mTLS when require_client_cert).
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<GatewayApi> api,
               std::string host,
               int port,
               size_t thread_pool_size,
               TlsConfig tls_config = {});

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Register routes and listen; blocks until stop()
     * @throws std::runtime_error if the socket cannot be bound
     */
    void start();

    /** @brief Stop listening; safe to call from another thread */
    void stop();

private:
    void register_routes(httplib::Server& svr);

    std::shared_ptr<GatewayApi> api_;
    const std::string host_;
    const int port_;
    const size_t thread_pool_size_;
    const TlsConfig tls_config_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace sqlgateway
