#include "server/http_server.hpp"
#include "server/gateway_api.hpp"
#include "server/http_constants.hpp"
#include "executor/result_normalizer.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace sqlgateway {

namespace {

GatewayRequest to_gateway_request(const httplib::Request& req) {
    GatewayRequest out;
    out.body = req.body;
    if (req.has_header(http::kApiKeyHeader)) {
        out.api_key = req.get_header_value(http::kApiKeyHeader);
    }
    if (req.has_header(http::kAuthorizationHeader)) {
        out.authorization = req.get_header_value(http::kAuthorizationHeader);
    }
    for (const auto& [key, value] : req.params) {
        out.params.emplace(key, value);
    }
    return out;
}

void write_response(const GatewayResponse& response, httplib::Response& res) {
    res.status = response.status;
    res.set_content(ResultNormalizer::serialize(response.body), http::kJsonContentType);
}

void write_internal_error(httplib::Response& res) {
    res.status = httplib::StatusCode::InternalServerError_500;
    res.set_content(R"({"success":false,"error":"Internal server error"})", http::kJsonContentType);
}

/**
 * @brief Wrap a GatewayApi handler: translate, run, serialize, contain faults
 */
template<typename Handler>
auto wrap_handler(std::shared_ptr<GatewayApi> api, Handler handler) {
    return [api = std::move(api), handler](const httplib::Request& req, httplib::Response& res) {
        try {
            write_response(((*api).*handler)(to_gateway_request(req)), res);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, e.what()));
            write_internal_error(res);
        }
    };
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<GatewayApi> api,
                       std::string host,
                       int port,
                       size_t thread_pool_size,
                       TlsConfig tls_config)
    : api_(std::move(api)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size),
      tls_config_(std::move(tls_config)) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (tls_config_.enabled) {
        const char* ca_cert_path = (tls_config_.require_client_cert && !tls_config_.ca_file.empty())
            ? tls_config_.ca_file.c_str() : nullptr;
        auto ssl_svr = std::make_unique<httplib::SSLServer>(
            tls_config_.cert_file.c_str(), tls_config_.key_file.c_str(), ca_cert_path);
        if (!ssl_svr->is_valid()) {
            throw std::runtime_error(std::format("Failed to load TLS certificate/key ({}, {})",
                tls_config_.cert_file, tls_config_.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}, mTLS={}",
            tls_config_.cert_file, tls_config_.key_file,
            tls_config_.require_client_cert ? "required" : "off"));
        svr_ptr = std::move(ssl_svr);
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    auto& svr = *svr_ptr;

    const size_t pool_size = thread_pool_size_;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    {
        std::lock_guard lock(server_mutex_);
        if (stop_requested_.load()) {
            return;
        }
        server_ = std::move(svr_ptr);
    }

    utils::log::info(std::format("Starting SQL Gateway on {}:{} ({}, {} threads)",
        host_, port_, tls_config_.enabled ? "HTTPS" : "HTTP", thread_pool_size_));

    if (!svr.listen(host_.c_str(), port_) && !stop_requested_.load()) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    stop_requested_.store(true);
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
        utils::log::info("HTTP server stopped");
    }
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get(http::kHealthRoute, wrap_handler(api_, &GatewayApi::handle_health));
    svr.Get(http::kServersRoute, wrap_handler(api_, &GatewayApi::handle_servers));
    svr.Get(http::kDatabasesRoute, wrap_handler(api_, &GatewayApi::handle_databases));
    svr.Post(http::kQueryRoute, wrap_handler(api_, &GatewayApi::handle_query));
    svr.Post(http::kBatchRoute, wrap_handler(api_, &GatewayApi::handle_batch));

    // Unmatched routes and anything else httplib answers without a handler
    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return;     // Envelope already written by a handler
        }
        if (res.status == httplib::StatusCode::NotFound_404) {
            res.set_content(R"({"success":false,"error":"Not found"})", http::kJsonContentType);
        } else {
            res.set_content(std::format(R"({{"success":false,"error":"HTTP {}"}})", res.status),
                http::kJsonContentType);
        }
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, e.what()));
        } catch (...) {
            utils::log::error(std::format("Unhandled non-standard exception on {} {}", req.method, req.path));
        }
        write_internal_error(res);
    });
}

} // namespace sqlgateway
