#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/connection_manager.hpp"
#include "db/health_monitor.hpp"
#include "db/profile_registry.hpp"
#include "server/gateway_api.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif
#ifdef ENABLE_MSSQL
#include "db/mssql/mssql_backend.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <thread>

using namespace sqlgateway;

namespace {

// Set by the signal handler, consumed by the shutdown thread
std::atomic<int> g_pending_signal{0};

// =========================================================================
// Explicit Backend Registration (ensures linker includes backend objects)
// =========================================================================

void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif

    #ifdef ENABLE_MSSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MSSQL,
        [] { return std::make_unique<MssqlBackend>(); });
    #endif
}

void signal_handler(int signal) {
    g_pending_signal.store(signal);
}

GatewayApi::Options api_options(const GatewayConfig& config) {
    GatewayApi::Options options;
    options.max_sql_length = config.server.max_sql_length;
    options.max_batch_size = config.server.max_batch_size;
    options.require_auth_for_health = config.auth.require_for_health;
    return options;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("SQL Gateway starting...");

        std::string config_file = "config/gateway.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/7] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const GatewayConfig config = std::move(loaded.config);

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/7] Backends
        // =====================================================================
        register_backends();
        std::string backends;
        for (const auto type : {DatabaseType::POSTGRESQL, DatabaseType::MYSQL, DatabaseType::MSSQL}) {
            if (BackendRegistry::instance().has_backend(type)) {
                if (!backends.empty()) backends += ", ";
                backends += database_type_to_string(type);
            }
        }
        utils::log::info(std::format("[2/7] Database backends: {}", backends.empty() ? "(none)" : backends));

        // =====================================================================
        // [3/7] Server profiles & connection manager
        // =====================================================================
        auto registry = std::make_shared<ProfileRegistry>(config.servers, config.gateway.default_server);
        auto connections = std::make_shared<ConnectionManager>(registry);
        const auto default_name = registry->default_name();
        utils::log::info(std::format("[3/7] Server profiles: {} (default: {})",
            registry->size(), default_name.value_or("none")));

        // =====================================================================
        // [4/7] Gateway API & HTTP server
        // =====================================================================
        auto shutdown = std::make_shared<ShutdownCoordinator>(ShutdownCoordinator::Config{
            std::chrono::milliseconds{config.server.shutdown_timeout_ms}});
        auto api = std::make_shared<GatewayApi>(registry, connections, config.auth.api_key,
                                                api_options(config), shutdown);
        auto server = std::make_shared<HttpServer>(api, config.server.host, config.server.port,
                                                   config.server.thread_pool_size, config.server.tls);
        utils::log::info(std::format("[4/7] Gateway API ready (max_sql_length={}, max_batch_size={})",
            config.server.max_sql_length, config.server.max_batch_size));

        // =====================================================================
        // [5/7] Warm-up
        // =====================================================================
        if (config.gateway.warm_up) {
            utils::log::info("[5/7] Warming up server profiles...");
            connections->warm_up();
        } else {
            utils::log::info("[5/7] Warm-up: disabled");
        }

        // =====================================================================
        // [6/7] Health monitor
        // =====================================================================
        HealthMonitor monitor(connections, std::chrono::seconds{config.gateway.health_check_interval_seconds});
        monitor.start();
        utils::log::info(config.gateway.health_check_interval_seconds > 0
            ? std::format("[6/7] Health monitor: every {}s", config.gateway.health_check_interval_seconds)
            : std::string("[6/7] Health monitor: disabled"));

        // =====================================================================
        // [7/7] Config watcher - hot-reload servers, API key, request limits
        // =====================================================================
        std::unique_ptr<ConfigWatcher> watcher;
        if (config.config_watcher.enabled) {
            watcher = std::make_unique<ConfigWatcher>(
                config_file, std::chrono::seconds{config.config_watcher.poll_interval_seconds});
            watcher->set_callback([registry, connections, api](const GatewayConfig& new_cfg) {
                registry->reload(new_cfg.servers, new_cfg.gateway.default_server);
                connections->reload();
                api->update_api_key(new_cfg.auth.api_key);
                api->update_options(api_options(new_cfg));
                if (const auto level = utils::log::parse_level(new_cfg.logging.level)) {
                    utils::log::set_level(*level);
                }
            });
            watcher->start();
            utils::log::info(std::format("[7/7] Config watcher: polling every {}s",
                config.config_watcher.poll_interval_seconds));
        } else {
            utils::log::info("[7/7] Config watcher: disabled");
        }

        // =====================================================================
        // Signal handling: drain, then stop the listener
        // =====================================================================
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::jthread shutdown_thread([&](std::stop_token stop) {
            while (!stop.stop_requested() && g_pending_signal.load() == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds{100});
            }
            if (stop.stop_requested()) return;

            utils::log::info(std::format("Received signal {}, shutting down...", g_pending_signal.load()));
            shutdown->initiate_shutdown();
            if (watcher) watcher->stop();
            monitor.stop();

            if (shutdown->wait_for_drain()) {
                utils::log::info("All in-flight requests drained");
            } else {
                utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                    shutdown->in_flight_count()));
            }
            server->stop();
        });

        // Blocks until server->stop()
        server->start();

        shutdown_thread.request_stop();
        shutdown_thread.join();
        if (watcher) watcher->stop();
        monitor.stop();
        connections->close_all();
        utils::log::info("SQL Gateway stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
