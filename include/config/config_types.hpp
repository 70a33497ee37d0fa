#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlgateway {

// ============================================================================
// Configuration Types
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
    std::string ca_file;              // CA cert for client verification (mTLS)
    bool require_client_cert = false; // mTLS mode
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    size_t thread_pool_size = 8;
    size_t max_sql_length = 1024 * 1024;   // 1 MiB
    size_t max_batch_size = 100;
    uint32_t shutdown_timeout_ms = 30000;
    TlsConfig tls;
};

struct AuthConfig {
    std::string api_key;              // Falls back to env API_TOKEN
    bool require_for_health = false;
};

struct LoggingConfig {
    std::string level = "info";
};

struct GatewaySettings {
    std::string default_server;       // Empty = env DB_PROFILE, then first server
    int health_check_interval_seconds = 30;  // 0 disables the monitor
    bool warm_up = true;
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    ServerConfig server;
    AuthConfig auth;
    LoggingConfig logging;
    GatewaySettings gateway;
    ConfigWatcherConfig config_watcher;
    std::vector<ServerProfile> servers;   // File profiles first, then env profiles
};

} // namespace sqlgateway
