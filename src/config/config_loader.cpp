#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <algorithm>
#include <limits>
#include <map>
#include <unordered_set>

extern char** environ;

using namespace std::string_literals;

namespace sqlgateway {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/**
 * @brief Read an integer key, reporting values outside [lo, hi]
 */
int64_t read_int(const toml::table& tbl, const std::string_view key, const int64_t default_val,
                 const int64_t lo, const int64_t hi, const std::string& path,
                 std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return default_val;
    const auto v = node.value<int64_t>();
    if (!v) {
        errors.push_back(std::format("{}.{} must be an integer", path, key));
        return default_val;
    }
    if (*v < lo || *v > hi) {
        errors.push_back(std::format("{}.{} must be {}-{}, got {}", path, key, lo, hi, *v));
        return default_val;
    }
    return *v;
}

bool is_truthy(std::string_view value) {
    return utils::iequals(value, "true") || utils::iequals(value, "yes") || value == "1";
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<uint16_t>(std::clamp<int64_t>(s["port"].value_or(int64_t{3000}), 0, 65535));
    cfg.thread_pool_size = static_cast<size_t>(std::max<int64_t>(0, s["threads"].value_or(int64_t{8})));
    cfg.max_sql_length = static_cast<size_t>(
        std::max<int64_t>(0, s["max_sql_length"].value_or(int64_t{1024 * 1024})));
    cfg.max_batch_size = static_cast<size_t>(std::max<int64_t>(0, s["max_batch_size"].value_or(int64_t{100})));
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(
        std::max<int64_t>(0, s["shutdown_timeout_ms"].value_or(int64_t{30000})));

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
        cfg.tls.ca_file = (*tls)["ca_file"].value_or(""s);
        cfg.tls.require_client_cert = (*tls)["require_client_cert"].value_or(false);
    }

    return cfg;
}

AuthConfig ConfigLoader::extract_auth(const toml::table& root) {
    AuthConfig cfg;
    if (const auto* auth = root["auth"].as_table()) {
        cfg.api_key = (*auth)["api_key"].value_or(""s);
        cfg.require_for_health = (*auth)["require_for_health"].value_or(false);
    }
    if (cfg.api_key.empty()) {
        if (const char* token = std::getenv("API_TOKEN"); token && *token) {
            cfg.api_key = token;
        }
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

GatewaySettings ConfigLoader::extract_gateway(const toml::table& root) {
    GatewaySettings cfg;
    const auto* gw = root["gateway"].as_table();
    if (!gw) return cfg;

    cfg.default_server = (*gw)["default_server"].value_or(""s);
    cfg.health_check_interval_seconds = static_cast<int>((*gw)["health_check_interval_seconds"].value_or(int64_t{30}));
    cfg.warm_up = (*gw)["warm_up"].value_or(true);
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(true);
    cfg.poll_interval_seconds = static_cast<int>((*cw)["poll_interval_seconds"].value_or(int64_t{5}));
    return cfg;
}

std::vector<ServerProfile> ConfigLoader::extract_servers(const toml::table& root,
                                                         std::vector<std::string>& errors) {
    std::vector<ServerProfile> result;
    const auto* arr = root["servers"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* srv = (*arr)[i].as_table();
        if (!srv) {
            errors.push_back(std::format("servers[{}] must be a table", i));
            continue;
        }
        const auto& s = *srv;
        const std::string path = std::format("servers[{}]", i);

        ServerProfile p;
        p.name = s["name"].value_or(""s);

        const std::string type_str = s["type"].value_or("postgresql"s);
        if (const auto type = parse_database_type(type_str)) {
            p.type = *type;
        } else {
            errors.push_back(std::format("{}.type '{}' is not one of postgresql, mysql, mssql",
                path, type_str));
        }

        p.host = s["host"].value_or(""s);
        p.port = static_cast<uint16_t>(read_int(s, "port", default_port(p.type), 1, 65535, path, errors));
        p.user = s["user"].value_or(""s);
        p.password = s["password"].value_or(""s);
        p.default_database = s["database"].value_or(""s);
        p.read_only = s["read_only"].value_or(false);

        constexpr int64_t kMax = std::numeric_limits<int32_t>::max();
        p.max_sessions = static_cast<size_t>(read_int(s, "max_sessions", 1, 1, kMax, path, errors));
        p.max_queue_depth = static_cast<size_t>(read_int(s, "max_queue_depth", 64, 1, kMax, path, errors));
        p.connect_timeout = std::chrono::milliseconds(read_int(s, "connect_timeout_ms", 15000, 1, kMax, path, errors));
        p.acquire_timeout = std::chrono::milliseconds(read_int(s, "acquire_timeout_ms", 10000, 1, kMax, path, errors));
        p.query_timeout = std::chrono::milliseconds(read_int(s, "query_timeout_ms", 30000, 1, kMax, path, errors));
        p.idle_timeout = std::chrono::milliseconds(read_int(s, "idle_timeout_ms", 60000, 1, kMax, path, errors));
        p.max_result_rows = static_cast<size_t>(read_int(s, "max_result_rows", 0, 0, kMax, path, errors));
        p.health_check_query = s["health_check_query"].value_or("SELECT 1"s);

        if (const auto* opts = s["options"].as_table()) {
            for (const auto& [key, val] : *opts) {
                if (const auto* str = val.as_string()) {
                    p.options.emplace(std::string(key.str()), str->get());
                } else if (const auto* b = val.as_boolean()) {
                    p.options.emplace(std::string(key.str()), b->get() ? "true" : "false");
                } else if (const auto* n = val.as_integer()) {
                    p.options.emplace(std::string(key.str()), std::to_string(n->get()));
                } else {
                    errors.push_back(std::format("{}.options.{} must be a string, boolean or integer",
                        path, key.str()));
                }
            }
        }

        result.emplace_back(std::move(p));
    }
    return result;
}

// ---- Environment profiles --------------------------------------------------

std::vector<std::string> ConfigLoader::process_environment() {
    std::vector<std::string> entries;
    for (char** env = environ; env && *env; ++env) {
        entries.emplace_back(*env);
    }
    return entries;
}

std::vector<ServerProfile> ConfigLoader::extract_env_profiles(
    const std::vector<std::string>& environment) {

    static constexpr std::string_view kPrefix = "DATABASE_PROFILES_";
    static constexpr std::string_view kServerSuffix = "_SERVER";

    std::map<std::string, std::string> vars;
    for (const auto& entry : environment) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos || !entry.starts_with(kPrefix)) continue;
        vars.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }

    // std::map keeps the profiles sorted by name
    std::vector<ServerProfile> profiles;
    for (const auto& [key, value] : vars) {
        if (!key.ends_with(kServerSuffix) || value.empty()) continue;
        const std::string name = key.substr(kPrefix.size(),
            key.size() - kPrefix.size() - kServerSuffix.size());
        if (name.empty()) continue;

        const std::string prefix = std::format("{}{}_", kPrefix, name);
        auto get = [&](std::string_view suffix) -> std::string {
            const auto it = vars.find(prefix + std::string(suffix));
            return it != vars.end() ? it->second : std::string();
        };

        ServerProfile p;
        p.name = name;
        p.host = value;

        // _DRIVER holds either a backend type or an ODBC driver name
        const std::string driver = get("DRIVER");
        if (const auto type = parse_database_type(driver)) {
            p.type = *type;
        } else {
            p.type = DatabaseType::MSSQL;
            if (!driver.empty()) {
                p.options["odbc_driver"] = driver;
            }
        }

        const std::string port = get("PORT");
        p.port = port.empty() ? default_port(p.type)
                              : utils::parse_int<uint16_t>(port, default_port(p.type));

        const bool mssql = p.type == DatabaseType::MSSQL;
        p.user = get("USERNAME");
        if (p.user.empty() && mssql) p.user = "sa";
        p.password = get("PASSWORD");
        p.default_database = get("DATABASE_NAME");
        if (p.default_database.empty() && mssql) p.default_database = "master";
        p.read_only = get("READ_ONLY") == "true";

        if (const std::string encrypt = get("ENCRYPT"); !encrypt.empty()) {
            p.options["encrypt"] = is_truthy(encrypt) ? "true" : "false";
        }
        if (const std::string trusted = get("TRUSTED_CONNECTION"); !trusted.empty()) {
            p.options["trusted_connection"] = is_truthy(trusted) ? "true" : "false";
        }

        profiles.push_back(std::move(p));
    }
    return profiles;
}

// ---- Shared extraction + validation ----------------------------------------

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl,
                                                 std::vector<std::string>& errors) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.auth = extract_auth(tbl);
    config.logging = extract_logging(tbl);
    config.gateway = extract_gateway(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.servers = extract_servers(tbl, errors);

    // Environment profiles fill in behind the file; a file profile of the same name wins
    for (auto& env_profile : extract_env_profiles(process_environment())) {
        const bool shadowed = std::any_of(config.servers.begin(), config.servers.end(),
            [&](const ServerProfile& p) { return utils::iequals(p.name, env_profile.name); });
        if (!shadowed) {
            config.servers.push_back(std::move(env_profile));
        }
    }
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config,
                                                           std::vector<std::string> errors) {
    auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    if (config.auth.api_key.empty()) {
        utils::log::warn("No API key configured (auth.api_key / API_TOKEN); "
                         "authenticated endpoints will answer 500");
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.max_sql_length == 0) {
        errors.push_back("server.max_sql_length must be > 0");
    }
    if (config.server.max_batch_size == 0) {
        errors.push_back("server.max_batch_size must be > 0");
    }

    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
        if (config.server.tls.require_client_cert && config.server.tls.ca_file.empty()) {
            errors.push_back("server.tls.ca_file required when require_client_cert is true");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.gateway.health_check_interval_seconds < 0) {
        errors.push_back("gateway.health_check_interval_seconds must be >= 0");
    }
    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.servers.size(); ++i) {
        const auto& srv = config.servers[i];
        const std::string label = srv.name.empty() ? std::format("servers[{}]", i)
                                                   : std::format("server '{}'", srv.name);

        if (srv.name.empty()) {
            errors.push_back(std::format("{}.name must not be empty", label));
        } else {
            const bool valid_chars = std::all_of(srv.name.begin(), srv.name.end(), [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
            });
            if (!valid_chars) {
                errors.push_back(std::format("{}: name may only contain letters, digits, '_', '.' and '-'",
                    label));
            }
            if (!seen.insert(utils::to_upper(srv.name)).second) {
                errors.push_back(std::format("{}: duplicate server name", label));
            }
        }

        if (srv.host.empty()) {
            errors.push_back(std::format("{}: host must not be empty", label));
        }
        if (srv.port == 0) {
            errors.push_back(std::format("{}: port must be 1-65535", label));
        }
        if (srv.max_sessions < 1) {
            errors.push_back(std::format("{}: max_sessions must be >= 1", label));
        }
        if (srv.max_queue_depth < 1) {
            errors.push_back(std::format("{}: max_queue_depth must be >= 1", label));
        }
        if (srv.connect_timeout.count() <= 0 || srv.acquire_timeout.count() <= 0 ||
            srv.query_timeout.count() <= 0 || srv.idle_timeout.count() <= 0) {
            errors.push_back(std::format("{}: timeouts must be > 0", label));
        }
    }

    if (!config.gateway.default_server.empty() &&
        !seen.contains(utils::to_upper(config.gateway.default_server))) {
        errors.push_back(std::format("gateway.default_server '{}' does not name a configured server",
            config.gateway.default_server));
    }

    return errors;
}

} // namespace sqlgateway
