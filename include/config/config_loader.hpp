#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sqlgateway {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads gateway.toml into a GatewayConfig
 *
 * - ${VAR} environment expansion in every string value
 * - include = "file.toml" / include = [...] merging (main file wins,
 *   arrays concatenated, depth limited to 10, circular includes rejected)
 * - DATABASE_PROFILES_<NAME>_* environment profiles appended after the
 *   [[servers]] entries
 * - Full validation; every problem is reported, not just the first
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gateway.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a parsed config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

    /**
     * @brief Build profiles from DATABASE_PROFILES_<NAME>_SERVER style variables
     * @param environment "KEY=VALUE" entries
     * @return Profiles sorted by name
     */
    [[nodiscard]] static std::vector<ServerProfile> extract_env_profiles(
        const std::vector<std::string>& environment);

    /** @brief The process environment as "KEY=VALUE" entries */
    [[nodiscard]] static std::vector<std::string> process_environment();

private:
    static ServerConfig extract_server(const toml::table& root);
    static AuthConfig extract_auth(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static GatewaySettings extract_gateway(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static std::vector<ServerProfile> extract_servers(const toml::table& root,
                                                      std::vector<std::string>& errors);

    static GatewayConfig extract_all_sections(const toml::table& tbl,
                                              std::vector<std::string>& errors);
    static LoadResult validate_and_return(GatewayConfig config, std::vector<std::string> errors);
};

} // namespace sqlgateway
