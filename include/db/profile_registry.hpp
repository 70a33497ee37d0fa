#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sqlgateway {

/**
 * @brief Catalog of named server profiles
 *
 * Readers load an immutable snapshot; reload() builds a new snapshot
 * offline and swaps it in, so a request never sees a half-updated set.
 * Profile names are stored uppercase and matched case-insensitively.
 */
class ProfileRegistry {
public:
    struct Snapshot {
        std::vector<ServerProfile> profiles;        // Configuration order
        std::optional<std::string> default_name;   // Effective default, uppercase
    };

    ProfileRegistry();

    /**
     * @param profiles Profiles in configuration order
     * @param default_server Configured default (empty = fall back to env DB_PROFILE, then first)
     */
    ProfileRegistry(std::vector<ServerProfile> profiles, const std::string& default_server);

    /**
     * @brief Resolve a profile by name, or the default when name is empty
     * @return Profile copy, or PROFILE_NOT_FOUND
     */
    [[nodiscard]] Result<ServerProfile> resolve(const std::optional<std::string>& name) const;

    [[nodiscard]] std::vector<ServerProfile> list() const;

    [[nodiscard]] std::optional<std::string> default_name() const;

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Atomically replace the whole catalog
     */
    void reload(std::vector<ServerProfile> profiles, const std::string& default_server);

private:
    static std::shared_ptr<const Snapshot> build_snapshot(
        std::vector<ServerProfile> profiles, const std::string& default_server);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;

    // Single writer
    std::mutex reload_mutex_;
};

} // namespace sqlgateway
