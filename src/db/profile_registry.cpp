#include "db/profile_registry.hpp"
#include "core/utils.hpp"
#include <cstdlib>
#include <format>

namespace sqlgateway {

ProfileRegistry::ProfileRegistry()
    : snapshot_(std::make_shared<Snapshot>()) {}

ProfileRegistry::ProfileRegistry(std::vector<ServerProfile> profiles,
                                 const std::string& default_server)
    : snapshot_(build_snapshot(std::move(profiles), default_server)) {}

std::shared_ptr<const ProfileRegistry::Snapshot> ProfileRegistry::build_snapshot(
    std::vector<ServerProfile> profiles, const std::string& default_server) {

    auto snap = std::make_shared<Snapshot>();
    for (auto& profile : profiles) {
        profile.name = utils::to_upper(profile.name);
    }
    snap->profiles = std::move(profiles);

    if (!default_server.empty()) {
        snap->default_name = utils::to_upper(default_server);
    } else if (const char* env = std::getenv("DB_PROFILE"); env && *env) {
        snap->default_name = utils::to_upper(env);
    } else if (!snap->profiles.empty()) {
        snap->default_name = snap->profiles.front().name;
    }

    return snap;
}

Result<ServerProfile> ProfileRegistry::resolve(const std::optional<std::string>& name) const {
    const auto snap = snapshot();

    std::string wanted;
    if (name && !name->empty()) {
        wanted = *name;
    } else if (snap->default_name) {
        wanted = *snap->default_name;
    } else {
        return Result<ServerProfile>::error(ErrorCategory::PROFILE_NOT_FOUND,
            "No server specified and no default server configured");
    }

    for (const auto& profile : snap->profiles) {
        if (utils::iequals(profile.name, wanted)) {
            return Result<ServerProfile>::ok(profile);
        }
    }

    std::string available;
    for (const auto& profile : snap->profiles) {
        if (!available.empty()) available += ", ";
        available += profile.name;
    }

    return Result<ServerProfile>::error(ErrorCategory::PROFILE_NOT_FOUND,
        std::format("Server profile '{}' not found. Available: {}",
            utils::to_upper(wanted), available.empty() ? "(none)" : available));
}

std::vector<ServerProfile> ProfileRegistry::list() const {
    return snapshot()->profiles;
}

std::optional<std::string> ProfileRegistry::default_name() const {
    return snapshot()->default_name;
}

std::shared_ptr<const ProfileRegistry::Snapshot> ProfileRegistry::snapshot() const {
    return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
}

size_t ProfileRegistry::size() const {
    return snapshot()->profiles.size();
}

void ProfileRegistry::reload(std::vector<ServerProfile> profiles,
                             const std::string& default_server) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    auto new_snapshot = build_snapshot(std::move(profiles), default_server);
    utils::log::info(std::format("Server profiles reloaded: {} profile(s), default {}",
        new_snapshot->profiles.size(), new_snapshot->default_name.value_or("(none)")));
    std::atomic_store_explicit(&snapshot_, std::move(new_snapshot), std::memory_order_release);
}

} // namespace sqlgateway
