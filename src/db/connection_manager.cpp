#include "db/connection_manager.hpp"
#include "db/backend_registry.hpp"
#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgateway {

// ============================================================================
// Session
// ============================================================================

Session::Session(std::shared_ptr<IConnectionPool> pool,
                 std::shared_ptr<IDbBackend> backend,
                 std::unique_ptr<PooledConnection> conn)
    : pool_(std::move(pool)),
      backend_(std::move(backend)),
      conn_(std::move(conn)) {}

Session& Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        // Return the current session while its pool is still held
        conn_.reset();
        pool_ = std::move(other.pool_);
        backend_ = std::move(other.backend_);
        conn_ = std::move(other.conn_);
    }
    return *this;
}

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(std::shared_ptr<ProfileRegistry> registry)
    : registry_(std::move(registry)),
      slots_(std::make_shared<SlotMap>()) {
    reload();
}

ConnectionManager::~ConnectionManager() {
    close_all();
}

std::shared_ptr<ConnectionManager::ProfileSlot> ConnectionManager::build_slot(
    const ServerProfile& profile) {

    auto slot = std::make_shared<ProfileSlot>();
    slot->profile = profile;

    if (!BackendRegistry::instance().has_backend(profile.type)) {
        slot->setup_error = std::format("No backend registered for database type: {}",
            database_type_to_string(profile.type));
        slot->last_error = slot->setup_error;
        utils::log::error(std::format("Server '{}': {}", profile.name, slot->setup_error));
        return slot;
    }

    slot->backend = BackendRegistry::instance().create(profile.type);
    slot->factory = slot->backend->create_connection_factory();

    PoolConfig config;
    config.min_connections = 0;
    config.max_connections = profile.max_sessions;
    config.max_waiters = profile.max_queue_depth;
    config.idle_timeout = profile.idle_timeout;
    config.health_check_query = profile.health_check_query;
    slot->pool = std::make_shared<GenericConnectionPool>(profile, config, slot->factory);

    return slot;
}

void ConnectionManager::retire_slot(ProfileSlot& slot) {
    if (slot.pool) {
        slot.pool->drain();
    }
    std::lock_guard lock(slot.health_mutex);
    if (slot.health_conn) {
        slot.health_conn->close();
        slot.health_conn.reset();
    }
}

void ConnectionManager::record_state(ProfileSlot& slot, bool connected, bool healthy,
                                     std::string error) {
    bool was_healthy;
    bool checked_before;
    {
        std::lock_guard lock(slot.state_mutex);
        was_healthy = slot.healthy;
        checked_before = slot.last_check.has_value();
        slot.connected = connected;
        slot.healthy = healthy;
        slot.last_error = std::move(error);
        slot.last_check = utils::now();
    }

    if (was_healthy && !healthy) {
        utils::log::warn(std::format("Server '{}' became unhealthy", slot.profile.name));
    } else if (!was_healthy && healthy && checked_before) {
        utils::log::info(std::format("Server '{}' is healthy again", slot.profile.name));
    }
}

std::shared_ptr<ConnectionManager::ProfileSlot> ConnectionManager::find_slot(
    const std::string& name) const {
    const auto map = std::atomic_load_explicit(&slots_, std::memory_order_acquire);
    const auto it = map->by_name.find(utils::to_upper(name));
    return it != map->by_name.end() ? it->second : nullptr;
}

Result<Session> ConnectionManager::acquire(const ServerProfile& profile) {
    auto slot = find_slot(profile.name);
    if (!slot) {
        return Result<Session>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Failed to connect to server '{}': server is not configured", profile.name));
    }
    if (!slot->pool) {
        return Result<Session>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Failed to connect to server '{}': {}", profile.name, slot->setup_error));
    }

    auto acquired = slot->pool->acquire(slot->profile.acquire_timeout);
    if (acquired.is_error()) {
        if (acquired.error_category() == ErrorCategory::POOL_EXHAUSTED) {
            utils::log::warn(std::format("Server '{}' is busy: {}", profile.name,
                acquired.error_message()));
            return Result<Session>::error(ErrorCategory::POOL_EXHAUSTED,
                std::format("Server '{}' is busy: {}", profile.name, acquired.error_message()));
        }
        record_state(*slot, false, false, acquired.error_message());
        utils::log::warn(std::format("Server '{}': acquire failed ({}): {}", profile.name,
            error_category_to_string(acquired.error_category()), acquired.error_message()));
        return Result<Session>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Failed to connect to server '{}': {}", profile.name,
                acquired.error_message()));
    }

    {
        std::lock_guard lock(slot->state_mutex);
        slot->connected = true;
    }

    return Result<Session>::ok(Session(slot->pool, slot->backend, std::move(acquired.value())));
}

HealthStatus ConnectionManager::health_check(const std::string& name) {
    auto slot = find_slot(name);
    if (!slot) {
        return {};
    }
    if (!slot->factory) {
        record_state(*slot, false, false, slot->setup_error);
        return {};
    }

    std::lock_guard health_lock(slot->health_mutex);

    if (!slot->health_conn || !slot->health_conn->is_connected()) {
        slot->health_conn.reset();
        auto created = slot->factory->create(slot->profile, slot->profile.default_database);
        if (created.is_error()) {
            record_state(*slot, false, false, created.error_message());
            return {false, false};
        }
        slot->health_conn = std::move(created.value());
        if (!slot->health_conn->set_query_timeout(
                static_cast<uint32_t>(slot->profile.connect_timeout.count()))) {
            utils::log::debug(std::format("Server '{}': health-check timeout could not be applied",
                slot->profile.name));
        }
    }

    const bool healthy = slot->health_conn->is_healthy(slot->profile.health_check_query);
    const bool connected = slot->health_conn->is_connected();
    if (!healthy) {
        // Reconnect on the next check
        slot->health_conn->close();
        slot->health_conn.reset();
        record_state(*slot, connected, false, "Health check query failed");
        return {connected, false};
    }

    record_state(*slot, true, true, "");
    return {true, true};
}

std::optional<ConnectionState> ConnectionManager::status(const std::string& name) const {
    auto slot = find_slot(name);
    if (!slot) {
        return std::nullopt;
    }

    ConnectionState state;
    state.profile = slot->profile;
    {
        std::lock_guard lock(slot->state_mutex);
        state.connected = slot->connected;
        state.healthy = slot->healthy;
        state.last_error = slot->last_error;
        state.last_check = slot->last_check;
    }
    if (slot->pool) {
        state.pool = slot->pool->get_stats();
    }
    return state;
}

std::vector<ConnectionState> ConnectionManager::all_status() const {
    std::vector<ConnectionState> states;
    for (const auto& name : profile_names()) {
        if (auto state = status(name)) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

std::vector<std::string> ConnectionManager::profile_names() const {
    const auto map = std::atomic_load_explicit(&slots_, std::memory_order_acquire);
    std::vector<std::string> names;
    names.reserve(map->ordered.size());
    for (const auto& slot : map->ordered) {
        names.push_back(slot->profile.name);
    }
    return names;
}

void ConnectionManager::warm_up() {
    for (const auto& name : profile_names()) {
        const HealthStatus health = health_check(name);
        if (health.healthy) {
            utils::log::info(std::format("Server '{}' is reachable", name));
        } else {
            const auto state = status(name);
            utils::log::warn(std::format("Server '{}' is not reachable at startup: {}",
                name, state ? state->last_error : std::string("unknown")));
        }
    }
}

void ConnectionManager::reload() {
    std::lock_guard lock(reload_mutex_);

    const auto old_map = std::atomic_load_explicit(&slots_, std::memory_order_acquire);
    auto new_map = std::make_shared<SlotMap>();

    size_t kept = 0;
    for (const auto& profile : registry_->list()) {
        std::shared_ptr<ProfileSlot> slot;
        const auto it = old_map->by_name.find(profile.name);
        if (it != old_map->by_name.end() && it->second->profile == profile) {
            slot = it->second;
            ++kept;
        } else {
            slot = build_slot(profile);
        }
        new_map->ordered.push_back(slot);
        new_map->by_name[profile.name] = slot;
    }

    std::atomic_store_explicit(&slots_, std::shared_ptr<const SlotMap>(new_map),
                               std::memory_order_release);

    // Retire slot sets that are no longer published
    size_t retired = 0;
    for (const auto& slot : old_map->ordered) {
        const auto it = new_map->by_name.find(slot->profile.name);
        if (it == new_map->by_name.end() || it->second != slot) {
            retire_slot(*slot);
            ++retired;
        }
    }

    utils::log::debug(std::format("Connection manager reconciled: {} kept, {} new, {} retired",
        kept, new_map->ordered.size() - kept, retired));
}

void ConnectionManager::close_all() {
    if (closed_.exchange(true)) {
        return;
    }
    const auto map = std::atomic_load_explicit(&slots_, std::memory_order_acquire);
    for (const auto& slot : map->ordered) {
        retire_slot(*slot);
    }
    utils::log::info("All backend sessions closed");
}

} // namespace sqlgateway
