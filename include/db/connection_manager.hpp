#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_backend.hpp"
#include "db/pooled_connection.hpp"
#include "db/profile_registry.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlgateway {

/**
 * @brief Connectivity and health of one profile, for status reporting
 */
struct ConnectionState {
    ServerProfile profile;
    bool connected = false;
    bool healthy = false;
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_check;
    PoolStats pool;
};

struct HealthStatus {
    bool connected = false;
    bool healthy = false;
};

/**
 * @brief Exclusive use of one backend session
 *
 * Returns the session to its profile's slot set on destruction. Holds the
 * slot set and backend alive for as long as the session exists, so a
 * reload that retires the profile cannot pull the pool out from under it.
 */
class Session {
public:
    Session(std::shared_ptr<IConnectionPool> pool,
            std::shared_ptr<IDbBackend> backend,
            std::unique_ptr<PooledConnection> conn);

    Session(Session&&) noexcept = default;
    Session& operator=(Session&& other) noexcept;

    IDbConnection* operator->() const { return conn_->get(); }
    IDbConnection& connection() const { return *conn_->get(); }

    [[nodiscard]] const IDbBackend& backend() const { return *backend_; }

    /** @brief Validate before reuse (timeouts, lost connections) */
    void mark_suspect() { conn_->mark_suspect(); }
    [[nodiscard]] bool is_suspect() const { return conn_->is_suspect(); }

private:
    // Declared before conn_ so they are destroyed after it
    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<IDbBackend> backend_;
    std::unique_ptr<PooledConnection> conn_;
};

/**
 * @brief Owns per-profile session slot sets and health-check connections
 *
 * Each profile gets its own bounded GenericConnectionPool (max_sessions
 * slots, max_queue_depth waiters) created lazily on first use, plus a
 * dedicated connection used only by health checks. The name → slot
 * map is an immutable snapshot, so requests for different profiles share
 * no lock.
 */
class ConnectionManager {
public:
    explicit ConnectionManager(std::shared_ptr<ProfileRegistry> registry);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Acquire a session for the profile
     *
     * Waits up to profile.acquire_timeout for a free slot. Fails with
     * CONNECTION_ERROR (profile name + upstream cause) when a session cannot
     * be opened, or POOL_EXHAUSTED when the queue is full or the wait timed out.
     */
    [[nodiscard]] Result<Session> acquire(const ServerProfile& profile);

    /**
     * @brief Check the profile on its dedicated health-check connection
     */
    HealthStatus health_check(const std::string& name);

    [[nodiscard]] std::optional<ConnectionState> status(const std::string& name) const;

    /** @brief Status of every profile, in registry order */
    [[nodiscard]] std::vector<ConnectionState> all_status() const;

    /**
     * @brief Health-check every profile once; failures are logged only
     */
    void warm_up();

    /**
     * @brief Reconcile slot sets with the registry's current snapshot
     *
     * Unchanged profiles keep their sessions; removed or changed ones are
     * drained; new ones are created.
     */
    void reload();

    /** @brief Drain every slot set and close every health-check connection */
    void close_all();

    /** @brief Names currently managed, in registry order */
    [[nodiscard]] std::vector<std::string> profile_names() const;

private:
    struct ProfileSlot {
        ServerProfile profile;
        std::shared_ptr<IDbBackend> backend;
        std::shared_ptr<IConnectionFactory> factory;
        std::shared_ptr<IConnectionPool> pool;
        std::string setup_error;        // Set when no backend is registered for the type

        // Used only by health_check()
        std::mutex health_mutex;
        std::unique_ptr<IDbConnection> health_conn;

        mutable std::mutex state_mutex;
        bool connected = false;
        bool healthy = false;
        std::string last_error;
        std::optional<std::chrono::system_clock::time_point> last_check;
    };

    struct SlotMap {
        std::vector<std::shared_ptr<ProfileSlot>> ordered;
        std::unordered_map<std::string, std::shared_ptr<ProfileSlot>> by_name;
    };

    static std::shared_ptr<ProfileSlot> build_slot(const ServerProfile& profile);
    static void retire_slot(ProfileSlot& slot);
    static void record_state(ProfileSlot& slot, bool connected, bool healthy, std::string error);

    [[nodiscard]] std::shared_ptr<ProfileSlot> find_slot(const std::string& name) const;

    std::shared_ptr<ProfileRegistry> registry_;
    std::atomic<std::shared_ptr<const SlotMap>> slots_;
    std::mutex reload_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace sqlgateway
