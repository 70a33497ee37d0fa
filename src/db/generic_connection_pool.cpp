#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgateway {

GenericConnectionPool::GenericConnectionPool(
    ServerProfile profile,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : profile_(std::move(profile)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto created = create_connection();
        if (created.is_ok()) {
            auto conn = std::move(created.value());
            std::lock_guard lock(mutex_);
            const auto now = std::chrono::steady_clock::now();
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to pre-open session {} for server '{}': {}",
                i + 1, profile_.name, created.error_message()));
        }
    }

    utils::log::debug(std::format("Session pool ready for server '{}': {} open (min={}, max={}, max_waiters={})",
        profile_.name, total_connections_.load(), config_.min_connections,
        config_.max_connections, config_.max_waiters));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

Result<std::unique_ptr<PooledConnection>> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    using AcquireResult = Result<std::unique_ptr<PooledConnection>>;

    if (shutdown_.load(std::memory_order_acquire)) {
        return AcquireResult::error(ErrorCategory::POOL_EXHAUSTED,
            "session pool is shut down");
    }

    // Bounded queue: refuse to become waiter number max_waiters + 1
    if (waiting_.fetch_add(1, std::memory_order_acq_rel) >= config_.max_waiters) {
        waiting_.fetch_sub(1, std::memory_order_acq_rel);
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return AcquireResult::error(ErrorCategory::POOL_EXHAUSTED,
            std::format("session queue full ({} requests waiting)", config_.max_waiters));
    }

    const bool got_slot = semaphore_.try_acquire_for(timeout);
    waiting_.fetch_sub(1, std::memory_order_acq_rel);

    if (!got_slot) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return AcquireResult::error(ErrorCategory::POOL_EXHAUSTED,
            std::format("timed out after {}ms waiting for a free session", timeout.count()));
    }

    // Re-check shutdown after acquiring semaphore (TOCTOU: shutdown may have
    // been set between the initial check and semaphore acquisition)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return AcquireResult::error(ErrorCategory::POOL_EXHAUSTED,
            "session pool is shut down");
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (conn) {
                const auto it = created_at_.find(conn.get());
                if (it != created_at_.end()) birth = it->second;
                const auto lu = last_used_.find(conn.get());
                if (lu != last_used_.end()) last_used = lu->second;
            }
        }
    }

    const auto now = std::chrono::steady_clock::now();

    // Recycle connections past max_lifetime, validate ones idle past idle_timeout
    if (conn) {
        bool replace = false;
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Idle session for server '{}' failed validation, reconnecting",
                profile_.name));
            replace = true;
        }
        if (replace) {
            discard(std::move(conn));
        }
    }

    if (!conn) {
        auto created = create_connection();
        if (created.is_error()) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return AcquireResult::error(ErrorCategory::CONNECTION_ERROR, created.error_message());
        }
        conn = std::move(created.value());
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool suspect) {
        this->return_connection(std::move(c), suspect);
    };

    return AcquireResult::ok(std::make_unique<PooledConnection>(std::move(conn), return_fn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.waiting = waiting_.load(std::memory_order_relaxed);
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            created_at_.erase(conn.get());
            last_used_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();

    utils::log::debug(std::format("Session pool drained for server '{}'", profile_.name));
}

Result<std::unique_ptr<IDbConnection>> GenericConnectionPool::create_connection() {
    auto created = factory_->create(profile_, profile_.default_database);
    if (created.is_ok()) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Opened session to server '{}' ({}:{})",
            profile_.name, profile_.host, profile_.port));
    }
    return created;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool suspect) {
    if (!conn) {
        semaphore_.release();
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire)) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    // A poisoned session is never silently reused
    if (!conn->is_connected() ||
        (suspect && !conn->is_healthy(config_.health_check_query))) {
        connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Discarding broken session for server '{}'", profile_.name));
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    // Idle sessions hold no transaction; closing one rolls it back server-side
    if (conn->in_transaction()) {
        connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Discarding session with an open transaction for server '{}'",
            profile_.name));
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace sqlgateway
