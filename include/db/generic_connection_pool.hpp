#pragma once

#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlgateway {

/**
 * @brief Database-agnostic connection pool serving one server profile
 *
 * Design:
 * - Bounded: max_connections enforced via counting_semaphore (C++20).
 *   A connection is only ever created while holding a permit, so
 *   concurrent acquires can never create more than max_connections.
 * - Lazy: connections created on demand up to max
 * - Backpressure: at most max_waiters callers block on the semaphore;
 *   the rest are rejected immediately
 * - Validation: connections idle longer than idle_timeout, and connections
 *   returned as suspect, are validated before reuse; broken ones are discarded
 * - RAII: PooledConnection auto-returns on destruction
 *
 * The pool must outlive every PooledConnection it hands out.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @brief Construct pool with connection factory
     * @param profile Connection target passed to the factory
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        ServerProfile profile,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return profile_.name; }

private:
    /**
     * @brief Create new connection via factory
     */
    Result<std::unique_ptr<IDbConnection>> create_connection();

    /**
     * @brief Close a connection and forget its bookkeeping (slot NOT released)
     */
    void discard(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool suspect);

    ServerProfile profile_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> waiting_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_discarded_{0};
    std::atomic<size_t> connections_recycled_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};

    // Connection lifetime tracking
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace sqlgateway
