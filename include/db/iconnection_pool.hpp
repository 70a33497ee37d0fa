#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlgateway {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration (database-agnostic)
 *
 * A profile's pool is its session slot set: max_connections sessions
 * at most, created lazily, with a bounded number of waiters.
 */
struct PoolConfig {
    size_t min_connections = 0;
    size_t max_connections = 1;
    size_t max_waiters = 64;
    std::chrono::milliseconds idle_timeout{60000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{0};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t waiting = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_discarded = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for a free slot
     * @return RAII connection handle, or CONNECTION_ERROR with the reason
     */
    [[nodiscard]] virtual Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Drain pool - close idle connections, refuse new acquires
     */
    virtual void drain() = 0;

    /**
     * @brief Name of the profile this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlgateway
