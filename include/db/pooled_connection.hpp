#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlgateway {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 *
 * A connection marked suspect (timeout or lost connection mid-query)
 * is validated by the pool before it can be handed out again.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool suspect)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    /**
     * @brief Flag the connection for validation before its next use
     */
    void mark_suspect() { suspect_ = true; }
    [[nodiscard]] bool is_suspect() const { return suspect_; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool suspect_ = false;
};

} // namespace sqlgateway
