#include "db/pooled_connection.hpp"

namespace sqlgateway {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      suspect_(other.suspect_) {
    other.suspect_ = false;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        suspect_ = other.suspect_;
        other.suspect_ = false;
    }
    return *this;
}

void PooledConnection::release() {
    if (conn_ && return_fn_) {
        return_fn_(std::move(conn_), suspect_);
    }
    conn_.reset();
    suspect_ = false;
}

} // namespace sqlgateway
