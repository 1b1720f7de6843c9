#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace readrouter {

/**
 * @brief RAII handle for a pooled endpoint connection
 *
 * Hands the connection back to its pool on destruction. A connection that
 * broke mid-query is marked with discard() so the pool closes it instead of
 * handing it to the next session.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /// Do not reuse this connection; the pool closes it on release
    void discard() { reusable_ = false; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool reusable_ = true;
};

} // namespace readrouter
