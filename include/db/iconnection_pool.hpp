#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace readrouter {

class PooledConnection;

/**
 * @brief Sizing and recycling limits for one node's pool
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;                     // Opened at startup
    size_t max_connections = 4;
    std::chrono::milliseconds acquire_timeout{2000};
    std::chrono::milliseconds idle_timeout{300000}; // Idle longer than this gets a health check
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};        // 0 = never recycle
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Connections to a single node, shared by every router thread
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /// nullptr when no connection frees up within `timeout`, the node is
    /// unreachable, or the pool has been drained
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /// Close idle connections and refuse further acquires
    virtual void drain() = 0;

    /// Node id this pool serves
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace readrouter
