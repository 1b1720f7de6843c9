#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace readrouter {

/**
 * @brief Bounded connection pool for one primary or replica endpoint
 *
 * Design:
 * - Bounded: max_connections enforced via counting_semaphore, so one stalled
 *   endpoint never holds more than its own slots
 * - Lazy: connections created on demand up to max, min pre-warmed
 * - Health checking: connections idle longer than idle_timeout are probed
 * - Lifetime recycling: connections older than max_lifetime are replaced
 * - RAII: PooledConnection returns on destruction; discarded ones are closed
 *
 * Each endpoint gets its own pool so unrelated sessions reading from
 * different replicas never queue behind each other.
 */
class EndpointPool : public IConnectionPool {
public:
    /**
     * @param endpoint_name Node id (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    EndpointPool(
        std::string endpoint_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~EndpointPool() override;

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return endpoint_name_; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    std::unique_ptr<IDbConnection> create_connection();

    /// Close a connection and forget its bookkeeping
    void retire(std::unique_ptr<IDbConnection> conn);

    /// Called by PooledConnection on destruction
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string endpoint_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};

    // Guarded by mutex_
    std::unordered_map<IDbConnection*, TimePoint> created_at_;
    std::unordered_map<IDbConnection*, TimePoint> last_used_;
};

} // namespace readrouter
