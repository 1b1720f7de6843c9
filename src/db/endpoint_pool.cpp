#include "db/endpoint_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace readrouter {

EndpointPool::EndpointPool(
    std::string endpoint_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : endpoint_name_(std::move(endpoint_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm; an unreachable endpoint is not fatal here, acquire() retries lazily
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Endpoint '{}': failed to open connection {} during pool warm-up",
                endpoint_name_, i + 1));
            break;
        }
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Endpoint '{}': pool ready with {} connections (min={}, max={})",
        endpoint_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

EndpointPool::~EndpointPool() {
    drain();
}

std::unique_ptr<PooledConnection> EndpointPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Endpoint '{}': no connection available within {}ms",
            endpoint_name_, timeout.count()));
        return nullptr;
    }

    // Shutdown may have been set while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    TimePoint birth{};
    TimePoint last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            birth = created_at_[conn.get()];
            last_used = last_used_[conn.get()];
        }
    }

    const auto now = std::chrono::steady_clock::now();
    bool replace = false;
    if (conn && config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    } else if (conn && now - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Recently used connections skip the round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    }
    if (replace) {
        retire(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        std::lock_guard lock(mutex_);
        created_at_[conn.get()] = now;
        last_used_[conn.get()] = now;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };
    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats EndpointPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_connections_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void EndpointPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    }
    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::info(std::format("Endpoint '{}': pool drained", endpoint_name_));
}

std::unique_ptr<IDbConnection> EndpointPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void EndpointPool::retire(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void EndpointPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        retire(std::move(conn));
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

} // namespace readrouter
