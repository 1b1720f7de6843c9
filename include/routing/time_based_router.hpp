#pragma once

#include "core/clock.hpp"
#include "replication/replica_registry.hpp"
#include "routing/routing_strategy.hpp"
#include "session/session_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace readrouter {

/**
 * @brief Sends a session's reads to the primary for a fixed window after
 *        each of its writes, and to the preferred replica otherwise
 *
 * Approximate: a replica that caught up early is skipped until the window
 * closes, and a replica lagging longer than the window is still used.
 */
class TimeBasedRouter : public IRoutingStrategy {
public:
    struct Config {
        std::chrono::milliseconds threshold{5000};
        std::string preferred_replica;             // Empty = first configured replica
    };

    /**
     * @throws ConfigurationError if the threshold is not positive or the
     *         preferred replica cannot be resolved
     */
    TimeBasedRouter(std::shared_ptr<const ReplicaRegistry> registry,
                    std::shared_ptr<SessionStore> sessions,
                    const Config& config,
                    ClockFn clock = system_clock_fn());

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::TIME_BASED; }

    void on_write(const std::string& session_id) override { record_write(session_id); }

    [[nodiscard]] RoutingDecision route_read(const std::string& session_id) override {
        return target(session_id);
    }

    /// Stamp the session's last write with the current clock time
    void record_write(const std::string& session_id);

    [[nodiscard]] RoutingDecision target(const std::string& session_id);

private:
    std::shared_ptr<const ReplicaRegistry> registry_;
    std::shared_ptr<SessionStore> sessions_;
    Config config_;
    ClockFn clock_;
    ReplicaNode replica_;
};

} // namespace readrouter
