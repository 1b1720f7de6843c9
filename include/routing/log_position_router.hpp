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
 * @brief Reads from a replica only once it has replayed the session's last write
 *
 * After each write the primary's current log position is stored on the
 * session. A read compares it with the replica's replay position under the
 * log's native order. Anything that prevents an answer (query failure,
 * timeout, NULL report, unknown write position) counts as not caught up,
 * so the read goes to the primary.
 *
 * A write that lands between the check and the read is not covered; the
 * replica can only fall further behind in that window.
 */
class LogPositionRouter : public IRoutingStrategy {
public:
    struct Config {
        std::chrono::milliseconds position_timeout{1000};
        std::string preferred_replica;                    // Empty = first configured replica
    };

    enum class CatchUp {
        CAUGHT_UP,
        LAGGING,
        UNAVAILABLE     // Replica or write position could not be established
    };

    /**
     * @throws ConfigurationError if the timeout is not positive or the
     *         preferred replica cannot be resolved
     */
    LogPositionRouter(std::shared_ptr<const ReplicaRegistry> registry,
                      std::shared_ptr<SessionStore> sessions,
                      const Config& config,
                      ClockFn clock = system_clock_fn());

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::LOG_POSITION; }

    void on_write(const std::string& session_id) override {
        (void)record_write_position(session_id);
    }

    [[nodiscard]] RoutingDecision route_read(const std::string& session_id) override {
        return target(session_id);
    }

    /**
     * @brief Store the primary's current position on the session
     * @return false if the position could not be read; the session is then
     *         pinned to the primary until a later write records one
     */
    bool record_write_position(const std::string& session_id);

    [[nodiscard]] CatchUp check(const std::string& session_id, const NodeHandle& replica);

    [[nodiscard]] bool is_caught_up(const std::string& session_id, const NodeHandle& replica) {
        return check(session_id, replica) == CatchUp::CAUGHT_UP;
    }

    [[nodiscard]] RoutingDecision target(const std::string& session_id);

    [[nodiscard]] const NodeHandle& replica() const { return *replica_; }

private:
    std::shared_ptr<const ReplicaRegistry> registry_;
    std::shared_ptr<SessionStore> sessions_;
    Config config_;
    ClockFn clock_;
    const NodeHandle* replica_ = nullptr;
};

} // namespace readrouter
