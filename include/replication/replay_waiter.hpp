#pragma once

#include "core/error.hpp"
#include "replication/iposition_source.hpp"
#include "replication/log_position.hpp"

#include <chrono>
#include <cstdint>

namespace readrouter {

/**
 * @brief Blocks until a replica has replayed up to a target position
 *
 * Replaces fixed sleeps between a write and a replica read: the caller
 * captures the primary position after writing and waits on that exact
 * position instead of guessing how long replication takes.
 */
class ReplayWaiter {
public:
    struct Config {
        std::chrono::milliseconds poll_interval{50};
        std::chrono::milliseconds query_timeout{1000};   // per position query
    };

    struct Outcome {
        bool reached = false;
        LogPosition last_seen;        // Valid when at least one poll succeeded
        bool any_report = false;
        uint32_t polls = 0;
    };

    ReplayWaiter() : ReplayWaiter(Config{}) {}
    explicit ReplayWaiter(const Config& config) : config_(config) {}

    /**
     * @brief Poll `replica` until it reports a position at or past `target`
     *
     * Transient report failures are retried until `deadline` expires; the
     * outcome says whether the target was reached.
     */
    [[nodiscard]] Outcome wait_for(IPositionSource& replica, const LogPosition& target,
                                   std::chrono::milliseconds deadline) const;

private:
    Config config_;
};

} // namespace readrouter
