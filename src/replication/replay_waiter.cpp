#include "replication/replay_waiter.hpp"
#include "core/utils.hpp"

#include <format>
#include <thread>

namespace readrouter {

ReplayWaiter::Outcome ReplayWaiter::wait_for(
    IPositionSource& replica, const LogPosition& target,
    std::chrono::milliseconds deadline) const {

    Outcome outcome;
    const auto give_up_at = std::chrono::steady_clock::now() + deadline;

    while (true) {
        ++outcome.polls;
        const auto report = replica.current_position(config_.query_timeout);
        if (report.is_ok()) {
            outcome.any_report = true;
            outcome.last_seen = report.value();
            if (report.value().reached(target)) {
                outcome.reached = true;
                return outcome;
            }
        } else {
            utils::log::debug(std::format("Replay wait: {}", report.error_message()));
        }

        if (std::chrono::steady_clock::now() + config_.poll_interval > give_up_at) {
            return outcome;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

} // namespace readrouter
