#include "routing/time_based_router.hpp"
#include "core/error.hpp"

#include <format>

namespace readrouter {

TimeBasedRouter::TimeBasedRouter(
    std::shared_ptr<const ReplicaRegistry> registry,
    std::shared_ptr<SessionStore> sessions,
    const Config& config,
    ClockFn clock)
    : registry_(std::move(registry)),
      sessions_(std::move(sessions)),
      config_(config),
      clock_(std::move(clock)) {

    if (!registry_ || !sessions_) {
        throw ConfigurationError("Time-based router needs a registry and a session store");
    }
    if (config_.threshold.count() <= 0) {
        throw ConfigurationError(std::format(
            "Time-based threshold must be positive, got {}ms", config_.threshold.count()));
    }
    replica_ = registry_->preferred_replica(config_.preferred_replica).node;
}

void TimeBasedRouter::record_write(const std::string& session_id) {
    sessions_->record_write_time(session_id, clock_());
}

RoutingDecision TimeBasedRouter::target(const std::string& session_id) {
    const auto state = sessions_->snapshot(session_id);
    if (state.last_write_time && clock_() - *state.last_write_time < config_.threshold) {
        return {registry_->primary().node, "primary (recent write)"};
    }
    return {replica_, std::format("replica {}", replica_.id)};
}

} // namespace readrouter
