#include "routing/log_position_router.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace readrouter {

LogPositionRouter::LogPositionRouter(
    std::shared_ptr<const ReplicaRegistry> registry,
    std::shared_ptr<SessionStore> sessions,
    const Config& config,
    ClockFn clock)
    : registry_(std::move(registry)),
      sessions_(std::move(sessions)),
      config_(config),
      clock_(std::move(clock)) {

    if (!registry_ || !sessions_) {
        throw ConfigurationError("Log-position router needs a registry and a session store");
    }
    if (config_.position_timeout.count() <= 0) {
        throw ConfigurationError(std::format(
            "Position timeout must be positive, got {}ms", config_.position_timeout.count()));
    }
    replica_ = &registry_->preferred_replica(config_.preferred_replica);
}

bool LogPositionRouter::record_write_position(const std::string& session_id) {
    const uint64_t epoch = sessions_->unknown_epoch(session_id);
    const auto report = registry_->primary().positions->current_position(config_.position_timeout);

    if (report.is_error()) {
        sessions_->mark_position_unknown(session_id);
        utils::log::warn(std::format("Session '{}': write position unavailable, pinned to primary ({})",
            session_id, report.error_message()));
        return false;
    }

    sessions_->record_write_position(session_id, epoch, report.value());
    utils::log::debug(std::format("Session '{}': write position {}",
        session_id, report.value().to_string()));
    return true;
}

LogPositionRouter::CatchUp LogPositionRouter::check(
    const std::string& session_id, const NodeHandle& replica) {

    const auto state = sessions_->snapshot(session_id);
    if (state.position_unknown) {
        return CatchUp::UNAVAILABLE;
    }
    if (!state.last_write_position) {
        return CatchUp::CAUGHT_UP;
    }

    const auto started = clock_();
    const auto report = replica.positions->current_position(config_.position_timeout);
    const auto elapsed = clock_() - started;

    if (report.is_error()) {
        utils::log::debug(std::format("Replica '{}' position unavailable: {}",
            replica.node.id, report.error_message()));
        return CatchUp::UNAVAILABLE;
    }
    if (elapsed > config_.position_timeout) {
        utils::log::debug(std::format("Replica '{}' position report arrived after {}ms",
            replica.node.id, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
        return CatchUp::UNAVAILABLE;
    }

    return report.value().reached(*state.last_write_position) ? CatchUp::CAUGHT_UP : CatchUp::LAGGING;
}

RoutingDecision LogPositionRouter::target(const std::string& session_id) {
    switch (check(session_id, *replica_)) {
        case CatchUp::CAUGHT_UP:
            return {replica_->node, std::format("replica {} (caught up)", replica_->node.id)};
        case CatchUp::LAGGING:
            return {registry_->primary().node, "primary (replica lagging)"};
        case CatchUp::UNAVAILABLE:
        default:
            return {registry_->primary().node, "primary (position unavailable)"};
    }
}

} // namespace readrouter
