#pragma once

#include "replication/replica_node.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace readrouter {

enum class StrategyKind {
    TIME_BASED,     // Primary for a fixed window after each write
    LOG_POSITION,   // Replica only once it has replayed the session's last write
    STICKY_HASH     // One replica per session key
};

inline const char* strategy_kind_to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::TIME_BASED: return "time";
        case StrategyKind::LOG_POSITION: return "position";
        case StrategyKind::STICKY_HASH: return "sticky";
        default: return "unknown";
    }
}

/// Accepts the config spellings "time", "position" and "sticky"
[[nodiscard]] inline std::optional<StrategyKind> parse_strategy_kind(std::string_view name) {
    if (name == "time") return StrategyKind::TIME_BASED;
    if (name == "position") return StrategyKind::LOG_POSITION;
    if (name == "sticky") return StrategyKind::STICKY_HASH;
    return std::nullopt;
}

/**
 * @brief Read-routing policy plugged into the RoutingFacade
 *
 * Writes never consult a strategy for a target: they always go to the
 * primary, and the strategy only observes them through on_write().
 */
class IRoutingStrategy {
public:
    virtual ~IRoutingStrategy() = default;

    [[nodiscard]] virtual StrategyKind kind() const = 0;

    /// Called after a write of `session_id` committed on the primary
    virtual void on_write(const std::string& session_id) = 0;

    /// Pick exactly one node to serve the next read of `session_id`
    [[nodiscard]] virtual RoutingDecision route_read(const std::string& session_id) = 0;
};

} // namespace readrouter
