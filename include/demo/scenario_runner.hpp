#pragma once

#include "config/config_types.hpp"
#include "replication/replay_waiter.hpp"
#include "replication/replica_registry.hpp"
#include "routing/routing_facade.hpp"
#include "session/session_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace readrouter {

/**
 * @brief Command-line walkthroughs of each routing strategy against a live
 *        primary/replica cluster
 *
 * Each run_* method returns a process exit code: 0 when every write and read
 * succeeded, 1 otherwise.
 */
class ScenarioRunner {
public:
    static constexpr uint64_t kDefaultLagRows = 500000;

    ScenarioRunner(const RouterConfig& config,
                   std::shared_ptr<ReplicaRegistry> registry,
                   ReplayWaiter waiter = ReplayWaiter{});

    /// Write, read inside the window (primary), read after it (replica)
    int run_time_based();

    /// Write, read at once, wait for the replica to replay the write, read again
    int run_log_position();

    /// Three sessions write and read; repeated reads stay on one replica
    int run_sticky();

    /**
     * @brief One write and one read through the configured strategy
     *
     * Uses routing.strategy, as a deployment would, and prints where the
     * read was routed.
     */
    int run_configured(const std::string& session_id, const std::string& payload);

    /// Bulk insert on the primary to widen replication lag, then print status
    int run_lag(uint64_t rows);

    /// pg_stat_replication on the primary plus each replica's replay position
    int print_status();

private:
    [[nodiscard]] std::unique_ptr<RoutingFacade> make_facade(
        StrategyKind kind, std::shared_ptr<SessionStore> sessions) const;

    /// Log a read and return whether it succeeded
    bool report_read(const std::string& session_id, const ReadResult& result) const;

    /// Wait until `replica` has replayed `target`, or the primary's current position
    bool wait_for_replica(const NodeHandle& replica, std::optional<LogPosition> target = std::nullopt);

    RouterConfig config_;
    std::shared_ptr<ReplicaRegistry> registry_;
    ReplayWaiter waiter_;
};

} // namespace readrouter
