#include "demo/scenario_runner.hpp"
#include "core/utils.hpp"
#include "routing/router_builder.hpp"

#include <chrono>
#include <format>
#include <set>
#include <thread>

namespace readrouter {

namespace {

constexpr std::chrono::milliseconds kReplayDeadline{30000};
constexpr std::chrono::milliseconds kBulkInsertTimeout{600000};
constexpr int kStickyRepeatReads = 5;

std::string cell(const QueryResult& result, size_t row, size_t col) {
    if (row >= result.rows.size() || col >= result.rows[row].size() || result.is_null(row, col)) {
        return "NULL";
    }
    return result.rows[row][col];
}

} // anonymous namespace

ScenarioRunner::ScenarioRunner(
    const RouterConfig& config,
    std::shared_ptr<ReplicaRegistry> registry,
    ReplayWaiter waiter)
    : config_(config),
      registry_(std::move(registry)),
      waiter_(waiter) {}

std::unique_ptr<RoutingFacade> ScenarioRunner::make_facade(
    StrategyKind kind, std::shared_ptr<SessionStore> sessions) const {
    return RouterBuilder::make_facade(kind, config_, registry_, std::move(sessions));
}

bool ScenarioRunner::report_read(const std::string& session_id, const ReadResult& result) const {
    if (!result.rows.success) {
        utils::log::error(std::format("  '{}' read via {} failed: [{}] {}",
            session_id, result.decision.label,
            error_code_to_string(result.rows.error_code), result.rows.error_message));
        return false;
    }
    utils::log::info(std::format("  '{}' read from {}: {} rows",
        session_id, result.decision.label, result.rows.rows.size()));
    return true;
}

bool ScenarioRunner::wait_for_replica(const NodeHandle& replica, std::optional<LogPosition> target) {
    if (!target) {
        const auto primary_position = registry_->primary().positions->current_position(
            config_.routing.log_position.position_timeout);
        if (primary_position.is_error()) {
            utils::log::warn(std::format("  Cannot read primary position: {}", primary_position.error_message()));
            return false;
        }
        target = primary_position.value();
    }

    const auto outcome = waiter_.wait_for(*replica.positions, *target, kReplayDeadline);
    if (outcome.reached) {
        utils::log::info(std::format("  {} replayed {} after {} poll(s)",
            replica.node.id, target->to_string(), outcome.polls));
    } else if (outcome.any_report) {
        utils::log::warn(std::format("  {} still at {} (target {}) after {}ms",
            replica.node.id, outcome.last_seen.to_string(), target->to_string(), kReplayDeadline.count()));
    } else {
        utils::log::warn(std::format("  {} never reported a replay position", replica.node.id));
    }
    return outcome.reached;
}

// ============================================================================
// Time-based
// ============================================================================

int ScenarioRunner::run_time_based() {
    utils::log::info(std::format("Time-based routing (threshold {}ms)",
        config_.routing.time_based.threshold.count()));

    auto sessions = std::make_shared<SessionStore>();
    auto facade = make_facade(StrategyKind::TIME_BASED, sessions);
    const std::string session = "time-demo";
    const std::string payload = "Critical-Data";
    bool ok = true;

    utils::log::info("[1/3] Write, then read immediately");
    const auto written = facade->write(session, payload);
    if (!written.success) {
        utils::log::error(std::format("  Write failed: {}", written.error_message));
        return 1;
    }
    utils::log::info(std::format("  Wrote record {} on {}", written.record_id, registry_->primary().node.id));
    ok &= report_read(session, facade->read(session));

    utils::log::info("[2/3] Checking the replica directly");
    const auto& replica = registry_->preferred_replica(config_.routing.preferred_replica);
    Statement probe;
    probe.sql = std::format("SELECT count(*) FROM {} WHERE id = $1", config_.schema.table);
    probe.params = {std::to_string(written.record_id)};
    probe.type = StatementType::SELECT;
    const auto seen = replica.executor->execute(probe);
    if (!seen.success) {
        utils::log::warn(std::format("  {} unreachable: {}", replica.node.id, seen.error_message));
    } else if (cell(seen, 0, 0) == "0") {
        utils::log::info(std::format("  {} does not have record {} yet", replica.node.id, written.record_id));
    } else {
        utils::log::info(std::format("  {} already has record {}", replica.node.id, written.record_id));
    }

    const auto wait = config_.routing.time_based.threshold + std::chrono::seconds(1);
    utils::log::info(std::format("[3/3] Waiting {}ms, then reading again", wait.count()));
    std::this_thread::sleep_for(wait);
    ok &= report_read(session, facade->read(session));

    return ok ? 0 : 1;
}

// ============================================================================
// Log-position
// ============================================================================

int ScenarioRunner::run_log_position() {
    utils::log::info("Log-position routing");

    auto sessions = std::make_shared<SessionStore>();
    auto facade = make_facade(StrategyKind::LOG_POSITION, sessions);
    const std::string session = "position-demo";
    bool ok = true;

    utils::log::info("[1/3] Write, then read immediately");
    const auto written = facade->write(session, "Position-Test");
    if (!written.success) {
        utils::log::error(std::format("  Write failed: {}", written.error_message));
        return 1;
    }
    const auto state = sessions->snapshot(session);
    utils::log::info(std::format("  Wrote record {} at position {}", written.record_id,
        state.last_write_position ? state.last_write_position->to_string() : "unknown"));
    ok &= report_read(session, facade->read(session, ReadRequest{.limit = 3}));

    utils::log::info("[2/3] Waiting for the replica to replay the write");
    const auto& replica = registry_->preferred_replica(config_.routing.preferred_replica);
    if (state.last_write_position) {
        (void)wait_for_replica(replica, state.last_write_position);
    }

    utils::log::info("[3/3] Reading again");
    ok &= report_read(session, facade->read(session, ReadRequest{.limit = 3}));
    ok &= report_read(session, facade->read(session, ReadRequest{.limit = 3, .prefer_replica = false}));

    return ok ? 0 : 1;
}

// ============================================================================
// Sticky hash
// ============================================================================

int ScenarioRunner::run_sticky() {
    utils::log::info(std::format("Sticky hash routing ({} assignment, {} replicas)",
        config_.routing.sticky_hash.assignment, registry_->replica_count()));

    auto facade = make_facade(StrategyKind::STICKY_HASH, std::make_shared<SessionStore>());
    const std::vector<std::string> users = {"alice", "bob", "charlie"};
    bool ok = true;

    utils::log::info("[1/2] Each session writes and reads");
    for (const auto& user : users) {
        const auto written = facade->write(user, "Hello World");
        if (!written.success) {
            utils::log::error(std::format("  '{}' write failed: {}", user, written.error_message));
            ok = false;
            continue;
        }
        const auto decision = facade->decide(user);
        (void)wait_for_replica(registry_->handle_for(decision.target));
        ok &= report_read(user, facade->read(user));
    }

    utils::log::info("[2/2] Repeated reads stay on one replica");
    for (const auto& user : users) {
        std::set<std::string> targets;
        for (int i = 0; i < kStickyRepeatReads; ++i) {
            const auto result = facade->read(user);
            targets.insert(result.decision.target.id);
            ok &= report_read(user, result);
        }
        if (targets.size() != 1) {
            utils::log::error(std::format("  '{}' was routed to {} different replicas", user, targets.size()));
            ok = false;
        }
    }

    return ok ? 0 : 1;
}

// ============================================================================
// Configured strategy
// ============================================================================

int ScenarioRunner::run_configured(const std::string& session_id, const std::string& payload) {
    auto facade = RouterBuilder::make_facade(config_, registry_, std::make_shared<SessionStore>());
    utils::log::info(std::format("Configured strategy '{}'", strategy_kind_to_string(facade->strategy_kind())));

    const auto written = facade->write(session_id, payload);
    if (!written.success) {
        utils::log::error(std::format("  '{}' write failed: [{}] {}", session_id,
            error_code_to_string(written.error_code), written.error_message));
        return 1;
    }
    utils::log::info(std::format("  '{}' wrote record {}", session_id, written.record_id));

    return report_read(session_id, facade->read(session_id)) ? 0 : 1;
}

// ============================================================================
// Lag generator and replication status
// ============================================================================

int ScenarioRunner::run_lag(uint64_t rows) {
    utils::log::info(std::format("Inserting {} rows on the primary to create replication lag", rows));

    Statement bulk;
    bulk.sql = std::format(
        "INSERT INTO {} (data, session_id) "
        "SELECT 'Large-Data-' || i || '-' || repeat('X', 500), 'lag-generator' "
        "FROM generate_series(1, $1::bigint) i",
        config_.schema.table);
    bulk.params = {std::to_string(rows)};
    bulk.type = StatementType::UTILITY;
    bulk.timeout = kBulkInsertTimeout;

    const utils::Timer timer;
    const auto result = registry_->primary().executor->execute(bulk);
    if (!result.success) {
        utils::log::error(std::format("  Bulk insert failed: {}", result.error_message));
        return 1;
    }
    utils::log::info(std::format("  Inserted {} rows in {}ms", result.affected_rows, timer.elapsed_ms().count()));

    return print_status();
}

int ScenarioRunner::print_status() {
    const auto& primary = registry_->primary();

    Statement stmt;
    stmt.sql =
        "SELECT application_name, state, "
        "pg_wal_lsn_diff(pg_current_wal_lsn(), replay_lsn)::bigint, "
        "pg_size_pretty(pg_wal_lsn_diff(pg_current_wal_lsn(), replay_lsn)), "
        "ROUND(EXTRACT(EPOCH FROM replay_lag)::numeric, 2) "
        "FROM pg_stat_replication ORDER BY application_name";
    stmt.type = StatementType::UTILITY;

    const auto result = primary.executor->execute(stmt);
    if (!result.success) {
        utils::log::error(std::format("Replication status unavailable on {}: {}",
            primary.node.id, result.error_message));
        return 1;
    }

    utils::log::info(std::format("Replication status ({} standby connection(s)):", result.rows.size()));
    for (size_t i = 0; i < result.rows.size(); ++i) {
        utils::log::info(std::format("  {} [{}]: {} bytes ({}) behind, replay lag {}s",
            cell(result, i, 0), cell(result, i, 1), cell(result, i, 2), cell(result, i, 3), cell(result, i, 4)));
    }

    const auto timeout = config_.routing.log_position.position_timeout;
    const auto primary_position = primary.positions->current_position(timeout);
    utils::log::info(std::format("  {} write position: {}", primary.node.id,
        primary_position.is_ok() ? primary_position.value().to_string() : primary_position.error_message()));

    for (const auto& replica : registry_->replicas()) {
        const auto position = replica.positions->current_position(timeout);
        utils::log::info(std::format("  {} replay position: {}", replica.node.id,
            position.is_ok() ? position.value().to_string() : position.error_message()));
    }
    return 0;
}

} // namespace readrouter
