#include "routing/routing_facade.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace readrouter {

RoutingFacade::RoutingFacade(
    std::shared_ptr<const ReplicaRegistry> registry,
    std::unique_ptr<IRoutingStrategy> strategy,
    const Config& config)
    : registry_(std::move(registry)),
      strategy_(std::move(strategy)),
      config_(config) {

    if (!registry_ || !strategy_) {
        throw ConfigurationError("Routing facade needs a registry and a strategy");
    }
    if (!utils::is_sql_identifier(config_.table)) {
        throw ConfigurationError(std::format("Invalid table name '{}'", config_.table));
    }
    insert_sql_ = std::format(
        "INSERT INTO {} (data, session_id) VALUES ($1, $2) RETURNING id", config_.table);
}

// ============================================================================
// Writes
// ============================================================================

WriteResult RoutingFacade::write(const std::string& session_id, const std::string& payload) {
    Statement stmt;
    stmt.sql = insert_sql_;
    stmt.params = {payload, session_id};
    stmt.type = StatementType::INSERT;

    const auto& primary = registry_->primary();
    auto result = primary.executor->execute(stmt);

    WriteResult out;
    if (!result.success) {
        // Session state only moves after a commit
        out.error_code = result.error_code;
        out.error_message = std::move(result.error_message);
        utils::log::warn(std::format("Write for session '{}' failed on {}: {}",
            session_id, primary.node.id, out.error_message));
        return out;
    }

    strategy_->on_write(session_id);

    std::optional<int64_t> id;
    if (!result.rows.empty() && !result.rows[0].empty() && !result.is_null(0, 0)) {
        id = utils::try_parse_int<int64_t>(result.rows[0][0]);
    }
    if (!id) {
        out.error_code = ErrorCode::INTERNAL_ERROR;
        out.error_message = "Write committed but returned no record id";
        utils::log::error(std::format("Session '{}': {}", session_id, out.error_message));
        return out;
    }

    out.success = true;
    out.record_id = *id;
    utils::log::debug(std::format("Session '{}': wrote record {} on {}", session_id, *id, primary.node.id));
    return out;
}

// ============================================================================
// Reads
// ============================================================================

RoutingDecision RoutingFacade::decide(const std::string& session_id, bool prefer_replica) {
    if (!prefer_replica) {
        return {registry_->primary().node, "primary (replica not preferred)"};
    }
    return strategy_->route_read(session_id);
}

Statement RoutingFacade::build_select(
    const std::string& session_id, uint32_t limit, bool own_rows_only) const {

    Statement stmt;
    stmt.type = StatementType::SELECT;
    if (own_rows_only) {
        stmt.sql = std::format(
            "SELECT id, data, created_at FROM {} WHERE session_id = $1 ORDER BY id DESC LIMIT $2",
            config_.table);
        stmt.params = {session_id, std::to_string(limit)};
    } else {
        stmt.sql = std::format(
            "SELECT id, data, created_at FROM {} ORDER BY id DESC LIMIT $1", config_.table);
        stmt.params = {std::to_string(limit)};
    }
    return stmt;
}

ReadResult RoutingFacade::read(const std::string& session_id, const ReadRequest& request) {
    ReadResult out;
    out.decision = decide(session_id, request.prefer_replica);

    const bool own_rows_only = request.own_rows_only.value_or(
        strategy_->kind() == StrategyKind::STICKY_HASH);
    const auto stmt = build_select(session_id, request.limit.value_or(config_.read_limit), own_rows_only);

    const auto& handle = registry_->handle_for(out.decision.target);
    out.rows = handle.executor->execute(stmt);

    if (out.rows.success) {
        utils::log::debug(std::format("Session '{}': read {} rows via {}",
            session_id, out.rows.rows.size(), out.decision.label));
    } else {
        utils::log::warn(std::format("Session '{}': read via {} failed: {}",
            session_id, out.decision.label, out.rows.error_message));
    }
    return out;
}

} // namespace readrouter
