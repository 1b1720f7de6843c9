#include "replication/pg_position_source.hpp"

#include <format>

namespace readrouter {

PgPositionSource::PgPositionSource(
    std::shared_ptr<IQueryExecutor> executor, NodeRole role, std::string node_id)
    : executor_(std::move(executor)),
      role_(role),
      node_id_(std::move(node_id)) {}

const char* PgPositionSource::position_query(NodeRole role) {
    return role == NodeRole::PRIMARY
        ? "SELECT pg_current_wal_lsn()::text"
        : "SELECT pg_last_wal_replay_lsn()::text";
}

Result<LogPosition> PgPositionSource::current_position(std::chrono::milliseconds timeout) {
    Statement stmt;
    stmt.sql = position_query(role_);
    stmt.type = StatementType::UTILITY;
    stmt.timeout = timeout;

    const auto result = executor_->execute(stmt);
    if (!result.success) {
        return Result<LogPosition>::error(ErrorCode::POSITION_UNAVAILABLE,
            std::format("{} '{}' position query failed ({}): {}",
                node_role_to_string(role_), node_id_,
                error_code_to_string(result.error_code), result.error_message));
    }

    if (result.rows.empty() || result.rows[0].empty() || result.is_null(0, 0)) {
        return Result<LogPosition>::error(ErrorCode::POSITION_UNAVAILABLE,
            std::format("{} '{}' reported no position (not in recovery?)",
                node_role_to_string(role_), node_id_));
    }

    const auto& text = result.rows[0][0];
    const auto position = LogPosition::parse(text);
    if (!position) {
        return Result<LogPosition>::error(ErrorCode::POSITION_UNAVAILABLE,
            std::format("{} '{}' reported unparseable position '{}'",
                node_role_to_string(role_), node_id_, text));
    }

    return Result<LogPosition>::ok(*position);
}

} // namespace readrouter
