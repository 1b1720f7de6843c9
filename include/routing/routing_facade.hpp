#pragma once

#include "core/types.hpp"
#include "replication/replica_registry.hpp"
#include "routing/routing_strategy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace readrouter {

struct WriteResult {
    bool success = false;
    int64_t record_id = 0;
    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;
};

struct ReadRequest {
    std::optional<uint32_t> limit;          // Default: configured read_limit
    bool prefer_replica = true;             // false = go straight to primary
    std::optional<bool> own_rows_only;      // Default: true for sticky routing only
};

/**
 * @brief Rows plus the decision that produced them
 *
 * The decision is filled in even when the read fails, so the caller can see
 * which node was unreachable.
 */
struct ReadResult {
    QueryResult rows;
    RoutingDecision decision;
};

/**
 * @brief Single entry point for session writes and reads
 *
 * Writes always execute on the primary; once one commits, the active strategy
 * observes it through on_write(). Reads go wherever the strategy decides.
 * There is no fallback to another node when the chosen one fails.
 */
class RoutingFacade {
public:
    struct Config {
        std::string table = "replication_test";
        uint32_t read_limit = 5;
    };

    /// @throws ConfigurationError for a missing registry/strategy or an invalid table name
    RoutingFacade(std::shared_ptr<const ReplicaRegistry> registry,
                  std::unique_ptr<IRoutingStrategy> strategy,
                  const Config& config);

    [[nodiscard]] WriteResult write(const std::string& session_id, const std::string& payload);

    [[nodiscard]] ReadResult read(const std::string& session_id, const ReadRequest& request = {});

    /// Decision only, no query; what read() would use right now
    [[nodiscard]] RoutingDecision decide(const std::string& session_id, bool prefer_replica = true);

    [[nodiscard]] StrategyKind strategy_kind() const { return strategy_->kind(); }
    [[nodiscard]] IRoutingStrategy& strategy() { return *strategy_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] Statement build_select(const std::string& session_id, uint32_t limit, bool own_rows_only) const;

    std::shared_ptr<const ReplicaRegistry> registry_;
    std::unique_ptr<IRoutingStrategy> strategy_;
    Config config_;
    std::string insert_sql_;
};

} // namespace readrouter
