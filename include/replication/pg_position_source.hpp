#pragma once

#include "db/iquery_executor.hpp"
#include "replication/iposition_source.hpp"
#include "replication/replica_node.hpp"

#include <memory>
#include <string>

namespace readrouter {

/**
 * @brief Reads WAL positions from a PostgreSQL node
 *
 * PRIMARY: SELECT pg_current_wal_lsn()
 * REPLICA: SELECT pg_last_wal_replay_lsn()   (NULL when not in recovery)
 *
 * The query runs through the node's own executor with `timeout` as its
 * statement timeout, so a stalled replica surfaces as unavailable instead of
 * blocking the router.
 */
class PgPositionSource : public IPositionSource {
public:
    PgPositionSource(std::shared_ptr<IQueryExecutor> executor, NodeRole role, std::string node_id);

    Result<LogPosition> current_position(std::chrono::milliseconds timeout) override;

    [[nodiscard]] static const char* position_query(NodeRole role);

private:
    std::shared_ptr<IQueryExecutor> executor_;
    NodeRole role_;
    std::string node_id_;
};

} // namespace readrouter
