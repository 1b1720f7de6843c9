#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iquery_executor.hpp"
#include "db/pooled_query_executor.hpp"
#include "replication/iposition_source.hpp"
#include "replication/replica_node.hpp"

#include <memory>
#include <string>
#include <vector>

namespace readrouter {

/**
 * @brief One configured node plus the capabilities routers consume
 */
struct NodeHandle {
    ReplicaNode node;
    std::shared_ptr<IQueryExecutor> executor;
    std::shared_ptr<IPositionSource> positions;
    std::shared_ptr<IConnectionPool> pool;     // null when built from fakes
};

/**
 * @brief Static topology: exactly one primary and zero or more replicas
 *
 * Built once at startup and immutable afterwards, so lookups need no
 * locking. Node ids are unique across primary and replicas.
 */
class ReplicaRegistry {
public:
    /// Pool and executor settings applied to every endpoint by connect()
    struct ConnectOptions {
        PoolConfig pool;
        PooledQueryExecutor::Config executor;
    };

    /**
     * @throws ConfigurationError when roles are wrong, ids repeat or a
     *         handle lacks an executor / position source
     */
    ReplicaRegistry(NodeHandle primary, std::vector<NodeHandle> replicas);

    ~ReplicaRegistry();

    ReplicaRegistry(const ReplicaRegistry&) = delete;
    ReplicaRegistry& operator=(const ReplicaRegistry&) = delete;

    /**
     * @brief Open a pool, executor and position source per node
     *
     * Pools are opened lazily past their warm-up connections, so an endpoint
     * that is down at startup shows up as CONNECTION_ERROR on first use
     * rather than aborting the process.
     */
    [[nodiscard]] static std::shared_ptr<ReplicaRegistry> connect(
        const ReplicaNode& primary,
        const std::vector<ReplicaNode>& replicas,
        const ConnectOptions& options,
        std::shared_ptr<IConnectionFactory> factory);

    [[nodiscard]] const NodeHandle& primary() const { return primary_; }
    [[nodiscard]] const std::vector<NodeHandle>& replicas() const { return replicas_; }
    [[nodiscard]] size_t replica_count() const { return replicas_.size(); }

    /// Replica descriptors in configuration order (the hash routers' replica set)
    [[nodiscard]] std::vector<ReplicaNode> replica_nodes() const;

    /// nullptr when no node (primary or replica) has this id
    [[nodiscard]] const NodeHandle* find(const std::string& id) const;

    /// Handle for a routing target; throws ConfigurationError for unknown ids
    [[nodiscard]] const NodeHandle& handle_for(const ReplicaNode& node) const;

    /**
     * @brief Resolve the replica a strategy reads from
     * @param preferred_id Replica id, or empty for the first configured replica
     * @throws ConfigurationError if there are no replicas or the id is not a replica
     */
    [[nodiscard]] const NodeHandle& preferred_replica(const std::string& preferred_id) const;

    /// Close idle connections on every endpoint
    void drain();

private:
    static void validate_handle(const NodeHandle& handle, NodeRole expected_role);

    NodeHandle primary_;
    std::vector<NodeHandle> replicas_;
};

} // namespace readrouter
