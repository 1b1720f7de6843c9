#include "replication/replica_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/endpoint_pool.hpp"
#include "replication/pg_position_source.hpp"

#include <format>
#include <unordered_set>

namespace readrouter {

ReplicaRegistry::ReplicaRegistry(NodeHandle primary, std::vector<NodeHandle> replicas)
    : primary_(std::move(primary)),
      replicas_(std::move(replicas)) {

    validate_handle(primary_, NodeRole::PRIMARY);

    std::unordered_set<std::string> ids{primary_.node.id};
    for (const auto& replica : replicas_) {
        validate_handle(replica, NodeRole::REPLICA);
        if (!ids.insert(replica.node.id).second) {
            throw ConfigurationError(std::format("Duplicate node id '{}'", replica.node.id));
        }
    }
}

ReplicaRegistry::~ReplicaRegistry() {
    drain();
}

void ReplicaRegistry::validate_handle(const NodeHandle& handle, NodeRole expected_role) {
    if (handle.node.id.empty()) {
        throw ConfigurationError("Node id must not be empty");
    }
    if (handle.node.role != expected_role) {
        throw ConfigurationError(std::format("Node '{}' is configured as {} but registered as {}",
            handle.node.id, node_role_to_string(handle.node.role), node_role_to_string(expected_role)));
    }
    if (!handle.executor || !handle.positions) {
        throw ConfigurationError(std::format("Node '{}' has no executor or position source", handle.node.id));
    }
}

std::shared_ptr<ReplicaRegistry> ReplicaRegistry::connect(
    const ReplicaNode& primary,
    const std::vector<ReplicaNode>& replicas,
    const ConnectOptions& options,
    std::shared_ptr<IConnectionFactory> factory) {

    auto open = [&](const ReplicaNode& node) {
        PoolConfig pool_config = options.pool;
        pool_config.connection_string = node.endpoint.to_connection_string();

        NodeHandle handle;
        handle.node = node;
        handle.pool = std::make_shared<EndpointPool>(node.id, pool_config, factory);
        handle.executor = std::make_shared<PooledQueryExecutor>(handle.pool, options.executor);
        handle.positions = std::make_shared<PgPositionSource>(handle.executor, node.role, node.id);

        utils::log::info(std::format("Registered {} '{}' at {}",
            node_role_to_string(node.role), node.id, node.endpoint.describe()));
        return handle;
    };

    NodeHandle primary_handle = open(primary);
    std::vector<NodeHandle> replica_handles;
    replica_handles.reserve(replicas.size());
    for (const auto& replica : replicas) {
        replica_handles.push_back(open(replica));
    }

    return std::make_shared<ReplicaRegistry>(std::move(primary_handle), std::move(replica_handles));
}

std::vector<ReplicaNode> ReplicaRegistry::replica_nodes() const {
    std::vector<ReplicaNode> nodes;
    nodes.reserve(replicas_.size());
    for (const auto& replica : replicas_) {
        nodes.push_back(replica.node);
    }
    return nodes;
}

const NodeHandle* ReplicaRegistry::find(const std::string& id) const {
    if (primary_.node.id == id) {
        return &primary_;
    }
    for (const auto& replica : replicas_) {
        if (replica.node.id == id) {
            return &replica;
        }
    }
    return nullptr;
}

const NodeHandle& ReplicaRegistry::handle_for(const ReplicaNode& node) const {
    const auto* handle = find(node.id);
    if (!handle) {
        throw ConfigurationError(std::format("Node '{}' is not registered", node.id));
    }
    return *handle;
}

const NodeHandle& ReplicaRegistry::preferred_replica(const std::string& preferred_id) const {
    if (replicas_.empty()) {
        throw ConfigurationError("No replicas configured");
    }
    if (preferred_id.empty()) {
        return replicas_.front();
    }
    for (const auto& replica : replicas_) {
        if (replica.node.id == preferred_id) {
            return replica;
        }
    }
    throw ConfigurationError(std::format("Preferred replica '{}' is not a configured replica", preferred_id));
}

void ReplicaRegistry::drain() {
    if (primary_.pool) {
        primary_.pool->drain();
    }
    for (auto& replica : replicas_) {
        if (replica.pool) {
            replica.pool->drain();
        }
    }
}

} // namespace readrouter
