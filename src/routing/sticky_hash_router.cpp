#include "routing/sticky_hash_router.hpp"
#include "core/error.hpp"

#include <format>

namespace readrouter {

StickyHashRouter::StickyHashRouter(
    std::shared_ptr<const ReplicaRegistry> registry,
    const Config& config)
    : registry_(std::move(registry)),
      config_(config),
      hasher_(config.hash_key) {

    if (!registry_) {
        throw ConfigurationError("Sticky hash router needs a registry");
    }
    replicas_ = registry_->replica_nodes();
    if (replicas_.empty()) {
        throw ConfigurationError("Sticky hash routing requires at least one replica");
    }
    if (config_.assignment == HashAssignment::RING) {
        ring_ = std::make_unique<ConsistentHashRing>(hasher_, replicas_, config_.virtual_nodes);
    }
}

ReplicaNode StickyHashRouter::select_replica(
    std::string_view session_key,
    const std::vector<ReplicaNode>& replica_set,
    const SessionHasher& hasher) {

    if (replica_set.empty()) {
        throw ConfigurationError("Cannot select a replica from an empty replica set");
    }
    return replica_set[hasher.bucket(session_key, replica_set.size())];
}

const ReplicaNode& StickyHashRouter::assigned_replica(std::string_view session_key) const {
    if (ring_) {
        return ring_->lookup(session_key);
    }
    return replicas_[hasher_.bucket(session_key, replicas_.size())];
}

RoutingDecision StickyHashRouter::route_read(const std::string& session_id) {
    const auto& replica = assigned_replica(session_id);
    return {replica, std::format("replica {} (sticky)", replica.id)};
}

} // namespace readrouter
