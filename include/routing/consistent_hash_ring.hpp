#pragma once

#include "replication/replica_node.hpp"
#include "routing/session_hasher.hpp"

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace readrouter {

/**
 * @brief Consistent-hash ring over a replica set
 *
 * Each replica owns `virtual_nodes` points ("<id>#<n>" hashed). A key maps to
 * the first point clockwise from its own hash. Adding or removing one of N
 * replicas moves only about 1/N of the keys.
 *
 * Immutable after construction; lookups are lock-free.
 */
class ConsistentHashRing {
public:
    static constexpr uint32_t kDefaultVirtualNodes = 160;

    /// @throws ConfigurationError for an empty replica set or zero virtual nodes
    ConsistentHashRing(SessionHasher hasher,
                       std::vector<ReplicaNode> replicas,
                       uint32_t virtual_nodes = kDefaultVirtualNodes);

    [[nodiscard]] const ReplicaNode& lookup(std::string_view key) const;

    [[nodiscard]] size_t point_count() const { return points_.size(); }
    [[nodiscard]] const std::vector<ReplicaNode>& replicas() const { return replicas_; }

private:
    SessionHasher hasher_;
    std::vector<ReplicaNode> replicas_;
    std::vector<std::pair<uint64_t, size_t>> points_;   // (ring point, replica index), sorted
};

} // namespace readrouter
