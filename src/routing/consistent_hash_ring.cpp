#include "routing/consistent_hash_ring.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace readrouter {

ConsistentHashRing::ConsistentHashRing(
    SessionHasher hasher,
    std::vector<ReplicaNode> replicas,
    uint32_t virtual_nodes)
    : hasher_(std::move(hasher)),
      replicas_(std::move(replicas)) {

    if (replicas_.empty()) {
        throw ConfigurationError("Cannot build a hash ring over an empty replica set");
    }
    if (virtual_nodes == 0) {
        throw ConfigurationError("Hash ring needs at least one virtual node per replica");
    }

    points_.reserve(replicas_.size() * virtual_nodes);
    for (size_t i = 0; i < replicas_.size(); ++i) {
        for (uint32_t v = 0; v < virtual_nodes; ++v) {
            points_.emplace_back(hasher_.point(std::format("{}#{}", replicas_[i].id, v)), i);
        }
    }
    // Equal points resolve by replica index
    std::sort(points_.begin(), points_.end());
}

const ReplicaNode& ConsistentHashRing::lookup(std::string_view key) const {
    const uint64_t h = hasher_.point(key);
    auto it = std::lower_bound(points_.begin(), points_.end(), std::make_pair(h, size_t{0}));
    if (it == points_.end()) {
        it = points_.begin();   // Wrap around
    }
    return replicas_[it->second];
}

} // namespace readrouter
