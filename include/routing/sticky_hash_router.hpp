#pragma once

#include "replication/replica_registry.hpp"
#include "routing/consistent_hash_ring.hpp"
#include "routing/routing_strategy.hpp"
#include "routing/session_hasher.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace readrouter {

enum class HashAssignment {
    MODULO,     // hash mod N; most keys move when N changes
    RING        // consistent hashing with virtual nodes
};

[[nodiscard]] inline std::optional<HashAssignment> parse_hash_assignment(std::string_view name) {
    if (name == "modulo") return HashAssignment::MODULO;
    if (name == "ring") return HashAssignment::RING;
    return std::nullopt;
}

/**
 * @brief Pins every session key to one replica
 *
 * Gives monotonic reads per session (the same replica every call) but not
 * read-your-own-writes: a fresh write may not have reached the pinned
 * replica yet. Writes still go to the primary.
 */
class StickyHashRouter : public IRoutingStrategy {
public:
    struct Config {
        HashAssignment assignment = HashAssignment::MODULO;
        uint32_t virtual_nodes = ConsistentHashRing::kDefaultVirtualNodes;
        std::string hash_key;      // Empty = MD5, otherwise HMAC-SHA256 keyed with it
    };

    /// @throws ConfigurationError when the registry has no replicas
    StickyHashRouter(std::shared_ptr<const ReplicaRegistry> registry, const Config& config);

    /**
     * @brief Modulo assignment of `session_key` over `replica_set`
     * @throws ConfigurationError if `replica_set` is empty
     */
    [[nodiscard]] static ReplicaNode select_replica(std::string_view session_key,
                                                    const std::vector<ReplicaNode>& replica_set,
                                                    const SessionHasher& hasher = SessionHasher{});

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::STICKY_HASH; }

    /// Writes do not affect assignment
    void on_write(const std::string&) override {}

    [[nodiscard]] RoutingDecision route_read(const std::string& session_id) override;

    /// Replica assigned to `session_key` under the configured mode
    [[nodiscard]] const ReplicaNode& assigned_replica(std::string_view session_key) const;

private:
    std::shared_ptr<const ReplicaRegistry> registry_;
    Config config_;
    SessionHasher hasher_;
    std::vector<ReplicaNode> replicas_;
    std::unique_ptr<ConsistentHashRing> ring_;    // RING mode only
};

} // namespace readrouter
