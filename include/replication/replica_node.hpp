#pragma once

#include "db/endpoint.hpp"

#include <string>

namespace readrouter {

enum class NodeRole {
    PRIMARY,    // Sole write-accepting node
    REPLICA     // Read-only, asynchronously replaying the primary's log
};

inline const char* node_role_to_string(NodeRole role) {
    switch (role) {
        case NodeRole::PRIMARY: return "primary";
        case NodeRole::REPLICA: return "replica";
        default: return "unknown";
    }
}

/**
 * @brief Static description of one node; immutable for the life of a run
 */
struct ReplicaNode {
    std::string id;
    EndpointConfig endpoint;
    NodeRole role = NodeRole::REPLICA;

    [[nodiscard]] bool is_primary() const { return role == NodeRole::PRIMARY; }
};

/**
 * @brief Output of every read-routing decision: exactly one target
 */
struct RoutingDecision {
    ReplicaNode target;
    std::string label;
};

} // namespace readrouter
