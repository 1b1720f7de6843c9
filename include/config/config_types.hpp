#pragma once

#include "db/endpoint.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace readrouter {

// ============================================================================
// Configuration Types (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct TimeBasedConfig {
    std::chrono::milliseconds threshold{5000};
};

struct LogPositionConfig {
    std::chrono::milliseconds position_timeout{1000};
};

struct StickyHashConfig {
    std::string assignment = "modulo";   // "modulo" | "ring"
    uint32_t virtual_nodes = 160;
    std::string hash_key;                // Empty = unkeyed MD5
};

struct RoutingConfig {
    std::string strategy = "time";       // "time" | "position" | "sticky"
    std::string preferred_replica;       // Empty = first replica
    TimeBasedConfig time_based;
    LogPositionConfig log_position;
    StickyHashConfig sticky_hash;
};

/// Applied to the pool and executor of every node
struct PoolSettings {
    size_t min_connections = 1;
    size_t max_connections = 4;
    std::chrono::milliseconds acquire_timeout{2000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::seconds max_lifetime{3600};
    std::chrono::milliseconds query_timeout{5000};
    uint32_t max_result_rows = 10000;
    std::string health_check_query{"SELECT 1"};
};

struct SchemaConfig {
    std::string table = "replication_test";
    uint32_t read_limit = 5;
};

struct NodeConfig {
    std::string id;
    EndpointConfig endpoint;
};

struct RouterConfig {
    LoggingConfig logging;
    RoutingConfig routing;
    PoolSettings pool;
    SchemaConfig schema;
    NodeConfig primary;
    std::vector<NodeConfig> replicas;
};

} // namespace readrouter
