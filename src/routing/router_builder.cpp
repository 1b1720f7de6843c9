#include "routing/router_builder.hpp"
#include "core/error.hpp"
#include "routing/log_position_router.hpp"
#include "routing/sticky_hash_router.hpp"
#include "routing/time_based_router.hpp"

#include <format>

namespace readrouter {

ReplicaRegistry::ConnectOptions RouterBuilder::connect_options(const PoolSettings& pool) {
    ReplicaRegistry::ConnectOptions options;
    options.pool.min_connections = pool.min_connections;
    options.pool.max_connections = pool.max_connections;
    options.pool.acquire_timeout = pool.acquire_timeout;
    options.pool.idle_timeout = pool.idle_timeout;
    options.pool.max_lifetime = pool.max_lifetime;
    options.pool.health_check_query = pool.health_check_query;

    options.executor.acquire_timeout = pool.acquire_timeout;
    options.executor.query_timeout = pool.query_timeout;
    options.executor.max_result_rows = pool.max_result_rows;
    return options;
}

std::shared_ptr<ReplicaRegistry> RouterBuilder::connect(
    const RouterConfig& config, std::shared_ptr<IConnectionFactory> factory) {

    const ReplicaNode primary{config.primary.id, config.primary.endpoint, NodeRole::PRIMARY};

    std::vector<ReplicaNode> replicas;
    replicas.reserve(config.replicas.size());
    for (const auto& r : config.replicas) {
        replicas.push_back({r.id, r.endpoint, NodeRole::REPLICA});
    }

    return ReplicaRegistry::connect(primary, replicas, connect_options(config.pool), std::move(factory));
}

StrategyKind RouterBuilder::configured_strategy(const RoutingConfig& routing) {
    const auto kind = parse_strategy_kind(routing.strategy);
    if (!kind) {
        throw ConfigurationError(std::format(
            "Unknown routing strategy '{}' (expected time, position or sticky)", routing.strategy));
    }
    return *kind;
}

std::unique_ptr<IRoutingStrategy> RouterBuilder::make_strategy(
    StrategyKind kind,
    const RoutingConfig& routing,
    std::shared_ptr<const ReplicaRegistry> registry,
    std::shared_ptr<SessionStore> sessions,
    ClockFn clock) {

    switch (kind) {
        case StrategyKind::TIME_BASED:
            return std::make_unique<TimeBasedRouter>(
                std::move(registry), std::move(sessions),
                TimeBasedRouter::Config{
                    .threshold = routing.time_based.threshold,
                    .preferred_replica = routing.preferred_replica,
                },
                std::move(clock));

        case StrategyKind::LOG_POSITION:
            return std::make_unique<LogPositionRouter>(
                std::move(registry), std::move(sessions),
                LogPositionRouter::Config{
                    .position_timeout = routing.log_position.position_timeout,
                    .preferred_replica = routing.preferred_replica,
                },
                std::move(clock));

        case StrategyKind::STICKY_HASH: {
            const auto assignment = parse_hash_assignment(routing.sticky_hash.assignment);
            if (!assignment) {
                throw ConfigurationError(std::format("Unknown hash assignment '{}'",
                    routing.sticky_hash.assignment));
            }
            return std::make_unique<StickyHashRouter>(
                std::move(registry),
                StickyHashRouter::Config{
                    .assignment = *assignment,
                    .virtual_nodes = routing.sticky_hash.virtual_nodes,
                    .hash_key = routing.sticky_hash.hash_key,
                });
        }
    }
    throw ConfigurationError("Unknown routing strategy");
}

std::unique_ptr<RoutingFacade> RouterBuilder::make_facade(
    const RouterConfig& config,
    std::shared_ptr<const ReplicaRegistry> registry,
    std::shared_ptr<SessionStore> sessions,
    ClockFn clock) {

    return make_facade(configured_strategy(config.routing), config,
        std::move(registry), std::move(sessions), std::move(clock));
}

std::unique_ptr<RoutingFacade> RouterBuilder::make_facade(
    StrategyKind kind,
    const RouterConfig& config,
    std::shared_ptr<const ReplicaRegistry> registry,
    std::shared_ptr<SessionStore> sessions,
    ClockFn clock) {

    auto strategy = make_strategy(kind, config.routing, registry, std::move(sessions), std::move(clock));
    return std::make_unique<RoutingFacade>(
        std::move(registry), std::move(strategy),
        RoutingFacade::Config{
            .table = config.schema.table,
            .read_limit = config.schema.read_limit,
        });
}

} // namespace readrouter
