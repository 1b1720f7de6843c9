#pragma once

#include "config/config_types.hpp"
#include "core/clock.hpp"
#include "db/iconnection_factory.hpp"
#include "replication/replica_registry.hpp"
#include "routing/routing_facade.hpp"
#include "routing/routing_strategy.hpp"
#include "session/session_store.hpp"

#include <memory>

namespace readrouter {

/**
 * @brief Wires a validated RouterConfig into a ready facade
 */
class RouterBuilder {
public:
    /// Pool and executor options derived from [pool]
    [[nodiscard]] static ReplicaRegistry::ConnectOptions connect_options(const PoolSettings& pool);

    /// Open pools for the primary and every replica
    [[nodiscard]] static std::shared_ptr<ReplicaRegistry> connect(
        const RouterConfig& config, std::shared_ptr<IConnectionFactory> factory);

    /// Strategy named by routing.strategy; throws ConfigurationError for unknown names
    [[nodiscard]] static StrategyKind configured_strategy(const RoutingConfig& routing);

    /**
     * @brief Strategy of the given kind, tuned by the [routing] sections
     * @throws ConfigurationError for unusable topologies or hash settings
     */
    [[nodiscard]] static std::unique_ptr<IRoutingStrategy> make_strategy(
        StrategyKind kind,
        const RoutingConfig& routing,
        std::shared_ptr<const ReplicaRegistry> registry,
        std::shared_ptr<SessionStore> sessions,
        ClockFn clock = system_clock_fn());

    /// Facade for the deployment: the one strategy routing.strategy names
    [[nodiscard]] static std::unique_ptr<RoutingFacade> make_facade(
        const RouterConfig& config,
        std::shared_ptr<const ReplicaRegistry> registry,
        std::shared_ptr<SessionStore> sessions,
        ClockFn clock = system_clock_fn());

    /// Facade for an explicit strategy, ignoring routing.strategy
    [[nodiscard]] static std::unique_ptr<RoutingFacade> make_facade(
        StrategyKind kind,
        const RouterConfig& config,
        std::shared_ptr<const ReplicaRegistry> registry,
        std::shared_ptr<SessionStore> sessions,
        ClockFn clock = system_clock_fn());
};

} // namespace readrouter
