#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "routing/time_based_router.hpp"
#include "mocks/fake_cluster.hpp"
#include "mocks/manual_clock.hpp"

using namespace readrouter;
using namespace readrouter::testing;
using namespace std::chrono_literals;

TEST_CASE("TimeBasedRouter: no write yet routes to replica", "[routing][time]") {
    FakeCluster cluster(2);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(), {}, clock.fn());

    const auto decision = router.target("fresh");
    CHECK(decision.target.id == "replica1");
    CHECK(decision.label == "replica replica1");
}

TEST_CASE("TimeBasedRouter: write then read within and after threshold", "[routing][time]") {
    FakeCluster cluster(2);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(),
                           {.threshold = 5s}, clock.fn());

    router.record_write("user-x");

    clock.advance(1s);
    auto decision = router.target("user-x");
    CHECK(decision.target.is_primary());
    CHECK(decision.label == "primary (recent write)");

    clock.advance(5s);
    decision = router.target("user-x");
    CHECK(decision.target.id == "replica1");
    CHECK(decision.label == "replica replica1");
}

TEST_CASE("TimeBasedRouter: threshold boundary is exclusive", "[routing][time]") {
    FakeCluster cluster(1);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(),
                           {.threshold = 5s}, clock.fn());

    router.record_write("s");
    clock.advance(5s - 1ms);
    CHECK(router.target("s").target.is_primary());

    clock.advance(1ms);
    CHECK_FALSE(router.target("s").target.is_primary());
}

TEST_CASE("TimeBasedRouter: new write restarts the window", "[routing][time]") {
    FakeCluster cluster(1);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(),
                           {.threshold = 5s}, clock.fn());

    router.record_write("s");
    clock.advance(4s);
    router.on_write("s");
    clock.advance(4s);
    CHECK(router.route_read("s").target.is_primary());

    clock.advance(2s);
    CHECK_FALSE(router.route_read("s").target.is_primary());
}

TEST_CASE("TimeBasedRouter: writes of one session do not affect another", "[routing][time]") {
    FakeCluster cluster(1);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(), {}, clock.fn());

    router.record_write("writer");
    CHECK(router.target("writer").target.is_primary());
    CHECK_FALSE(router.target("reader").target.is_primary());
}

TEST_CASE("TimeBasedRouter: preferred replica is honored", "[routing][time]") {
    FakeCluster cluster(3);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(),
                           {.preferred_replica = "replica3"}, clock.fn());

    CHECK(router.target("s").target.id == "replica3");
}

TEST_CASE("TimeBasedRouter: routing issues no queries", "[routing][time]") {
    FakeCluster cluster(2);
    ManualClock clock;
    TimeBasedRouter router(cluster.registry, std::make_shared<SessionStore>(), {}, clock.fn());

    router.record_write("s");
    (void)router.target("s");
    CHECK(cluster.primary_exec->execute_count() == 0);
    CHECK(cluster.replica_queries() == 0);
}

TEST_CASE("TimeBasedRouter: invalid setup rejected", "[routing][time]") {
    auto sessions = std::make_shared<SessionStore>();

    SECTION("unknown preferred replica") {
        FakeCluster cluster(2);
        CHECK_THROWS_AS(TimeBasedRouter(cluster.registry, sessions, {.preferred_replica = "nope"}),
                        ConfigurationError);
    }
    SECTION("no replicas") {
        FakeCluster cluster(0);
        CHECK_THROWS_AS(TimeBasedRouter(cluster.registry, sessions, {}), ConfigurationError);
    }
    SECTION("zero threshold") {
        FakeCluster cluster(1);
        CHECK_THROWS_AS(TimeBasedRouter(cluster.registry, sessions, {.threshold = 0ms}),
                        ConfigurationError);
    }
}
