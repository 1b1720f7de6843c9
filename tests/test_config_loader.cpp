#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace readrouter;
using namespace std::chrono_literals;

namespace {

const std::string kMinimal = R"(
[primary]
host = "db-primary"

[[replicas]]
host = "db-replica-1"
port = 5433
)";

bool mentions(const ConfigLoader::LoadResult& result, const std::string& needle) {
    return result.error_message.find(needle) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: defaults for a minimal config", "[config]") {
    const auto result = ConfigLoader::load_from_string(kMinimal);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "info");
    CHECK(cfg.routing.strategy == "time");
    CHECK(cfg.routing.preferred_replica.empty());
    CHECK(cfg.routing.time_based.threshold == 5000ms);
    CHECK(cfg.routing.log_position.position_timeout == 1000ms);
    CHECK(cfg.routing.sticky_hash.assignment == "modulo");
    CHECK(cfg.routing.sticky_hash.virtual_nodes == 160);
    CHECK(cfg.schema.table == "replication_test");
    CHECK(cfg.schema.read_limit == 5);
    CHECK(cfg.pool.max_connections == 4);

    CHECK(cfg.primary.id == "primary");
    CHECK(cfg.primary.endpoint.host == "db-primary");
    CHECK(cfg.primary.endpoint.port == 5432);
    CHECK(cfg.primary.endpoint.database == "testdb");
    REQUIRE(cfg.replicas.size() == 1);
    CHECK(cfg.replicas[0].id == "replica1");
    CHECK(cfg.replicas[0].endpoint.port == 5433);
}

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[routing]
strategy = "sticky"
preferred_replica = "east"

[routing.time_based]
threshold_ms = 2500

[routing.log_position]
position_timeout_ms = 250

[routing.sticky_hash]
assignment = "ring"
virtual_nodes = 64
hash_key = "k"

[pool]
min_connections = 2
max_connections = 8
acquire_timeout_ms = 100
query_timeout_ms = 900
max_lifetime_seconds = 60

[schema]
table = "app.events"
read_limit = 20

[primary]
id = "main"
host = "10.0.0.1"
port = 6432
database = "prod"
user = "router"
password = "pw"
connect_timeout_seconds = 3
application_name = "svc"

[[replicas]]
id = "east"
host = "10.0.0.2"

[[replicas]]
id = "west"
host = "10.0.0.3"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.routing.strategy == "sticky");
    CHECK(cfg.routing.preferred_replica == "east");
    CHECK(cfg.routing.time_based.threshold == 2500ms);
    CHECK(cfg.routing.log_position.position_timeout == 250ms);
    CHECK(cfg.routing.sticky_hash.assignment == "ring");
    CHECK(cfg.routing.sticky_hash.virtual_nodes == 64);
    CHECK(cfg.routing.sticky_hash.hash_key == "k");
    CHECK(cfg.pool.min_connections == 2);
    CHECK(cfg.pool.max_connections == 8);
    CHECK(cfg.pool.acquire_timeout == 100ms);
    CHECK(cfg.pool.query_timeout == 900ms);
    CHECK(cfg.pool.max_lifetime == std::chrono::seconds(60));
    CHECK(cfg.schema.table == "app.events");
    CHECK(cfg.schema.read_limit == 20);

    CHECK(cfg.primary.id == "main");
    CHECK(cfg.primary.endpoint.port == 6432);
    CHECK(cfg.primary.endpoint.user == "router");
    CHECK(cfg.primary.endpoint.password == "pw");
    CHECK(cfg.primary.endpoint.connect_timeout == std::chrono::seconds(3));
    CHECK(cfg.primary.endpoint.application_name == "svc");
    REQUIRE(cfg.replicas.size() == 2);
    CHECK(cfg.replicas[1].id == "west");
}

TEST_CASE("ConfigLoader: env vars expanded", "[config][env]") {
    ::setenv("READ_ROUTER_TEST_PW", "s3cret", 1);
    const std::string toml = R"(
[primary]
password = "${READ_ROUTER_TEST_PW}"

[[replicas]]
password = "pre-${READ_ROUTER_TEST_PW}-post"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.primary.endpoint.password == "s3cret");
    CHECK(result.config.replicas[0].endpoint.password == "pre-s3cret-post");
    ::unsetenv("READ_ROUTER_TEST_PW");
}

TEST_CASE("ConfigLoader: missing env var expands to empty", "[config][env]") {
    ::unsetenv("READ_ROUTER_UNSET_XYZ");
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[routing.sticky_hash]
hash_key = "${READ_ROUTER_UNSET_XYZ}"
)");
    REQUIRE(result.success);
    CHECK(result.config.routing.sticky_hash.hash_key.empty());
}

TEST_CASE("ConfigLoader: unclosed env var is an error", "[config][env]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
password = "${OOPS"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Unclosed"));
}

TEST_CASE("ConfigLoader: invalid TOML is an error", "[config]") {
    const auto result = ConfigLoader::load_from_string("[primary\nhost = ");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/read_router.toml");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to load config"));
}

TEST_CASE("ConfigValidation: unknown strategy", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[routing]
strategy = "random"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "routing.strategy"));
}

TEST_CASE("ConfigValidation: no replicas", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[routing]
strategy = "sticky"

[primary]
host = "db"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "replicas must not be empty"));
}

TEST_CASE("ConfigValidation: unknown preferred replica", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[routing]
preferred_replica = "replica7"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "routing.preferred_replica"));
}

TEST_CASE("ConfigValidation: bad table identifier", "[config][validation]") {
    for (const std::string table : {"", "1abc", "a b", "t;drop", "a.", ".a", "a..b"}) {
        RouterConfig config;
        config.primary.id = "primary";
        config.replicas.push_back({"r1", EndpointConfig{}});
        config.schema.table = table;
        const auto errors = ConfigLoader::validate_config(config);
        INFO("table = '" << table << "'");
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].find("schema.table") != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: zero threshold and timeout", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[routing.time_based]
threshold_ms = 0

[routing.log_position]
position_timeout_ms = -5
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "threshold_ms"));
    CHECK(mentions(result, "position_timeout_ms"));
}

TEST_CASE("ConfigValidation: duplicate node ids", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
id = "a"

[[replicas]]
id = "b"

[[replicas]]
id = "a"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "already used"));
}

TEST_CASE("ConfigValidation: pool bounds", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[pool]
min_connections = 10
max_connections = 2
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "min_connections"));
}

TEST_CASE("ConfigValidation: query timeout must fit statement_timeout", "[config][validation]") {
    const auto too_large = ConfigLoader::load_from_string(kMinimal + R"(
[pool]
query_timeout_ms = 2147483648
)");
    CHECK_FALSE(too_large.success);
    CHECK(mentions(too_large, "pool.query_timeout_ms"));

    const auto largest = ConfigLoader::load_from_string(kMinimal + R"(
[pool]
query_timeout_ms = 2147483647
)");
    CHECK(largest.success);
}

TEST_CASE("ConfigLoader: keepalive settings per node", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
host = "db"
keepalives_idle_seconds = 30
keepalives_interval_seconds = 2
keepalives_count = 4
tcp_user_timeout_ms = 8000

[[replicas]]
host = "r1"
)");
    REQUIRE(result.success);
    const auto& primary = result.config.primary.endpoint;
    CHECK(primary.keepalives_idle == 30s);
    CHECK(primary.keepalives_interval == 2s);
    CHECK(primary.keepalives_count == 4);
    CHECK(primary.tcp_user_timeout == 8000ms);

    const auto& replica = result.config.replicas[0].endpoint;
    CHECK(replica.keepalives_idle == 10s);
    CHECK(replica.tcp_user_timeout == 10000ms);
}

TEST_CASE("ConfigValidation: keepalive settings", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
host = "db"
keepalives_interval_seconds = 0
tcp_user_timeout_ms = -1

[[replicas]]
host = "r1"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "primary.keepalives_interval_seconds"));
    CHECK(mentions(result, "primary.tcp_user_timeout_ms"));
}

TEST_CASE("ConfigValidation: port out of range", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[primary]
port = 70000

[[replicas]]
host = "r"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "port"));
}

TEST_CASE("ConfigValidation: unknown log level and assignment", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(kMinimal + R"(
[logging]
level = "chatty"

[routing.sticky_hash]
assignment = "rendezvous"
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "logging.level"));
    CHECK(mentions(result, "routing.sticky_hash.assignment"));
}

TEST_CASE("ConfigValidation: all errors reported together", "[config][validation]") {
    RouterConfig config;
    config.primary.id = "primary";
    config.routing.strategy = "nope";
    config.schema.read_limit = 0;
    const auto errors = ConfigLoader::validate_config(config);
    CHECK(errors.size() == 3);   // strategy, no replicas, read_limit
}
