#include <catch2/catch_test_macros.hpp>
#include "db/endpoint.hpp"

using namespace readrouter;

TEST_CASE("Endpoint: connection string quotes every value", "[endpoint]") {
    EndpointConfig ep;
    ep.host = "db.internal";
    ep.port = 5433;
    ep.database = "testdb";
    ep.user = "postgres";
    ep.password = "pw";
    ep.connect_timeout = std::chrono::seconds(3);
    ep.application_name = "read_router";

    CHECK(ep.to_connection_string() ==
          "host='db.internal' port=5433 dbname='testdb' user='postgres' password='pw' "
          "connect_timeout=3 keepalives=1 keepalives_idle=10 keepalives_interval=5 keepalives_count=3 "
          "tcp_user_timeout=10000 application_name='read_router'");
}

TEST_CASE("Endpoint: silent peers detected by keepalives and tcp_user_timeout", "[endpoint]") {
    EndpointConfig ep;
    ep.keepalives_idle = std::chrono::seconds(30);
    ep.keepalives_interval = std::chrono::seconds(2);
    ep.keepalives_count = 4;
    ep.tcp_user_timeout = std::chrono::milliseconds(8000);

    const auto conninfo = ep.to_connection_string();
    CHECK(conninfo.find(" keepalives=1 keepalives_idle=30 keepalives_interval=2 keepalives_count=4") !=
          std::string::npos);
    CHECK(conninfo.find(" tcp_user_timeout=8000") != std::string::npos);
}

TEST_CASE("Endpoint: zero keepalive settings fall back to libpq defaults", "[endpoint]") {
    EndpointConfig ep;
    ep.keepalives_idle = std::chrono::seconds(0);
    ep.tcp_user_timeout = std::chrono::milliseconds(0);

    const auto conninfo = ep.to_connection_string();
    CHECK(conninfo.find("keepalives") == std::string::npos);
    CHECK(conninfo.find("tcp_user_timeout") == std::string::npos);
}

TEST_CASE("Endpoint: quotes and backslashes escaped", "[endpoint]") {
    EndpointConfig ep;
    ep.password = R"(it's a \secret)";
    ep.application_name.clear();

    const auto conninfo = ep.to_connection_string();
    CHECK(conninfo.find(R"(password='it\'s a \\secret')") != std::string::npos);
    CHECK(conninfo.find("application_name") == std::string::npos);
}

TEST_CASE("Endpoint: empty password omitted", "[endpoint]") {
    EndpointConfig ep;
    CHECK(ep.to_connection_string().find("password") == std::string::npos);
}

TEST_CASE("Endpoint: describe hides credentials", "[endpoint]") {
    EndpointConfig ep;
    ep.host = "replica-2";
    ep.port = 5434;
    ep.password = "hunter2";
    CHECK(ep.describe() == "replica-2:5434/testdb");
}
