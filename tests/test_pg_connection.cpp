#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_connection.hpp"
#include "db/endpoint.hpp"

using namespace readrouter;
using namespace std::chrono_literals;

TEST_CASE("PgConnection: client deadline outlasts statement_timeout", "[pg]") {
    CHECK(PgConnection::client_deadline(5000) == 5000ms + PgConnection::kDeadlineGrace);
    CHECK(PgConnection::client_deadline(1) > 1ms);
}

TEST_CASE("PgConnection: no statement_timeout means no client deadline", "[pg]") {
    CHECK(PgConnection::client_deadline(0) == 0ms);
}

TEST_CASE("PgConnectionFactory: unreachable endpoint yields no connection", "[pg]") {
    EndpointConfig ep;
    ep.host = "127.0.0.1";
    ep.port = 1;                                   // Nothing listens on tcpmux
    ep.connect_timeout = std::chrono::seconds(2);

    PgConnectionFactory factory;
    CHECK(factory.create(ep.to_connection_string()) == nullptr);
}
