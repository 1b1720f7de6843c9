#include <catch2/catch_test_macros.hpp>
#include "replication/pg_position_source.hpp"
#include "mocks/mock_query_executor.hpp"

using namespace readrouter;
using namespace readrouter::testing;
using namespace std::chrono_literals;

TEST_CASE("PgPositionSource: primary reads current WAL position", "[position][pg]") {
    auto exec = std::make_shared<MockQueryExecutor>("primary");
    exec->return_value("0/3000060");
    PgPositionSource source(exec, NodeRole::PRIMARY, "primary");

    const auto report = source.current_position(1000ms);
    REQUIRE(report.is_ok());
    CHECK(report.value() == LogPosition(0x3000060));

    const auto stmts = exec->statements();
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0].sql == "SELECT pg_current_wal_lsn()::text");
    CHECK(stmts[0].timeout == 1000ms);
}

TEST_CASE("PgPositionSource: replica reads replay position", "[position][pg]") {
    auto exec = std::make_shared<MockQueryExecutor>("replica1");
    exec->return_value("1/A0");
    PgPositionSource source(exec, NodeRole::REPLICA, "replica1");

    const auto report = source.current_position(250ms);
    REQUIRE(report.is_ok());
    CHECK(report.value() == *LogPosition::parse("1/A0"));
    CHECK(exec->statements()[0].sql == "SELECT pg_last_wal_replay_lsn()::text");
    CHECK(exec->statements()[0].timeout == 250ms);
}

TEST_CASE("PgPositionSource: query failure is POSITION_UNAVAILABLE", "[position][pg]") {
    auto exec = std::make_shared<MockQueryExecutor>();
    exec->fail_with(ErrorCode::QUERY_ERROR, "canceling statement due to statement timeout");
    PgPositionSource source(exec, NodeRole::REPLICA, "replica1");

    const auto report = source.current_position(10ms);
    CHECK(report.is_error());
    CHECK(report.error_code() == ErrorCode::POSITION_UNAVAILABLE);
    CHECK(report.error_message().find("statement timeout") != std::string::npos);
}

TEST_CASE("PgPositionSource: NULL report is POSITION_UNAVAILABLE", "[position][pg]") {
    auto exec = std::make_shared<MockQueryExecutor>();
    exec->set_handler([](const Statement&) {
        QueryResult result;
        result.success = true;
        result.rows = {{""}};
        result.null_mask = {{true}};
        return result;
    });
    PgPositionSource source(exec, NodeRole::REPLICA, "replica1");

    const auto report = source.current_position(10ms);
    CHECK(report.is_error());
    CHECK(report.error_code() == ErrorCode::POSITION_UNAVAILABLE);
}

TEST_CASE("PgPositionSource: garbage report is POSITION_UNAVAILABLE", "[position][pg]") {
    auto exec = std::make_shared<MockQueryExecutor>();
    exec->return_value("not-a-position");
    PgPositionSource source(exec, NodeRole::PRIMARY, "primary");

    const auto report = source.current_position(10ms);
    CHECK(report.is_error());
    CHECK(report.error_message().find("not-a-position") != std::string::npos);
}
