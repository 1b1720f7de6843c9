#include <catch2/catch_test_macros.hpp>
#include "replication/log_position.hpp"

using namespace readrouter;

TEST_CASE("LogPosition: parses hi/lo hex", "[position]") {
    const auto pos = LogPosition::parse("16/B374D848");
    REQUIRE(pos.has_value());
    CHECK(pos->value() == ((uint64_t{0x16} << 32) | 0xB374D848));
}

TEST_CASE("LogPosition: lowercase hex accepted", "[position]") {
    const auto pos = LogPosition::parse("0/a0");
    REQUIRE(pos.has_value());
    CHECK(pos->value() == 0xA0);
}

TEST_CASE("LogPosition: native order differs from text order", "[position]") {
    const auto a = LogPosition::parse("0/A0");
    const auto b = LogPosition::parse("0/100");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    // "0/A0" sorts after "0/100" as text but precedes it in the log
    CHECK(std::string("0/A0") > std::string("0/100"));
    CHECK(*a < *b);
    CHECK(a->compare(*b) == std::strong_ordering::less);
}

TEST_CASE("LogPosition: high word dominates", "[position]") {
    const auto a = LogPosition::parse("1/0");
    const auto b = LogPosition::parse("0/FFFFFFFF");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a > *b);
    CHECK(a->reached(*b));
    CHECK_FALSE(b->reached(*a));
}

TEST_CASE("LogPosition: reached is inclusive", "[position]") {
    const LogPosition p(0x3000060);
    CHECK(p.reached(p));
    CHECK(p.compare(LogPosition(0x3000060)) == std::strong_ordering::equal);
    CHECK(p == LogPosition(0x3000060));
}

TEST_CASE("LogPosition: invalid text rejected", "[position]") {
    CHECK_FALSE(LogPosition::parse("").has_value());
    CHECK_FALSE(LogPosition::parse("0").has_value());
    CHECK_FALSE(LogPosition::parse("/A0").has_value());
    CHECK_FALSE(LogPosition::parse("0/").has_value());
    CHECK_FALSE(LogPosition::parse("0/G1").has_value());
    CHECK_FALSE(LogPosition::parse("0/A0 ").has_value());
    CHECK_FALSE(LogPosition::parse("0/1/2").has_value());
    CHECK_FALSE(LogPosition::parse("123456789/0").has_value());
    CHECK_FALSE(LogPosition::parse("-1/0").has_value());
}

TEST_CASE("LogPosition: to_string uses PostgreSQL form", "[position]") {
    CHECK(LogPosition((uint64_t{0x16} << 32) | 0xB374D848).to_string() == "16/B374D848");
    CHECK(LogPosition(0).to_string() == "0/0");

    const auto parsed = LogPosition::parse("0/a0");
    REQUIRE(parsed.has_value());
    CHECK(parsed->to_string() == "0/A0");
}
