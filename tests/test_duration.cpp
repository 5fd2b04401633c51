#include <catch2/catch_test_macros.hpp>
#include "core/duration.hpp"

using namespace bwproxy;
using namespace std::chrono_literals;

TEST_CASE("Duration: single units", "[duration]") {
    CHECK(duration::parse("2m") == std::chrono::nanoseconds(2min));
    CHECK(duration::parse("1s") == std::chrono::nanoseconds(1s));
    CHECK(duration::parse("10ms") == std::chrono::nanoseconds(10ms));
    CHECK(duration::parse("250us") == std::chrono::nanoseconds(250us));
    CHECK(duration::parse("5ns") == std::chrono::nanoseconds(5));
    CHECK(duration::parse("3h") == std::chrono::nanoseconds(3h));
}

TEST_CASE("Duration: compound and fractional values", "[duration]") {
    CHECK(duration::parse("1h30m") == std::chrono::nanoseconds(90min));
    CHECK(duration::parse("1m30s") == std::chrono::nanoseconds(90s));
    CHECK(duration::parse("1.5s") == std::chrono::nanoseconds(1500ms));
    CHECK(duration::parse(".5m") == std::chrono::nanoseconds(30s));
    CHECK(duration::parse("2m0s") == std::chrono::nanoseconds(2min));
}

TEST_CASE("Duration: zero and signs", "[duration]") {
    CHECK(duration::parse("0") == std::chrono::nanoseconds(0));
    CHECK(duration::parse("0s") == std::chrono::nanoseconds(0));
    CHECK(duration::parse("-1s") == std::chrono::nanoseconds(-1s));
    CHECK(duration::parse("+1s") == std::chrono::nanoseconds(1s));
}

TEST_CASE("Duration: malformed input", "[duration]") {
    CHECK_FALSE(duration::parse("").has_value());
    CHECK_FALSE(duration::parse("banana").has_value());
    CHECK_FALSE(duration::parse("2").has_value());
    CHECK_FALSE(duration::parse("m").has_value());
    CHECK_FALSE(duration::parse("2 m").has_value());
    CHECK_FALSE(duration::parse("2x").has_value());
    CHECK_FALSE(duration::parse(".s").has_value());
    CHECK_FALSE(duration::parse("-").has_value());
    CHECK_FALSE(duration::parse("99999999999999999999h").has_value());
}

TEST_CASE("Duration: format", "[duration]") {
    CHECK(duration::format(2min) == "2m0s");
    CHECK(duration::format(1s) == "1s");
    CHECK(duration::format(1500ms) == "1.5s");
    CHECK(duration::format(10ms) == "10ms");
    CHECK(duration::format(90min) == "1h30m0s");
    CHECK(duration::format(0s) == "0s");
    CHECK(duration::format(std::chrono::nanoseconds(5)) == "5ns");
}
