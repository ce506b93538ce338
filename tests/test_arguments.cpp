#include <arguments.hpp>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

TEST_CASE("gcd::parse_number/valid", "[gcd][arguments]") {
    REQUIRE(gcd::parse_number("0") == 0);
    REQUIRE(gcd::parse_number("42") == 42);
    REQUIRE(gcd::parse_number("007") == 7);
    REQUIRE(gcd::parse_number("18446744073709551615") == UINT64_MAX);
}

TEST_CASE("gcd::parse_number/invalid", "[gcd][arguments]") {
    auto const text = GENERATE(""sv, "abc"sv, "-1"sv, "+1"sv, " 1"sv, "1 "sv, "12x"sv, "1.5"sv);
    CAPTURE(text);
    REQUIRE_THROWS_AS(gcd::parse_number(text), gcd::usage_error);
}

TEST_CASE("gcd::parse_number/overflow", "[gcd][arguments]") {
    REQUIRE_THROWS_WITH(gcd::parse_number("18446744073709551616"), Catch::Matchers::ContainsSubstring("too large"));
}

TEST_CASE("gcd::parse_arguments/numbers", "[gcd][arguments]") {
    spdlog::info("gcd::parse_arguments/numbers");
    auto const inv = gcd::parse_arguments({"9", "3", "6"});
    REQUIRE(inv.what == gcd::command::compute);
    REQUIRE(inv.numbers == std::vector<gcd::number>{9, 3, 6});
}

TEST_CASE("gcd::parse_arguments/usage-errors", "[gcd][arguments]") {
    REQUIRE_THROWS_AS(gcd::parse_arguments({}), gcd::usage_error);
    REQUIRE_THROWS_WITH(gcd::parse_arguments({"4", "four"}), Catch::Matchers::ContainsSubstring("'four'"));
}

TEST_CASE("gcd::parse_arguments/flags", "[gcd][arguments]") {
    REQUIRE(gcd::parse_arguments({"--help"}).what == gcd::command::help);
    REQUIRE(gcd::parse_arguments({"12", "-h"}).what == gcd::command::help);
    REQUIRE(gcd::parse_arguments({"--version"}).what == gcd::command::version);
    REQUIRE(gcd::parse_arguments({"-V", "--help"}).what == gcd::command::help);
    REQUIRE(gcd::parse_arguments({"-V", "nope"}).what == gcd::command::version);
}
