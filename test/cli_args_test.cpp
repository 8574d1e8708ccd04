#include <catch2/catch.hpp>

#include "tools/cli_args.h"

#include <climits>
#include <string>

using namespace inkcomp;

TEST_CASE("ParseInt accepts whole base-10 ints", "[cli]") {
    int n = 0;
    REQUIRE(cli::ParseInt("250", n));
    CHECK(n == 250);
    REQUIRE(cli::ParseInt("-5", n));
    CHECK(n == -5);
    REQUIRE(cli::ParseInt("2147483647", n));
    CHECK(n == INT_MAX);
    REQUIRE(cli::ParseInt("-2147483648", n));
    CHECK(n == INT_MIN);
}

TEST_CASE("ParseInt rejects junk and out-of-range values", "[cli]") {
    const std::string bad = GENERATE(as<std::string>{},
                                     "", "12x", "x12", "-", " ", "1.5",
                                     "2147483648", "-2147483649", "4294967297", "99999999999999999999999");
    int n = 7;
    CHECK_FALSE(cli::ParseInt(bad, n));
    CHECK(n == 7);
}

TEST_CASE("ParseBinding splits on the first '='", "[cli]") {
    std::string key;
    std::string value;
    REQUIRE(cli::ParseBinding("name=Ada", key, value));
    CHECK(key == "name");
    CHECK(value == "Ada");

    REQUIRE(cli::ParseBinding("expr=a=b", key, value));
    CHECK(key == "expr");
    CHECK(value == "a=b");

    REQUIRE(cli::ParseBinding("empty=", key, value));
    CHECK(value.empty());

    CHECK_FALSE(cli::ParseBinding("=value", key, value));
    CHECK_FALSE(cli::ParseBinding("novalue", key, value));
}
