#include <shylock/basics/Rate.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace shylock;

TEST_SUITE_BEGIN("Rate");

TEST_CASE("parse decimal and percent forms")
{
    auto const six = rateFromString("0.06");
    REQUIRE(six);
    CHECK(six->mantissa() == 6);
    CHECK(six->scale() == 2);

    CHECK(rateFromString("6%") == six);
    CHECK(rateFromString(" 6 % ") == six);
    CHECK(rateFromString("0.0600") == six);
    CHECK(rateFromString("6.5%") == Rate{65, 3});
    CHECK(rateFromString("18") == Rate{18, 0});
    CHECK(rateFromString("-0.5") == Rate{-5, 1});
    CHECK(rateFromString("+0.5") == Rate{5, 1});

    CHECK(!rateFromString(""));
    CHECK(!rateFromString("%"));
    CHECK(!rateFromString("six"));
    CHECK(!rateFromString("0.1.2"));
    CHECK(!rateFromString("0.0000000000001"));
}

TEST_CASE("trailing zeros do not count against the scale")
{
    auto const r = rateFromString("0.060000000000000");
    REQUIRE(r);
    CHECK(*r == Rate{6, 2});
}

TEST_CASE("comparison across scales")
{
    CHECK(Rate{6, 2} == Rate{600, 4});
    CHECK(Rate{6, 2} != Rate{61, 3});
    CHECK(Rate{6, 2} < Rate{61, 3});
    CHECK(Rate{-1, 0} < Rate{});
    CHECK(!Rate{});
    CHECK(Rate{-3, 1}.signum() == -1);
}

TEST_CASE("to_string")
{
    CHECK(to_string(Rate{6, 2}) == "0.06");
    CHECK(to_string(Rate{600, 4}) == "0.06");
    CHECK(to_string(Rate{50, 0}) == "50");
    CHECK(to_string(Rate{125, 1}) == "12.5");
    CHECK(to_string(Rate{-5, 1}) == "-0.5");
    CHECK(to_string(Rate{}) == "0");
}

TEST_CASE("formatPercent")
{
    CHECK(formatPercent(Rate{6, 2}) == "6.000%");
    CHECK(formatPercent(Rate{675, 4}) == "6.750%");
    CHECK(formatPercent(Rate{18, 2}, 1) == "18.0%");
    CHECK(formatPercent(Rate{123456, 7}, 3) == "1.235%");
    CHECK(formatPercent(Rate{}, 0) == "0%");
}

TEST_CASE("scale limit")
{
    CHECK_NOTHROW(Rate{1, Rate::maxScale});
    CHECK_THROWS_AS(Rate(1, Rate::maxScale + 1), std::invalid_argument);
}

TEST_SUITE_END();
