#include <shylock/basics/Expected.h>

#include <doctest/doctest.h>

#include <string>

using namespace shylock;

namespace {

Expected<int, std::string>
half(int value)
{
    if (value % 2 != 0)
        return Unexpected(std::string("odd"));
    return value / 2;
}

Expected<void, std::string>
check(bool ok)
{
    if (!ok)
        return Unexpected(std::string("failed"));
    return {};
}

}  // namespace

TEST_SUITE_BEGIN("Expected");

TEST_CASE("value")
{
    auto const result = half(10);
    REQUIRE(result);
    CHECK(*result == 5);
    CHECK(result.value() == 5);
    CHECK_THROWS_AS(result.error(), bad_expected_access);
}

TEST_CASE("error")
{
    auto const result = half(3);
    CHECK(!result);
    CHECK(result.error() == "odd");
    CHECK_THROWS_AS(result.value(), bad_expected_access);
}

TEST_CASE("void specialization")
{
    CHECK(check(true));
    auto const bad = check(false);
    CHECK(!bad);
    CHECK(bad.error() == "failed");
}

TEST_SUITE_END();
