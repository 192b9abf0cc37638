#include <shylock/app/main/BuildInfo.h>

#include <doctest/doctest.h>

using namespace shylock;

TEST_SUITE_BEGIN("BuildInfo");

TEST_CASE("version strings")
{
    auto const& version = BuildInfo::getVersionString();
    CHECK(!version.empty());
    CHECK(BuildInfo::getFullVersionString() == "shylock-" + version);
}

TEST_SUITE_END();
