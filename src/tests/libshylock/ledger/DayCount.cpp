#include <shylock/ledger/DayCount.h>

#include <doctest/doctest.h>

#include <stdexcept>

using namespace shylock;

TEST_SUITE_BEGIN("DayCount");

TEST_CASE("actual/365 accrual")
{
    Rate const six{6, 2};

    // 100,000.00 for the 28 days of February 2023
    CHECK(accrueInterest(Money{10'000'000}, six, 28) == Money{46027});
    CHECK(accrueInterest(Money{10'000'000}, six, 31) == Money{50959});
    CHECK(accrueInterest(Money{10'000'000}, six, 30) == Money{49315});
    CHECK(accrueInterest(Money{10'000'000}, six, 365) == Money{600'000});

    // A leap year still divides by 365
    CHECK(accrueInterest(Money{10'000'000}, six, 366) == Money{601'644});
}

TEST_CASE("half up at the cent")
{
    Rate const one{1, 2};

    // 36.50 * 0.01 * 5 / 365 is exactly half a cent
    CHECK(accrueInterest(Money{3650}, one, 5) == Money{1});
    CHECK(accrueInterest(Money{3650}, one, 4) == Money{0});
}

TEST_CASE("zero inputs accrue nothing")
{
    CHECK(accrueInterest(Money{}, Rate{6, 2}, 30) == Money{});
    CHECK(accrueInterest(Money{10'000'000}, Rate{}, 30) == Money{});
    CHECK(accrueInterest(Money{10'000'000}, Rate{6, 2}, 0) == Money{});
}

TEST_CASE("negative spans and rates are rejected")
{
    CHECK_THROWS_AS(
        accrueInterest(Money{10'000'000}, Rate{6, 2}, -1),
        std::invalid_argument);
    CHECK_THROWS_AS(
        accrueInterest(Money{10'000'000}, Rate{-6, 2}, 30),
        std::invalid_argument);
}

TEST_CASE("negative balances keep their sign")
{
    CHECK(accrueInterest(Money{-10'000'000}, Rate{6, 2}, 28) == Money{-46027});
}

TEST_CASE("applyRate")
{
    CHECK(applyRate(Money{100}, Rate{50, 0}) == Money{5000});
    CHECK(applyRate(Money{100}, Rate{2550, 2}) == Money{2550});
    CHECK(applyRate(Money{46027}, Rate{1, 1}) == Money{4603});
    CHECK(applyRate(Money{5}, Rate{1, 1}) == Money{1});
    CHECK(applyRate(Money{4}, Rate{1, 1}) == Money{0});
    CHECK_THROWS_AS(applyRate(Money{100}, Rate{-1, 0}), std::invalid_argument);
}

TEST_SUITE_END();
