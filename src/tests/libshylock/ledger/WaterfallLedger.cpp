#include <shylock/ledger/LedgerErrors.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <tests/libshylock/CaptureSink.h>
#include <tests/libshylock/LoanFixtures.h>

#include <doctest/doctest.h>

using namespace shylock;
using test::day;
using test::pay;

namespace {

WaterfallLedger
run(LoanTerms const& terms, PaymentEvents const& payments)
{
    test::CaptureSink sink;
    return WaterfallEngine(Journal(sink)).compute(terms, payments);
}

}  // namespace

TEST_SUITE_BEGIN("WaterfallLedger");

TEST_CASE("payments split across penalty, fees, interest and principal")
{
    auto terms = test::standardTerms();
    terms.penaltyRate = Rate{18, 2};

    auto const ledger = run(
        terms,
        {pay(2023, 2, 10, 50000),
         pay(2023, 3, 15, 60000),
         pay(2023, 4, 30, 100000)});

    REQUIRE(ledger.size() == 3);

    SUBCASE("before the first due date nothing is late")
    {
        auto const& row = ledger[0];
        CHECK(row.paymentDate == day(2023, 2, 10));
        CHECK(row.dueDate == day(2023, 1, 31));
        CHECK(row.paymentAmount == Money{50000});
        CHECK(row.interestAccrued == Money{16438});
        CHECK(row.lateFeeAssessed == Money{});
        CHECK(row.penaltyInterestAccrued == Money{});
        CHECK(row.toInterest == Money{16438});
        CHECK(row.toPrincipal == Money{33562});
        CHECK(row.principalBalance == Money{9'966'438});
    }

    SUBCASE("past grace a fee is assessed and earns penalty interest")
    {
        auto const& row = ledger[1];
        CHECK(row.dueDate == day(2023, 2, 28));
        CHECK(row.interestAccrued == Money{54065});
        CHECK(row.lateFeeAssessed == Money{5000});
        CHECK(row.penaltyInterestAccrued == Money{81});
        CHECK(row.toPenaltyInterest == Money{81});
        CHECK(row.toLateFees == Money{5000});
        CHECK(row.toInterest == Money{54065});
        CHECK(row.toPrincipal == Money{854});
        CHECK(row.unapplied == Money{});
        CHECK(row.principalBalance == Money{9'965'584});
        CHECK(row.lateFeesOutstanding == Money{});
        CHECK(row.penaltyInterestOutstanding == Money{});
    }

    SUBCASE("a payment on the due date is on time")
    {
        auto const& row = ledger[2];
        CHECK(row.dueDate == day(2023, 4, 30));
        CHECK(row.interestAccrued == Money{75356});
        CHECK(row.lateFeeAssessed == Money{});
        CHECK(row.toInterest == Money{75356});
        CHECK(row.toPrincipal == Money{24644});
        CHECK(row.principalBalance == Money{9'940'940});
    }
}

TEST_CASE("unpaid interest carries forward")
{
    auto terms = test::standardTerms();
    terms.lateFeePolicy.kind = LateFeePolicy::Kind::percentOfCycleInterest;
    terms.lateFeePolicy.amount = Rate{10, 0};

    auto const ledger = run(terms, {pay(2023, 3, 15, 60000)});

    REQUIRE(ledger.size() == 1);
    auto const& row = ledger[0];

    // Ten percent of a month of interest on the principal
    CHECK(row.lateFeeAssessed == Money{5000});
    CHECK(row.interestAccrued == Money{70685});

    // No penalty rate: late fees accrue at the loan rate
    CHECK(row.penaltyInterestAccrued == Money{35});
    CHECK(row.toPenaltyInterest == Money{35});
    CHECK(row.toLateFees == Money{5000});
    CHECK(row.toInterest == Money{54965});
    CHECK(row.toPrincipal == Money{});
    CHECK(row.interestOutstanding == Money{15720});
    CHECK(row.principalBalance == Money{10'000'000});
}

TEST_CASE("a zero penalty rate falls back to the loan rate")
{
    auto withZero = test::standardTerms();
    withZero.penaltyRate = Rate{};
    auto const withNone = test::standardTerms();

    PaymentEvents const payments{pay(2023, 3, 15, 60000)};
    CHECK(run(withZero, payments) == run(withNone, payments));
}

TEST_CASE("payoff leaves the excess unapplied")
{
    test::CaptureSink sink;

    auto terms = test::standardTerms();
    terms.principal = Money{100'000};
    terms.annualRate = Rate{12, 2};

    auto const ledger = WaterfallEngine(Journal(sink))
                            .compute(terms, {pay(2023, 2, 15, 200'000)});

    REQUIRE(ledger.size() == 1);
    CHECK(ledger[0].interestAccrued == Money{493});
    CHECK(ledger[0].toInterest == Money{493});
    CHECK(ledger[0].toPrincipal == Money{100'000});
    CHECK(ledger[0].unapplied == Money{99'507});
    CHECK(ledger[0].principalBalance == Money{});
    CHECK(sink.contains(
        severities::kWarning,
        "Payment on 2023-02-15 exceeds the loan payoff by 995.07"));
}

TEST_CASE("no payments, no rows")
{
    CHECK(run(test::standardTerms(), {}).empty());
}

TEST_CASE("invalid terms are rejected")
{
    auto terms = test::standardTerms();
    terms.penaltyRate = Rate{-18, 2};
    CHECK_THROWS_AS(run(terms, {}), InvalidTerms);
}

TEST_CASE("assessWaterfallLateFee")
{
    LateFeePolicy percent;
    percent.kind = LateFeePolicy::Kind::percentOfCycleInterest;
    percent.amount = Rate{10, 0};

    CHECK(
        assessWaterfallLateFee(Money{10'000'000}, Rate{6, 2}, percent) ==
        Money{5000});
    CHECK(
        assessWaterfallLateFee(Money{12'345'678}, Rate{7, 2}, percent) ==
        Money{7202});
    CHECK(assessWaterfallLateFee(Money{}, Rate{6, 2}, percent) == Money{});
    CHECK(
        assessWaterfallLateFee(Money{10'000'000}, Rate{}, percent) == Money{});

    LateFeePolicy fixed;
    fixed.amount = Rate{35, 0};
    CHECK(
        assessWaterfallLateFee(Money{10'000'000}, Rate{6, 2}, fixed) ==
        Money{3500});
}

TEST_SUITE_END();
