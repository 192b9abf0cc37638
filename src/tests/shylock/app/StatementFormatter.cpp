#include <shylock/app/statement/StatementFormatter.h>
#include <shylock/ledger/LedgerEngine.h>
#include <shylock/ledger/LedgerSummary.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <tests/libshylock/CaptureSink.h>
#include <tests/libshylock/LoanFixtures.h>

#include <doctest/doctest.h>

#include <limits>
#include <sstream>

using namespace shylock;
using test::day;
using test::pay;

namespace {

Ledger
lateThenOpen(LoanTerms const& terms)
{
    test::CaptureSink sink;
    return LedgerEngine(Journal(sink))
        .compute(terms, {pay(2023, 2, 10, 50000)}, day(2023, 6, 30));
}

StatementContext
context()
{
    StatementContext c;
    c.loanName = "Ridgeview Note";
    c.lenderName = "Antonio";
    c.borrowerName = "Bassanio";
    c.generatedOn = day(2026, 10, 18);
    return c;
}

// The first line of `text` that starts with `prefix`
std::string
lineStarting(std::string const& text, std::string const& prefix)
{
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        if (line.compare(0, prefix.size(), prefix) == 0)
            return line;
    return {};
}

bool
endsWith(std::string const& s, std::string const& suffix)
{
    return s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

TEST_SUITE_BEGIN("StatementFormatter");

TEST_CASE("ledger CSV")
{
    std::ostringstream os;
    writeLedgerCsv(os, lateThenOpen(test::standardTerms()));

    CHECK(
        os.str() ==
        "Due Date,Payment Date (Posted),Days Late,Payment Amount (Posted),"
        "Accrued Interest (Cycle),Late Fee (Assessed),"
        "Allocated to Principal,Principal Balance (End)\n"
        "2023-02-28,2023-02-10,0,460.27,460.27,0.00,0.00,100000.00\n"
        "2023-03-31,,91,39.73,509.59,50.00,0.00,100050.00\n");
}

TEST_CASE("empty ledger CSV is just the header")
{
    std::ostringstream os;
    writeLedgerCsv(os, {});
    CHECK(os.str().find('\n') == os.str().size() - 1);
}

TEST_CASE("statement")
{
    auto const terms = test::standardTerms();
    auto const ledger = lateThenOpen(terms);

    std::ostringstream os;
    writeStatement(os, context(), terms, ledger, summarize(terms, ledger));
    auto const text = os.str();

    SUBCASE("heading")
    {
        CHECK(
            text.rfind(
                "Loan Statement\n"
                "Ridgeview Note - Generated Oct 18, 2026\n"
                "\n"
                "Lender: Antonio\n"
                "Borrower: Bassanio\n"
                "Origination: 01/31/2023\n"
                "APR: 6.000% (ACT/365 simple interest)\n",
                0) == 0);
    }

    SUBCASE("totals")
    {
        CHECK(endsWith(
            lineStarting(text, "Beginning Principal Balance:"),
            " $100,000.00"));
        CHECK(endsWith(
            lineStarting(text, "Payments Posted (Total):"), " $500.00"));
        CHECK(endsWith(
            lineStarting(text, "Accrued Interest (All Cycles):"), " $969.86"));
        CHECK(endsWith(
            lineStarting(text, "Late Fees Assessed (Total):"), " $50.00"));
        CHECK(endsWith(
            lineStarting(text, "Allocated to Principal (Total):"), " $0.00"));
        CHECK(endsWith(
            lineStarting(text, "Ending Principal Balance:"), " $100,050.00"));
        CHECK(text.find("The final cycle is open") != std::string::npos);
    }

    SUBCASE("activity")
    {
        CHECK(text.find("Payment & Accrual Activity\n") != std::string::npos);
        CHECK(text.find("(page") == std::string::npos);

        auto const first = lineStarting(text, "02/28/2023");
        CHECK(first.find("02/10/2023") != std::string::npos);
        CHECK(first.find("$460.27") != std::string::npos);
        CHECK(endsWith(first, "$100,000.00"));

        auto const open = lineStarting(text, "03/31/2023");
        CHECK(open.find("Open") != std::string::npos);
        CHECK(open.find("$39.73") != std::string::npos);
        CHECK(endsWith(open, "$100,050.00"));
    }
}

TEST_CASE("statement pages")
{
    auto const terms = test::standardTerms();
    auto const ledger = lateThenOpen(terms);
    auto c = context();
    c.rowsPerPage = 1;

    std::ostringstream os;
    writeStatement(os, c, terms, ledger, summarize(terms, ledger));
    auto const text = os.str();

    auto const page1 = text.find("Payment & Accrual Activity (page 1 of 2)");
    auto const page2 = text.find("Payment & Accrual Activity (page 2 of 2)");
    REQUIRE(page1 != std::string::npos);
    REQUIRE(page2 != std::string::npos);
    CHECK(text.find("02/28/2023", page1) < page2);
    CHECK(text.find("03/31/2023", page2) != std::string::npos);
    CHECK(text.find("Due Date", page2) != std::string::npos);
}

TEST_CASE("one page holds the whole ledger")
{
    auto const terms = test::standardTerms();
    auto const ledger = lateThenOpen(terms);
    auto c = context();
    c.rowsPerPage = std::numeric_limits<std::size_t>::max();

    std::ostringstream os;
    writeStatement(os, c, terms, ledger, summarize(terms, ledger));
    auto const text = os.str();

    auto const heading = text.find("Payment & Accrual Activity\n");
    REQUIRE(heading != std::string::npos);
    CHECK(text.find("(page") == std::string::npos);
    CHECK(text.find("02/28/2023", heading) != std::string::npos);
    CHECK(text.find("03/31/2023", heading) != std::string::npos);
}

TEST_CASE("statement without activity")
{
    auto const terms = test::standardTerms();
    auto c = context();
    c.generatedOn = Date();

    std::ostringstream os;
    writeStatement(os, c, terms, {}, summarize(terms, Ledger{}));
    auto const text = os.str();

    CHECK(text.find("Ridgeview Note\n") != std::string::npos);
    CHECK(text.find("Generated") == std::string::npos);
    CHECK(text.find("No activity.") != std::string::npos);
}

TEST_CASE("waterfall output")
{
    test::CaptureSink sink;
    auto terms = test::standardTerms();
    terms.principal = Money{100'000};
    terms.annualRate = Rate{12, 2};
    terms.penaltyRate = Rate{18, 2};

    auto const ledger = WaterfallEngine(Journal(sink))
                            .compute(terms, {pay(2023, 2, 15, 200'000)});

    SUBCASE("CSV")
    {
        std::ostringstream os;
        writeWaterfallCsv(os, ledger);
        CHECK(
            os.str() ==
            "Payment Date,Due Date,Payment Amount,Accrued Loan Interest,"
            "Penalty Interest Accrued,Late Fee (Assessed),"
            "Allocated to Penalty Interest,Allocated to Late Fees,"
            "Allocated to Loan Interest,Allocated to Principal,Unapplied,"
            "Principal Balance (End),Loan Interest Outstanding (End),"
            "Late Fees Outstanding (End),"
            "Penalty Interest Outstanding (End)\n"
            "2023-02-15,2023-01-31,2000.00,4.93,0.00,0.00,0.00,0.00,4.93,"
            "1000.00,995.07,0.00,0.00,0.00,0.00\n");
    }

    SUBCASE("statement")
    {
        std::ostringstream os;
        writeWaterfallStatement(
            os, context(), terms, ledger, summarize(terms, ledger));
        auto const text = os.str();

        CHECK(
            text.find("APR: 12.000% (ACT/365 simple interest)\n") !=
            std::string::npos);
        CHECK(
            text.find("Late Fee: fixed 50; Grace: 10 day(s); "
                      "Penalty APR: 18.000%\n") != std::string::npos);
        CHECK(endsWith(lineStarting(text, "Unapplied (Total):"), " $995.07"));
        CHECK(endsWith(
            lineStarting(text, "Ending Principal Balance:"), " $0.00"));

        auto const row = lineStarting(text, "02/15/2023");
        CHECK(row.find("01/31/2023") != std::string::npos);
        CHECK(row.find("$2,000.00") != std::string::npos);
    }
}

TEST_SUITE_END();
