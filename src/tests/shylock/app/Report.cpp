#include <shylock/app/main/Report.h>
#include <shylock/app/statement/StatementFormatter.h>
#include <shylock/ledger/LedgerErrors.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <tests/libshylock/CaptureSink.h>
#include <tests/libshylock/LoanFixtures.h>

#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace shylock;
using test::day;
using test::pay;

namespace {

LoanConfig
standardLoan()
{
    LoanConfig loan;
    loan.terms = test::standardTerms();
    return loan;
}

std::string
readFile(std::string const& path)
{
    std::ifstream file(path);
    std::ostringstream data;
    data << file.rdbuf();
    return data.str();
}

}  // namespace

TEST_SUITE_BEGIN("Report");

TEST_CASE("capitalization ledger as CSV")
{
    std::ostringstream log;
    Logs logs(severities::kWarning, log);

    CHECK(
        renderReport(
            standardLoan(),
            {pay(2023, 2, 10, 50000)},
            day(2023, 6, 30),
            ReportFormat::csv,
            logs) ==
        "Due Date,Payment Date (Posted),Days Late,Payment Amount (Posted),"
        "Accrued Interest (Cycle),Late Fee (Assessed),"
        "Allocated to Principal,Principal Balance (End)\n"
        "2023-02-28,2023-02-10,0,460.27,460.27,0.00,0.00,100000.00\n"
        "2023-03-31,,91,39.73,509.59,50.00,0.00,100050.00\n");
}

TEST_CASE("waterfall policy selects the waterfall ledger")
{
    std::ostringstream log;
    Logs logs(severities::kWarning, log);

    auto loan = standardLoan();
    loan.policy = LedgerPolicy::waterfall;
    PaymentEvents const payments{
        pay(2023, 2, 10, 50000), pay(2023, 4, 20, 120000)};

    test::CaptureSink sink;
    std::ostringstream expected;
    writeWaterfallCsv(
        expected,
        WaterfallEngine(Journal(sink)).compute(loan.terms, payments));

    CHECK(
        renderReport(
            loan, payments, day(2023, 6, 30), ReportFormat::csv, logs) ==
        expected.str());
}

TEST_CASE("invalid terms throw before anything is rendered")
{
    std::ostringstream log;
    Logs logs(severities::kWarning, log);

    auto loan = standardLoan();
    loan.terms.principal = Money{-1};

    CHECK_THROWS_AS(
        renderReport(
            loan, {}, day(2023, 6, 30), ReportFormat::statement, logs),
        InvalidTerms);

    loan.policy = LedgerPolicy::waterfall;
    CHECK_THROWS_AS(
        renderReport(loan, {}, day(2023, 6, 30), ReportFormat::csv, logs),
        InvalidTerms);
}

TEST_CASE("report file")
{
    std::string const path = "shylock-report-test.txt";

    SUBCASE("replaces earlier contents")
    {
        REQUIRE(writeReportFile(path, "first report\n"));
        REQUIRE(writeReportFile(path, "second\n"));
        CHECK(readFile(path) == "second\n");
        std::remove(path.c_str());
    }

    SUBCASE("unopenable path")
    {
        auto const written =
            writeReportFile("no-such-shylock-dir/report.txt", "text");
        REQUIRE(!written);
        CHECK(
            written.error() ==
            "Unable to open output file: no-such-shylock-dir/report.txt");
    }
}

TEST_SUITE_END();
