#include <shylock/ledger/PaymentNormalizer.h>

#include <tests/libshylock/CaptureSink.h>
#include <tests/libshylock/LoanFixtures.h>

#include <doctest/doctest.h>

#include <limits>
#include <sstream>
#include <stdexcept>

using namespace shylock;
using test::day;
using test::pay;

TEST_SUITE_BEGIN("PaymentNormalizer");

TEST_CASE("sort, drop and pool")
{
    test::CaptureSink sink;
    Journal const j(sink);

    PaymentEvents const raw{
        pay(2023, 3, 15, 10000),
        pay(2023, 1, 15, 99999),
        pay(2023, 2, 10, 20000),
        pay(2023, 2, 11, 0),
        pay(2023, 2, 10, 30000),
        pay(2023, 2, 12, -500),
        pay(2023, 1, 31, 100),
    };

    auto const events = normalizePayments(raw, day(2023, 1, 31), j);

    PaymentEvents const expected{
        pay(2023, 1, 31, 100),
        pay(2023, 2, 10, 50000),
        pay(2023, 3, 15, 10000),
    };
    CHECK(events == expected);

    CHECK(sink.contains(
        severities::kWarning,
        "Dropping 1 payment(s) dated before origination 2023-01-31; "
        "earliest is 2023-01-15"));
    CHECK(sink.contains(severities::kDebug, "non-positive payment of -5.00"));
}

TEST_CASE("normalized input is returned unchanged")
{
    test::CaptureSink sink;
    PaymentEvents const events{
        pay(2023, 2, 28, 46027),
        pay(2023, 3, 31, 50959),
    };
    CHECK(normalizePayments(events, day(2023, 1, 31), Journal(sink)) == events);
    CHECK(!sink.contains(severities::kWarning, "Dropping"));
}

TEST_CASE("empty input")
{
    test::CaptureSink sink;
    CHECK(normalizePayments({}, day(2023, 1, 31), Journal(sink)).empty());
}

TEST_CASE("pooling amounts past the largest balance throws")
{
    test::CaptureSink sink;
    auto const huge = std::numeric_limits<Money::value_type>::max() / 2 + 1;
    PaymentEvents const raw{
        pay(2023, 2, 10, huge),
        pay(2023, 2, 10, huge),
    };
    CHECK_THROWS_AS(
        normalizePayments(raw, day(2023, 1, 31), Journal(sink)),
        std::overflow_error);
}

TEST_CASE("splitCsvLine")
{
    using detail::splitCsvLine;

    CHECK(splitCsvLine("a,b,c") == std::vector<std::string>{"a", "b", "c"});
    CHECK(
        splitCsvLine("2023-02-10,\"$1,000.00\"") ==
        std::vector<std::string>{"2023-02-10", "$1,000.00"});
    CHECK(
        splitCsvLine("\"say \"\"hi\"\"\",x\r") ==
        std::vector<std::string>{"say \"hi\"", "x"});
    CHECK(splitCsvLine("") == std::vector<std::string>{""});
    CHECK(splitCsvLine("a,") == std::vector<std::string>{"a", ""});
}

TEST_CASE("readPaymentRows")
{
    SUBCASE("Date and Amount in any order and case")
    {
        std::istringstream in(
            "\xEF\xBB\xBF"
            " Amount , Memo, DATE\n"
            "\"$500.00\",rent,2023-02-10\n"
            "\n"
            "600,,3/15/2023\n");

        auto const rows = readPaymentRows(in);
        REQUIRE(rows);
        REQUIRE(rows->size() == 2);
        CHECK((*rows)[0].line == 2);
        CHECK((*rows)[0].date == "2023-02-10");
        CHECK((*rows)[0].amount == "$500.00");
        CHECK((*rows)[1].line == 4);
        CHECK((*rows)[1].date == "3/15/2023");
        CHECK((*rows)[1].amount == "600");
    }

    SUBCASE("Payment Date is accepted")
    {
        std::istringstream in("\n\nPayment Date,Amount\n2023-02-10,1\n");
        auto const rows = readPaymentRows(in);
        REQUIRE(rows);
        REQUIRE(rows->size() == 1);
        CHECK(rows->front().line == 4);
    }

    SUBCASE("short rows leave fields empty")
    {
        std::istringstream in("Date,Amount\n2023-02-10\n");
        auto const rows = readPaymentRows(in);
        REQUIRE(rows);
        REQUIRE(rows->size() == 1);
        CHECK(rows->front().amount.empty());
    }

    SUBCASE("missing columns")
    {
        std::istringstream in("When,How Much\n2023-02-10,1\n");
        auto const rows = readPaymentRows(in);
        REQUIRE(!rows);
        CHECK(
            rows.error() ==
            "CSV must include columns: Date, Amount "
            "(or Payment Date, Amount)");
    }

    SUBCASE("empty file")
    {
        std::istringstream in("");
        CHECK(!readPaymentRows(in));
    }
}

TEST_CASE("cleanPaymentRows")
{
    test::CaptureSink sink;

    PaymentRows const rows{
        {2, "2023-02-10", "$500.00"},
        {3, "02/30/2023", "100"},
        {4, "2023-03-01", "lots"},
        {5, "2023-03-02", "0"},
        {6, "2023-03-03", "(25.00)"},
        {7, "3/15/2023", "\"600\""},
        {8, "3/16/2023", "1,234.5"},
    };

    auto const cleaned = cleanPaymentRows(rows, Journal(sink));

    CHECK(cleaned.badDate == 1);
    CHECK(cleaned.badAmount == 2);
    CHECK(cleaned.nonPositive == 2);
    CHECK(cleaned.dropped() == 5);

    PaymentEvents const expected{
        pay(2023, 2, 10, 50000),
        pay(2023, 3, 16, 123450),
    };
    CHECK(cleaned.events == expected);

    CHECK(sink.contains(severities::kDebug, "Line 3: unparsable date"));
    CHECK(sink.contains(severities::kWarning, "Dropped 5 of 7 payment row(s)"));
    CHECK(sink.contains(severities::kInfo, "Loaded 2 payment(s)"));
}

TEST_SUITE_END();
