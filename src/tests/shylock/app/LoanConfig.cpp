#include <shylock/app/loan/LoanConfig.h>

#include <doctest/doctest.h>

using namespace shylock;

namespace {

BasicConfig
parse(std::string const& text)
{
    BasicConfig config;
    config.loadFromString(text);
    return config;
}

std::string const minimal =
    "[loan]\n"
    "principal = $100,000.00\n"
    "origination_date = 2023-01-31\n"
    "annual_rate = 6%\n";

}  // namespace

TEST_SUITE_BEGIN("LoanConfig");

TEST_CASE("required keys with defaults for the rest")
{
    auto const loaded = loadLoanConfig(parse(minimal));
    REQUIRE(loaded);

    auto const& terms = loaded->terms;
    CHECK(terms.principal == Money{10'000'000});
    CHECK(terms.originationDate == Date(2023, 1, 31));
    CHECK(terms.annualRate == Rate{6, 2});
    CHECK(terms.lateFeePolicy.kind == LateFeePolicy::Kind::fixed);
    CHECK(terms.lateFeePolicy.amount == Rate{});
    CHECK(terms.lateFeePolicy.graceDays == 0);
    CHECK(!terms.penaltyRate);

    CHECK(loaded->policy == LedgerPolicy::capitalize);
    CHECK(!loaded->asOf);
    CHECK(loaded->statement.loanName == "Loan");
    CHECK(loaded->statement.lenderName.empty());
    CHECK(loaded->statement.rowsPerPage == 24);
}

TEST_CASE("every section")
{
    auto const loaded = loadLoanConfig(parse(
        minimal +
        "name = Ridgeview Note\n"
        "lender = Antonio\n"
        "borrower = Bassanio\n"
        "[late_fee]\n"
        "type = Percent\n"
        "amount = 10\n"
        "grace_days = 15\n"
        "[penalty]\n"
        "rate = 0.18\n"
        "[ledger]\n"
        "policy = waterfall\n"
        "as_of = 06/30/2023\n"
        "[statement]\n"
        "rows_per_page = 12\n"));
    REQUIRE(loaded);

    auto const& terms = loaded->terms;
    CHECK(
        terms.lateFeePolicy.kind ==
        LateFeePolicy::Kind::percentOfCycleInterest);
    CHECK(terms.lateFeePolicy.amount == Rate{10, 0});
    CHECK(terms.lateFeePolicy.graceDays == 15);
    CHECK(terms.penaltyRate == Rate{18, 2});

    CHECK(loaded->policy == LedgerPolicy::waterfall);
    CHECK(loaded->asOf == Date(2023, 6, 30));
    CHECK(loaded->statement.loanName == "Ridgeview Note");
    CHECK(loaded->statement.lenderName == "Antonio");
    CHECK(loaded->statement.borrowerName == "Bassanio");
    CHECK(loaded->statement.rowsPerPage == 12);
}

TEST_CASE("missing required keys")
{
    auto loaded = loadLoanConfig(parse(""));
    REQUIRE(!loaded);
    CHECK(loaded.error() == "Missing required [loan] principal");

    loaded = loadLoanConfig(parse("[loan]\nprincipal=1\nannual_rate=0.06\n"));
    REQUIRE(!loaded);
    CHECK(loaded.error() == "Missing required [loan] origination_date");

    loaded = loadLoanConfig(
        parse("[loan]\nprincipal=1\norigination_date=2023-01-31\n"));
    REQUIRE(!loaded);
    CHECK(loaded.error() == "Missing required [loan] annual_rate");
}

TEST_CASE("malformed values name the key")
{
    auto const bad = [](std::string const& extra) {
        auto const loaded = loadLoanConfig(parse(minimal + extra));
        REQUIRE(!loaded);
        return loaded.error();
    };

    CHECK(bad("[late_fee]\ntype = flat\n") ==
          "Invalid value for [late_fee] type: 'flat'");
    CHECK(bad("[late_fee]\ngrace_days = ten\n") ==
          "Invalid value for [late_fee] grace_days: 'ten'");
    CHECK(bad("[late_fee]\namount = lots\n") ==
          "Invalid value for [late_fee] amount: 'lots'");
    CHECK(bad("[penalty]\nrate = high\n") ==
          "Invalid value for [penalty] rate: 'high'");
    CHECK(bad("[ledger]\npolicy = amortize\n") ==
          "Invalid value for [ledger] policy: 'amortize'");
    CHECK(bad("[ledger]\nas_of = someday\n") ==
          "Invalid value for [ledger] as_of: 'someday'");
    CHECK(bad("[statement]\nrows_per_page = 0\n") ==
          "Invalid value for [statement] rows_per_page: '0'");
    CHECK(bad("[statement]\nrows_per_page = -1\n") ==
          "Invalid value for [statement] rows_per_page: '-1'");

    auto const loaded = loadLoanConfig(parse(
        "[loan]\nprincipal = 12abc\norigination_date = 2023-01-31\n"
        "annual_rate = 0.06\n"));
    REQUIRE(!loaded);
    CHECK(loaded.error() == "Invalid value for [loan] principal: '12abc'");
}

TEST_CASE("command line values overwrite the file")
{
    auto config = parse(minimal + "[ledger]\npolicy = waterfall\n");
    config.overwrite(ConfigSection::ledger(), "policy", "capitalize");
    config.overwrite(ConfigSection::ledger(), "as_of", "2023-07-01");

    auto const loaded = loadLoanConfig(config);
    REQUIRE(loaded);
    CHECK(loaded->policy == LedgerPolicy::capitalize);
    CHECK(loaded->asOf == Date(2023, 7, 1));
}

TEST_CASE("policy names")
{
    CHECK(policyFromString("Waterfall") == LedgerPolicy::waterfall);
    CHECK(policyFromString("CAPITALIZE") == LedgerPolicy::capitalize);
    CHECK(!policyFromString("simple"));
    CHECK(to_string(LedgerPolicy::waterfall) == "waterfall");
    CHECK(to_string(LedgerPolicy::capitalize) == "capitalize");
}

TEST_CASE("unreadable loan file")
{
    BasicConfig config;
    auto const result =
        readConfigFile("/nonexistent/shylock/loan.cfg", config);
    REQUIRE(!result);
    CHECK(result.error() == "Unable to open loan file: "
                            "/nonexistent/shylock/loan.cfg");
}

TEST_SUITE_END();
