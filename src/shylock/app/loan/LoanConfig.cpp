//------------------------------------------------------------------------------
/*
    This file is part of shylock, a private loan ledger engine.
    Copyright (c) 2025 The Shylock Authors.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================


#include <shylock/app/loan/LoanConfig.h>
#include <shylock/basics/Money.h>
#include <shylock/basics/Rate.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace shylock {

namespace {

std::string
where(std::string const& section, std::string const& key)
{
    return "[" + section + "] " + key;
}

template <class T, class Parse>
Expected<std::optional<T>, std::string>
optionalValue(
    BasicConfig const& config,
    std::string const& section,
    std::string const& key,
    Parse&& parse)
{
    auto const text = config[section].get(key);
    if (!text)
        return std::optional<T>{};

    std::optional<T> const value = parse(*text);
    if (!value)
        return Unexpected(
            "Invalid value for " + where(section, key) + ": '" + *text + "'");
    return value;
}

template <class T, class Parse>
Expected<T, std::string>
requiredValue(
    BasicConfig const& config,
    std::string const& section,
    std::string const& key,
    Parse&& parse)
{
    auto const value =
        optionalValue<T>(config, section, key, std::forward<Parse>(parse));
    if (!value)
        return Unexpected(value.error());
    if (!*value)
        return Unexpected("Missing required " + where(section, key));
    return **value;
}

template <class Integer>
std::optional<Integer>
integerFromString(std::string const& s)
{
    try
    {
        return boost::lexical_cast<Integer>(s);
    }
    catch (boost::bad_lexical_cast const&)
    {
        return std::nullopt;
    }
}

std::optional<LateFeePolicy::Kind>
feeKindFromString(std::string const& s)
{
    if (boost::iequals(s, "fixed"))
        return LateFeePolicy::Kind::fixed;
    if (boost::iequals(s, "percent"))
        return LateFeePolicy::Kind::percentOfCycleInterest;
    return std::nullopt;
}

}  // namespace

std::optional<LedgerPolicy>
policyFromString(std::string const& s)
{
    if (boost::iequals(s, "capitalize"))
        return LedgerPolicy::capitalize;
    if (boost::iequals(s, "waterfall"))
        return LedgerPolicy::waterfall;
    return std::nullopt;
}

std::string
to_string(LedgerPolicy policy)
{
    switch (policy)
    {
        case LedgerPolicy::capitalize:
            return "capitalize";
        case LedgerPolicy::waterfall:
            return "waterfall";
    }
    return "unknown";
}

Expected<LoanConfig, std::string>
loadLoanConfig(BasicConfig const& config)
{
    auto const loan = ConfigSection::loan();
    auto const fee = ConfigSection::lateFee();
    auto const ledger = ConfigSection::ledger();
    auto const statement = ConfigSection::statement();

    auto const money = [](std::string const& s) { return moneyFromString(s); };
    auto const rate = [](std::string const& s) { return rateFromString(s); };
    auto const date = [](std::string const& s) { return parseDate(s); };

    LoanConfig result;

    auto const principal =
        requiredValue<Money>(config, loan, "principal", money);
    if (!principal)
        return Unexpected(principal.error());
    result.terms.principal = *principal;

    auto const origination =
        requiredValue<Date>(config, loan, "origination_date", date);
    if (!origination)
        return Unexpected(origination.error());
    result.terms.originationDate = *origination;

    auto const annualRate =
        requiredValue<Rate>(config, loan, "annual_rate", rate);
    if (!annualRate)
        return Unexpected(annualRate.error());
    result.terms.annualRate = *annualRate;

    auto const kind = optionalValue<LateFeePolicy::Kind>(
        config, fee, "type", feeKindFromString);
    if (!kind)
        return Unexpected(kind.error());
    result.terms.lateFeePolicy.kind =
        kind->value_or(LateFeePolicy::Kind::fixed);

    auto const amount = optionalValue<Rate>(config, fee, "amount", rate);
    if (!amount)
        return Unexpected(amount.error());
    result.terms.lateFeePolicy.amount = amount->value_or(Rate{});

    auto const grace = optionalValue<std::int32_t>(
        config, fee, "grace_days", integerFromString<std::int32_t>);
    if (!grace)
        return Unexpected(grace.error());
    result.terms.lateFeePolicy.graceDays = grace->value_or(0);

    auto const penalty = optionalValue<Rate>(
        config, ConfigSection::penalty(), "rate", rate);
    if (!penalty)
        return Unexpected(penalty.error());
    result.terms.penaltyRate = *penalty;

    auto const policy =
        optionalValue<LedgerPolicy>(config, ledger, "policy", policyFromString);
    if (!policy)
        return Unexpected(policy.error());
    result.policy = policy->value_or(LedgerPolicy::capitalize);

    auto const asOf = optionalValue<Date>(config, ledger, "as_of", date);
    if (!asOf)
        return Unexpected(asOf.error());
    result.asOf = *asOf;

    auto const rows = optionalValue<std::size_t>(
        config, statement, "rows_per_page", [](std::string const& s) {
            // Unsigned lexical_cast wraps "-1" around instead of failing
            auto const n = integerFromString<std::int64_t>(s);
            if (!n || *n <= 0)
                return std::optional<std::size_t>{};
            return std::optional<std::size_t>(static_cast<std::size_t>(*n));
        });
    if (!rows)
        return Unexpected(rows.error());
    result.statement.rowsPerPage = rows->value_or(24);

    auto const& names = config[loan];
    result.statement.loanName = get(names, "name", "Loan");
    result.statement.lenderName = get(names, "lender", "");
    result.statement.borrowerName = get(names, "borrower", "");

    return result;
}

Expected<void, std::string>
readConfigFile(std::string const& path, BasicConfig& config)
{
    std::ifstream file(path);
    if (!file)
        return Unexpected("Unable to open loan file: " + path);

    std::ostringstream data;
    data << file.rdbuf();
    if (file.bad())
        return Unexpected("Unable to read loan file: " + path);

    config.loadFromString(data.str());
    return {};
}

}  // namespace shylock
