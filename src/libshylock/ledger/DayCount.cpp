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


#include <shylock/basics/contract.h>
#include <shylock/basics/mulDiv.h>
#include <shylock/ledger/DayCount.h>

#include <stdexcept>

namespace shylock {

namespace {

// Multiplies a signed amount by a non-negative factor and divides,
// carrying the sign of the amount through. Rounds half away from zero.
Money
scaleMoney(Money const& amount, std::uint64_t mul, std::uint64_t div)
{
    auto const minor = amount.minorUnits();
    std::uint64_t const magnitude = minor < 0
        ? std::uint64_t{0} - static_cast<std::uint64_t>(minor)
        : static_cast<std::uint64_t>(minor);

    auto const result = static_cast<Money::value_type>(
        mulDivThrow(magnitude, mul, div, Rounding::halfUp));
    return Money{minor < 0 ? -result : result};
}

std::uint64_t
rateMagnitude(Rate const& rate)
{
    if (rate.signum() < 0)
        Throw<std::invalid_argument>(
            "negative rate cannot be applied: " + to_string(rate));
    return static_cast<std::uint64_t>(rate.mantissa());
}

}  // namespace

Money
accrueInterest(
    Money const& balance,
    Rate const& annualRate,
    std::int64_t days)
{
    if (days < 0)
        Throw<std::invalid_argument>(
            "accrual span is negative: " + std::to_string(days) + " days");

    if (days == 0 || !balance || !annualRate)
        return Money{};

    // mantissa * days stays well inside 64 bits for any sane rate and span;
    // mulDivThrow reports it if not.
    auto const numerator = mulDivThrow(
        rateMagnitude(annualRate), static_cast<std::uint64_t>(days), 1);
    auto const denominator =
        std::uint64_t{daysInYear} * power10(annualRate.scale());

    return scaleMoney(balance, numerator, denominator);
}

Money
applyRate(Money const& amount, Rate const& rate)
{
    return scaleMoney(amount, rateMagnitude(rate), power10(rate.scale()));
}

}  // namespace shylock
