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

#ifndef SHYLOCK_BASICS_MONEY_H_INCLUDED
#define SHYLOCK_BASICS_MONEY_H_INCLUDED

#include <shylock/basics/contract.h>

#include <boost/operators.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shylock {

/** An exact currency amount, held as a count of minor units (cents).

    All ledger arithmetic on money is integral; there is no binary floating
    point anywhere between parsing and formatting.
*/
class Money : private boost::totally_ordered<Money>,
              private boost::additive<Money>
{
public:
    using value_type = std::int64_t;

    /** Number of decimal places carried by the minor unit. */
    static constexpr unsigned scale = 2;

    /** Minor units in one major unit. */
    static constexpr value_type minorPerMajor = 100;

private:
    value_type minor_ = 0;

    static constexpr value_type
    maxMinor()
    {
        return std::numeric_limits<value_type>::max();
    }

    static constexpr value_type
    minMinor()
    {
        return std::numeric_limits<value_type>::min();
    }

public:
    constexpr Money() = default;
    constexpr Money(Money const& other) = default;
    constexpr Money&
    operator=(Money const& other) = default;

    constexpr explicit Money(value_type minorUnits) : minor_(minorUnits)
    {
    }

    Money&
    operator+=(Money const& other)
    {
        if (other.minor_ > 0 ? minor_ > maxMinor() - other.minor_
                             : minor_ < minMinor() - other.minor_)
            Throw<std::overflow_error>("Money addition overflow");
        minor_ += other.minor_;
        return *this;
    }

    Money&
    operator-=(Money const& other)
    {
        if (other.minor_ > 0 ? minor_ < minMinor() + other.minor_
                             : minor_ > maxMinor() + other.minor_)
            Throw<std::overflow_error>("Money subtraction overflow");
        minor_ -= other.minor_;
        return *this;
    }

    constexpr Money
    operator-() const
    {
        return Money{-minor_};
    }

    constexpr bool
    operator==(Money const& other) const
    {
        return minor_ == other.minor_;
    }

    constexpr bool
    operator<(Money const& other) const
    {
        return minor_ < other.minor_;
    }

    /** Returns true if the amount is not zero */
    explicit constexpr
    operator bool() const noexcept
    {
        return minor_ != 0;
    }

    /** Return the sign of the amount */
    constexpr int
    signum() const noexcept
    {
        return (minor_ < 0) ? -1 : (minor_ ? 1 : 0);
    }

    /** Returns the number of minor units */
    constexpr value_type
    minorUnits() const
    {
        return minor_;
    }
};

/** Returns the amount as a plain decimal, e.g. `-1234.50`. */
std::string
to_string(Money const& amount);

/** Returns the amount for display, e.g. `$1,234.50` or `-$3.00`. */
std::string
formatCurrency(Money const& amount);

/** Parse a currency amount.

    Accepts an optional sign, a leading `$`, thousands separators,
    accounting-style parentheses for negative amounts, and surrounding
    whitespace (including non-breaking spaces). Digits beyond the minor
    unit are rounded half-up.

    @return The amount, or std::nullopt if the text is not a number or
            does not fit.
*/
std::optional<Money>
moneyFromString(std::string_view text);

inline std::ostream&
operator<<(std::ostream& os, Money const& amount)
{
    return os << to_string(amount);
}

}  // namespace shylock

#endif
