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


#ifndef SHYLOCK_BASICS_RATE_H_INCLUDED
#define SHYLOCK_BASICS_RATE_H_INCLUDED

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace shylock {

/** An exact decimal fraction, `mantissa * 10^-scale`.

    Used for annual interest rates (0.06 is six percent) and for late fee
    amounts, which may be either a currency figure or a percentage. The
    value is never converted to binary floating point.
*/
class Rate
{
public:
    using mantissa_type = std::int64_t;

    /** The largest number of fractional digits a rate may carry. */
    static constexpr unsigned maxScale = 12;

private:
    mantissa_type mantissa_ = 0;
    unsigned scale_ = 0;

public:
    constexpr Rate() = default;

    /** Create the rate `mantissa * 10^-scale`.
        @param scale must not exceed maxScale.
    */
    Rate(mantissa_type mantissa, unsigned scale);

    constexpr mantissa_type
    mantissa() const noexcept
    {
        return mantissa_;
    }

    constexpr unsigned
    scale() const noexcept
    {
        return scale_;
    }

    constexpr int
    signum() const noexcept
    {
        return (mantissa_ < 0) ? -1 : (mantissa_ ? 1 : 0);
    }

    explicit constexpr
    operator bool() const noexcept
    {
        return mantissa_ != 0;
    }

    friend bool
    operator==(Rate const& lhs, Rate const& rhs);

    friend bool
    operator<(Rate const& lhs, Rate const& rhs);
};

inline bool
operator!=(Rate const& lhs, Rate const& rhs)
{
    return !(lhs == rhs);
}

/** Returns the rate as a plain decimal with trailing zeros removed. */
std::string
to_string(Rate const& rate);

/** Returns the rate as a percentage, e.g. `6.000%` for 0.06.

    @param decimals Digits after the point, rounded half-up.
*/
std::string
formatPercent(Rate const& rate, unsigned decimals = 3);

/** Parse a decimal rate.

    Accepts `0.06`, `-0.5` and the percent form `6%`, which is equal to
    `0.06`. Surrounding whitespace is ignored.

    @return The rate, or std::nullopt if the text is malformed or needs
            more than Rate::maxScale fractional digits.
*/
std::optional<Rate>
rateFromString(std::string_view text);

inline std::ostream&
operator<<(std::ostream& os, Rate const& rate)
{
    return os << to_string(rate);
}

}  // namespace shylock

#endif
