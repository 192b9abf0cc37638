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

#ifndef SHYLOCK_BASICS_MULDIV_H_INCLUDED
#define SHYLOCK_BASICS_MULDIV_H_INCLUDED

#include <cstdint>
#include <limits>
#include <optional>

namespace shylock {

/** How the fractional part of a quotient is resolved. */
enum class Rounding {
    // Discard the remainder.
    towardZero,

    // Round up when the remainder is at least half the divisor.
    halfUp,
};

auto constexpr muldiv_max = std::numeric_limits<std::int64_t>::max();

/** Return value*mul/div accurately.
    Computes the result of the multiplication and division in
    a single step, avoiding overflow and retaining precision.
    Throws:
        None
    Returns:
        `std::nullopt` if the calculation overflows a signed 64-bit
        result or `div` is zero. Otherwise, `value * mul / div`
        rounded as requested.
*/
std::optional<std::uint64_t>
mulDiv(
    std::uint64_t value,
    std::uint64_t mul,
    std::uint64_t div,
    Rounding rounding = Rounding::towardZero);

/** Return value*mul/div accurately, rounded as requested.
    Throws:
        std::overflow_error
*/
std::uint64_t
mulDivThrow(
    std::uint64_t value,
    std::uint64_t mul,
    std::uint64_t div,
    Rounding rounding = Rounding::towardZero);

/** Returns 10 raised to the given power.
    @param exponent must be no greater than 18.
*/
std::uint64_t
power10(unsigned exponent);

}  // namespace shylock

#endif
