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

#include <boost/multiprecision/cpp_int.hpp>

#include <stdexcept>

namespace shylock {

std::optional<std::uint64_t>
mulDiv(
    std::uint64_t value,
    std::uint64_t mul,
    std::uint64_t div,
    Rounding rounding)
{
    using namespace boost::multiprecision;

    if (div == 0)
        return std::nullopt;

    uint128_t result;
    result = multiply(result, value, mul);

    uint128_t const remainder = result % div;
    result /= div;

    // remainder * 2 cannot overflow: remainder < div < 2^64
    if (rounding == Rounding::halfUp && remainder * 2 >= div)
        ++result;

    if (result > static_cast<std::uint64_t>(muldiv_max))
        return std::nullopt;

    return static_cast<std::uint64_t>(result);
}

std::uint64_t
mulDivThrow(
    std::uint64_t value,
    std::uint64_t mul,
    std::uint64_t div,
    Rounding rounding)
{
    auto const result = mulDiv(value, mul, div, rounding);
    if (!result)
        Throw<std::overflow_error>("mulDiv");
    return *result;
}

std::uint64_t
power10(unsigned exponent)
{
    if (exponent > 18)
        Throw<std::overflow_error>("power10: exponent out of range");

    std::uint64_t result = 1;
    while (exponent-- != 0)
        result *= 10;
    return result;
}

}  // namespace shylock
