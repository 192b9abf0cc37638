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


#include <shylock/basics/Rate.h>
#include <shylock/basics/contract.h>
#include <shylock/basics/mulDiv.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <cctype>
#include <stdexcept>

namespace shylock {

namespace {

boost::multiprecision::int128_t
atMaxScale(Rate const& rate)
{
    boost::multiprecision::int128_t result = rate.mantissa();
    result *= power10(Rate::maxScale - rate.scale());
    return result;
}

std::uint64_t
magnitude(Rate::mantissa_type m)
{
    return m < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(m)
                 : static_cast<std::uint64_t>(m);
}

// Renders `digits * 10^-places` with exactly `places` fractional digits
std::string
placeDecimal(std::uint64_t digits, unsigned places)
{
    std::string s = std::to_string(digits);
    if (s.size() <= places)
        s.insert(0, places + 1 - s.size(), '0');
    if (places != 0)
        s.insert(s.size() - places, 1, '.');
    return s;
}

}  // namespace

Rate::Rate(mantissa_type mantissa, unsigned scale)
    : mantissa_(mantissa), scale_(scale)
{
    if (scale_ > maxScale)
        Throw<std::invalid_argument>(
            "Rate scale " + std::to_string(scale_) + " exceeds " +
            std::to_string(maxScale));
}

bool
operator==(Rate const& lhs, Rate const& rhs)
{
    return atMaxScale(lhs) == atMaxScale(rhs);
}

bool
operator<(Rate const& lhs, Rate const& rhs)
{
    return atMaxScale(lhs) < atMaxScale(rhs);
}

std::string
to_string(Rate const& rate)
{
    std::string s = placeDecimal(magnitude(rate.mantissa()), rate.scale());

    if (s.find('.') != std::string::npos)
    {
        auto const last = s.find_last_not_of('0');
        s.erase(last + 1);
        if (s.back() == '.')
            s.pop_back();
    }

    if (rate.signum() < 0)
        s.insert(0, 1, '-');
    return s;
}

std::string
formatPercent(Rate const& rate, unsigned decimals)
{
    // A percentage shifts the decimal point two places to the right
    unsigned const shift = decimals + 2;

    std::uint64_t const scaled = shift >= rate.scale()
        ? mulDivThrow(
              magnitude(rate.mantissa()), power10(shift - rate.scale()), 1)
        : mulDivThrow(
              magnitude(rate.mantissa()),
              1,
              power10(rate.scale() - shift),
              Rounding::halfUp);

    std::string s = placeDecimal(scaled, decimals);
    if (rate.signum() < 0 && scaled != 0)
        s.insert(0, 1, '-');
    return s + "%";
}

std::optional<Rate>
rateFromString(std::string_view text)
{
    std::string s(text);
    boost::algorithm::trim(s);

    bool percent = false;
    if (!s.empty() && s.back() == '%')
    {
        percent = true;
        s.pop_back();
        boost::algorithm::trim(s);
    }

    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+'))
    {
        negative = s.front() == '-';
        s.erase(0, 1);
    }

    if (s.empty())
        return std::nullopt;

    std::uint64_t mantissa = 0;
    unsigned scale = 0;
    bool seenPoint = false;
    bool seenDigit = false;

    for (char const c : s)
    {
        if (c == '.')
        {
            if (seenPoint)
                return std::nullopt;
            seenPoint = true;
            continue;
        }

        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;

        seenDigit = true;
        if (mantissa > 99'999'999'999'999'999ULL)
            return std::nullopt;

        mantissa = mantissa * 10 + static_cast<unsigned>(c - '0');
        if (seenPoint)
            ++scale;
    }

    if (!seenDigit)
        return std::nullopt;

    if (percent)
        scale += 2;

    // Trailing zeros carry no value; shed them before giving up on scale
    while (scale > Rate::maxScale && mantissa % 10 == 0)
    {
        mantissa /= 10;
        --scale;
    }

    if (scale > Rate::maxScale)
        return std::nullopt;

    auto const value = static_cast<Rate::mantissa_type>(mantissa);
    return Rate{negative ? -value : value, scale};
}

}  // namespace shylock
