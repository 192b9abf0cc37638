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

#include <shylock/basics/Money.h>
#include <shylock/basics/mulDiv.h>

#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <utility>

namespace shylock {

namespace {

// Splits a non-negative count of minor units into its major and minor parts
std::pair<std::uint64_t, std::uint64_t>
splitMinor(Money::value_type minor)
{
    // Negate in unsigned space so the most negative value is safe
    std::uint64_t const magnitude = minor < 0
        ? std::uint64_t{0} - static_cast<std::uint64_t>(minor)
        : static_cast<std::uint64_t>(minor);
    return {magnitude / Money::minorPerMajor, magnitude % Money::minorPerMajor};
}

std::string
groupThousands(std::string const& digits)
{
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (digits.size() - i) % 3 == 0)
            result += ',';
        result += digits[i];
    }
    return result;
}

std::string
fraction(std::uint64_t minor)
{
    std::string ret = std::to_string(minor);
    if (ret.size() < Money::scale)
        ret.insert(0, Money::scale - ret.size(), '0');
    return ret;
}

}  // namespace

std::string
to_string(Money const& amount)
{
    auto const [major, minor] = splitMinor(amount.minorUnits());

    std::string ret;
    if (amount.signum() < 0)
        ret += '-';
    ret += std::to_string(major);
    ret += '.';
    ret += fraction(minor);
    return ret;
}

std::string
formatCurrency(Money const& amount)
{
    auto const [major, minor] = splitMinor(amount.minorUnits());

    std::string ret;
    if (amount.signum() < 0)
        ret += '-';
    ret += '$';
    ret += groupThousands(std::to_string(major));
    ret += '.';
    ret += fraction(minor);
    return ret;
}

std::optional<Money>
moneyFromString(std::string_view text)
{
    std::string s(text);

    // Non-breaking spaces show up in amounts pasted from spreadsheets
    boost::algorithm::erase_all(s, "\xC2\xA0");
    boost::algorithm::trim(s);

    bool negative = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')')
    {
        negative = true;
        s = s.substr(1, s.size() - 2);
        boost::algorithm::trim(s);
    }

    if (!s.empty() && (s.front() == '-' || s.front() == '+'))
    {
        if (s.front() == '-')
            negative = !negative;
        s.erase(0, 1);
    }

    boost::algorithm::erase_all(s, "$");
    boost::algorithm::erase_all(s, ",");
    boost::algorithm::trim(s);

    if (s.empty())
        return std::nullopt;

    std::uint64_t mantissa = 0;
    unsigned decimals = 0;
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

        // Beyond 18 significant decimals the input cannot be a sane amount
        if (mantissa > 99'999'999'999'999'999ULL)
            return std::nullopt;

        mantissa = mantissa * 10 + static_cast<unsigned>(c - '0');
        if (seenPoint)
            ++decimals;
    }

    if (!seenDigit || decimals > 18)
        return std::nullopt;

    std::optional<std::uint64_t> minor;
    if (decimals <= Money::scale)
        minor = mulDiv(mantissa, power10(Money::scale - decimals), 1);
    else
        minor = mulDiv(
            mantissa, 1, power10(decimals - Money::scale), Rounding::halfUp);

    if (!minor ||
        *minor > static_cast<std::uint64_t>(
                     std::numeric_limits<Money::value_type>::max()))
        return std::nullopt;

    auto const value = static_cast<Money::value_type>(*minor);
    return Money{negative ? -value : value};
}

}  // namespace shylock
