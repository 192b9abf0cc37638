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


#include <shylock/basics/Date.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/regex.hpp>

#include <cstdio>
#include <stdexcept>

namespace shylock {

namespace {

std::optional<Date>
makeDate(int year, int month, int day)
{
    try
    {
        return Date(year, month, day);
    }
    catch (std::out_of_range const&)
    {
        // bad_year, bad_month and bad_day_of_month all land here
        return std::nullopt;
    }
}

}  // namespace

std::optional<Date>
parseDate(std::string_view text)
{
    static boost::regex const iso(
        "^([0-9]{4})-([0-9]{1,2})-([0-9]{1,2})$",
        boost::regex_constants::optimize);
    static boost::regex const us(
        "^([0-9]{1,2})/([0-9]{1,2})/([0-9]{4})$",
        boost::regex_constants::optimize);

    std::string s(text);
    boost::algorithm::trim(s);

    boost::smatch match;
    if (boost::regex_match(s, match, iso))
        return makeDate(
            std::stoi(match.str(1)),
            std::stoi(match.str(2)),
            std::stoi(match.str(3)));

    if (boost::regex_match(s, match, us))
        return makeDate(
            std::stoi(match.str(3)),
            std::stoi(match.str(1)),
            std::stoi(match.str(2)));

    return std::nullopt;
}

std::string
toIsoString(Date const& date)
{
    return boost::gregorian::to_iso_extended_string(date);
}

std::string
toUsString(Date const& date)
{
    auto const ymd = date.year_month_day();
    char buf[16];
    std::snprintf(
        buf,
        sizeof(buf),
        "%02u/%02u/%04u",
        static_cast<unsigned>(ymd.month),
        static_cast<unsigned>(ymd.day),
        static_cast<unsigned>(ymd.year));
    return buf;
}

std::int64_t
daysBetween(Date const& from, Date const& to)
{
    return (to - from).days();
}

Date
today()
{
    return boost::gregorian::day_clock::local_day();
}

}  // namespace shylock
