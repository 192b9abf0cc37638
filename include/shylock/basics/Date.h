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


#ifndef SHYLOCK_BASICS_DATE_H_INCLUDED
#define SHYLOCK_BASICS_DATE_H_INCLUDED

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shylock {

/** A calendar day in the proleptic Gregorian calendar. */
using Date = boost::gregorian::date;

/** Parse a date written as `YYYY-MM-DD` or `MM/DD/YYYY`.

    Single digit months and days are accepted in the US form.

    @return The date, or std::nullopt if the text is not a valid date.
*/
std::optional<Date>
parseDate(std::string_view text);

/** Returns the date as `YYYY-MM-DD`. */
std::string
toIsoString(Date const& date);

/** Returns the date as `MM/DD/YYYY`. */
std::string
toUsString(Date const& date);

/** Returns the number of days from `from` to `to`, negative if `to` is
    earlier.
*/
std::int64_t
daysBetween(Date const& from, Date const& to);

/** Returns the current local calendar day. */
Date
today();

}  // namespace shylock

#endif
