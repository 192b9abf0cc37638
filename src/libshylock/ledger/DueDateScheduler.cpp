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


#include <shylock/ledger/DueDateScheduler.h>

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>

namespace shylock {

Date
addMonths(Date const& date, std::uint32_t months)
{
    auto const ymd = date.year_month_day();

    // Months counted from year zero keep the carry arithmetic in one place
    std::uint64_t const total = static_cast<std::uint64_t>(ymd.year) * 12 +
        (static_cast<std::uint64_t>(ymd.month) - 1) + months;
    auto const year = static_cast<unsigned short>(total / 12);
    auto const month = static_cast<unsigned short>(total % 12 + 1);

    auto const lastDay =
        boost::gregorian::gregorian_calendar::end_of_month_day(year, month);
    auto const day = std::min<unsigned short>(ymd.day.as_number(), lastDay);

    return Date(year, month, day);
}

Date
dueDate(Date const& originationDate, std::uint32_t cycle)
{
    return addMonths(originationDate, cycle);
}

std::uint32_t
cycleOnOrBefore(Date const& originationDate, Date const& when)
{
    if (when < originationDate)
        return 0;

    auto const from = originationDate.year_month_day();
    auto const to = when.year_month_day();

    // The calendar month difference is exact or one too high
    std::int64_t const months = (static_cast<std::int64_t>(to.year) -
                                 static_cast<std::int64_t>(from.year)) *
            12 +
        (static_cast<std::int64_t>(to.month) -
         static_cast<std::int64_t>(from.month));

    auto cycle = static_cast<std::uint32_t>(std::max<std::int64_t>(months, 0));
    while (cycle > 0 && dueDate(originationDate, cycle) > when)
        --cycle;
    return cycle;
}

//------------------------------------------------------------------------------

DueDateScheduler::DueDateScheduler(Date const& originationDate)
    : originationDate_(originationDate), previous_(originationDate)
{
}

DueDateScheduler::Cycle
DueDateScheduler::next()
{
    ++index_;
    Cycle const cycle{index_, previous_, dueDate(originationDate_, index_)};
    previous_ = cycle.due;
    return cycle;
}

}  // namespace shylock
