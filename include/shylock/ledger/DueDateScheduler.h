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


#ifndef SHYLOCK_LEDGER_DUEDATESCHEDULER_H_INCLUDED
#define SHYLOCK_LEDGER_DUEDATESCHEDULER_H_INCLUDED

#include <shylock/basics/Date.h>

#include <cstdint>

namespace shylock {

/** Returns the date `months` calendar months after `date`.

    When the day of month does not exist in the target month the result is
    clamped to that month's last day, so Jan 31 plus one month is Feb 28
    (or Feb 29 in a leap year).
*/
Date
addMonths(Date const& date, std::uint32_t months);

/** Returns the due date of a billing cycle.

    Cycle `k` falls due `k` months after origination. Every due date is
    computed from the origination date itself, never from an earlier
    clamped due date, so short months do not pull later due dates forward.
*/
Date
dueDate(Date const& originationDate, std::uint32_t cycle);

/** Returns the index of the latest due date on or before `when`.

    Zero means `when` falls before the first due date (the origination
    date itself acts as cycle zero). Also zero if `when` is before
    origination.
*/
std::uint32_t
cycleOnOrBefore(Date const& originationDate, Date const& when);

/** Walks consecutive billing cycles of a loan. */
class DueDateScheduler
{
public:
    struct Cycle
    {
        std::uint32_t index;

        // Start of the accrual span: the prior due date, or origination.
        Date previous;

        Date due;
    };

private:
    Date const originationDate_;
    std::uint32_t index_ = 0;
    Date previous_;

public:
    explicit DueDateScheduler(Date const& originationDate);

    /** Advance to the next cycle and return it. */
    Cycle
    next();

    Date const&
    originationDate() const
    {
        return originationDate_;
    }
};

}  // namespace shylock

#endif
