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


#ifndef SHYLOCK_LEDGER_LOANTERMS_H_INCLUDED
#define SHYLOCK_LEDGER_LOANTERMS_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Money.h>
#include <shylock/basics/Rate.h>

#include <cstdint>
#include <optional>
#include <string>

namespace shylock {

/** How a late fee is computed when a cycle is paid after its grace date. */
struct LateFeePolicy
{
    enum class Kind {
        // A flat currency amount.
        fixed,

        // A percentage of the interest accrued for the cycle.
        percentOfCycleInterest,
    };

    Kind kind = Kind::fixed;

    // Currency units for `fixed`, percentage points for
    // `percentOfCycleInterest` (5 means five percent).
    Rate amount;

    // Days after the due date during which a payment is still on time.
    std::int32_t graceDays = 0;
};

/** The terms of a loan, fixed for the duration of one ledger computation.

    Defaults are resolved when the terms are built, so every field here is
    authoritative.
*/
struct LoanTerms
{
    // Opening principal balance.
    Money principal;

    Date originationDate;

    // Decimal fraction per year, e.g. 0.06.
    Rate annualRate;

    LateFeePolicy lateFeePolicy;

    // Rate charged on unpaid late fees. Only the waterfall policy uses it;
    // when absent the annual rate applies.
    std::optional<Rate> penaltyRate;

    /** Throws InvalidTerms if any amount, rate or the grace period is
        negative.
    */
    void
    validate() const;
};

std::string
to_string(LateFeePolicy::Kind kind);

}  // namespace shylock

#endif
