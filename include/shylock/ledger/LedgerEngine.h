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


#ifndef SHYLOCK_LEDGER_LEDGERENGINE_H_INCLUDED
#define SHYLOCK_LEDGER_LEDGERENGINE_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Journal.h>
#include <shylock/basics/Money.h>
#include <shylock/ledger/CycleRecord.h>
#include <shylock/ledger/LoanTerms.h>
#include <shylock/ledger/PaymentEvent.h>

#include <cstdint>
#include <span>

namespace shylock {

/** Computes the cycle-by-cycle ledger of a loan.

    Each cycle accrues actual/365 interest on the balance at its start.
    Payments flow into a carry pool. A cycle is satisfied once the pool
    covers its interest:

    - Money in the pool on or before the due date pays interest only; any
      surplus is held for later cycles and never reduces principal.
    - If the pool falls short at the due date, later payments are consumed
      until it is covered. A late fee is capitalized when the covering
      payment lands after the grace period, and whatever that payment
      brings beyond the interest is applied to principal.
    - If the payments run out first, the cycle is recorded as open with a
      capitalized late fee, and the ledger ends there.

    The result is a pure function of the terms, the payments and the as-of
    date. The engine keeps no state between calls.
*/
class LedgerEngine
{
private:
    Journal j_;

public:
    explicit LedgerEngine(Journal journal);

    /** Compute the ledger.

        Payments may be in any order and may share dates; they are
        normalized first.

        @param asOf The date against which days late is measured for a
                    cycle that is still open.

        @throws InvalidTerms if the terms do not validate. No rows are
                produced.
    */
    Ledger
    compute(
        LoanTerms const& terms,
        PaymentEvents const& payments,
        Date const& asOf) const;
};

namespace detail {

/** Find the payment whose arrival completed coverage of a cycle's interest.

    Walks the consumed payments from newest to oldest, giving each a share
    of the pool equal to the smaller of its amount and the pool still
    unaccounted for. The first payment for which the older share of the
    pool is below the interest is the one that completed coverage.

    @param consumed Payments absorbed into the pool so far, oldest first.
    @param pool Money in the pool, at least `interest`.
    @param interest The cycle interest being covered.
    @param dueDate Reported when the interest is zero and no payment was
                   needed.
*/
Date
findSatisfyingPayment(
    std::span<PaymentEvent const> consumed,
    Money const& pool,
    Money const& interest,
    Date const& dueDate);

/** Throws UnorderedInternalState unless dates strictly increase. */
void
checkChronological(PaymentEvents const& payments);

/** Returns the index of the last cycle the ledger covers.

    That is one past the first cycle whose due date is on or after the
    final payment, or cycle 2 when there are no payments.
*/
std::uint32_t
lastCycle(Date const& originationDate, PaymentEvents const& payments);

}  // namespace detail

}  // namespace shylock

#endif
