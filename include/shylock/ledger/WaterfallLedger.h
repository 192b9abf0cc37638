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


#ifndef SHYLOCK_LEDGER_WATERFALLLEDGER_H_INCLUDED
#define SHYLOCK_LEDGER_WATERFALLLEDGER_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Journal.h>
#include <shylock/basics/Money.h>
#include <shylock/ledger/LoanTerms.h>
#include <shylock/ledger/PaymentEvent.h>

#include <vector>

namespace shylock {

/* One row of the waterfall ledger, describing a single payment.
 *
 * Under this policy late fees are never capitalized. They sit in their own
 * receivable, which accrues penalty interest, and every payment is split
 * across the receivables in a fixed order:
 *
 *   penalty interest, late fees, loan interest, principal
 *
 * Loan interest that a payment does not cover carries forward without
 * itself earning interest.
 */
struct WaterfallRow
{
    Date paymentDate;

    // The latest due date on or before the payment; the origination date
    // for a payment made before the first due date.
    Date dueDate;

    Money paymentAmount;

    // Loan interest accrued since the previous payment.
    Money interestAccrued;

    Money penaltyInterestAccrued;

    Money lateFeeAssessed;

    Money toPenaltyInterest;
    Money toLateFees;
    Money toInterest;
    Money toPrincipal;

    // Left over after the principal reached zero.
    Money unapplied;

    Money principalBalance;
    Money interestOutstanding;
    Money lateFeesOutstanding;
    Money penaltyInterestOutstanding;

    bool
    operator==(WaterfallRow const& other) const = default;
};

using WaterfallLedger = std::vector<WaterfallRow>;

/** Computes the legacy per-payment waterfall ledger.

    Kept as an alternative to LedgerEngine for loans written under the
    earlier policy. The two are separate computations and never mix.
*/
class WaterfallEngine
{
private:
    Journal j_;

public:
    explicit WaterfallEngine(Journal journal);

    /** Compute one row per payment date.

        Payments are normalized first, so same-day payments form one row.

        @throws InvalidTerms if the terms do not validate.
    */
    WaterfallLedger
    compute(LoanTerms const& terms, PaymentEvents const& payments) const;
};

/** Late fee for a payment under the waterfall policy.

    A percentage fee is taken of one month of interest on the current
    principal (`principal * annualRate / 12`) rather than of cycle interest.
*/
Money
assessWaterfallLateFee(
    Money const& principal,
    Rate const& annualRate,
    LateFeePolicy const& policy);

}  // namespace shylock

#endif
