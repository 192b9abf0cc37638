#ifndef SHYLOCK_LEDGER_LEDGERSUMMARY_H_INCLUDED
#define SHYLOCK_LEDGER_LEDGERSUMMARY_H_INCLUDED

#include <shylock/basics/Money.h>
#include <shylock/ledger/CycleRecord.h>
#include <shylock/ledger/LoanTerms.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <cstddef>

namespace shylock {

/** Totals over a computed ledger. */
struct LedgerSummary
{
    Money beginningPrincipal;
    Money paymentsPosted;
    Money interestAccrued;
    Money lateFees;
    Money appliedToPrincipal;
    Money endingPrincipal;

    std::size_t cycles = 0;

    // The last cycle is still waiting on payment.
    bool finalCycleOpen = false;
};

LedgerSummary
summarize(LoanTerms const& terms, Ledger const& ledger);

/** Totals over a waterfall ledger. */
struct WaterfallSummary
{
    Money beginningPrincipal;
    Money paymentsReceived;
    Money interestAccrued;
    Money penaltyInterestAccrued;
    Money lateFees;
    Money appliedToPrincipal;
    Money unapplied;
    Money endingPrincipal;
    Money interestOutstanding;
    Money lateFeesOutstanding;
    Money penaltyInterestOutstanding;

    std::size_t payments = 0;
};

WaterfallSummary
summarize(LoanTerms const& terms, WaterfallLedger const& ledger);

}  // namespace shylock

#endif
