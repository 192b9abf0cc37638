#include <shylock/ledger/LedgerSummary.h>

namespace shylock {

LedgerSummary
summarize(LoanTerms const& terms, Ledger const& ledger)
{
    LedgerSummary s;
    s.beginningPrincipal = terms.principal;
    s.endingPrincipal = terms.principal;
    s.cycles = ledger.size();

    for (auto const& row : ledger)
    {
        s.paymentsPosted += row.amountPosted;
        s.interestAccrued += row.cycleInterest;
        s.lateFees += row.lateFeeAssessed;
        s.appliedToPrincipal += row.principalApplied;
    }

    if (!ledger.empty())
    {
        s.endingPrincipal = ledger.back().endingPrincipalBalance;
        s.finalCycleOpen = ledger.back().isOpen();
    }

    return s;
}

WaterfallSummary
summarize(LoanTerms const& terms, WaterfallLedger const& ledger)
{
    WaterfallSummary s;
    s.beginningPrincipal = terms.principal;
    s.endingPrincipal = terms.principal;
    s.payments = ledger.size();

    for (auto const& row : ledger)
    {
        s.paymentsReceived += row.paymentAmount;
        s.interestAccrued += row.interestAccrued;
        s.penaltyInterestAccrued += row.penaltyInterestAccrued;
        s.lateFees += row.lateFeeAssessed;
        s.appliedToPrincipal += row.toPrincipal;
        s.unapplied += row.unapplied;
    }

    if (!ledger.empty())
    {
        auto const& last = ledger.back();
        s.endingPrincipal = last.principalBalance;
        s.interestOutstanding = last.interestOutstanding;
        s.lateFeesOutstanding = last.lateFeesOutstanding;
        s.penaltyInterestOutstanding = last.penaltyInterestOutstanding;
    }

    return s;
}

}  // namespace shylock
