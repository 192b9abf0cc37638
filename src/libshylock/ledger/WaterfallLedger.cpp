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


#include <shylock/basics/mulDiv.h>
#include <shylock/ledger/DayCount.h>
#include <shylock/ledger/DueDateScheduler.h>
#include <shylock/ledger/LateFee.h>
#include <shylock/ledger/LedgerEngine.h>
#include <shylock/ledger/PaymentNormalizer.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>

namespace shylock {

namespace {

// Takes as much of `owed` as `remaining` allows
Money
allocate(Money& remaining, Money& owed)
{
    auto const paid = std::min(remaining, owed);
    remaining -= paid;
    owed -= paid;
    return paid;
}

}  // namespace

Money
assessWaterfallLateFee(
    Money const& principal,
    Rate const& annualRate,
    LateFeePolicy const& policy)
{
    if (policy.kind == LateFeePolicy::Kind::fixed || principal.signum() <= 0 ||
        annualRate.signum() <= 0)
        return assessLateFee(Money{}, policy);

    auto const monthly = Money{static_cast<Money::value_type>(mulDivThrow(
        static_cast<std::uint64_t>(principal.minorUnits()),
        static_cast<std::uint64_t>(annualRate.mantissa()),
        12 * power10(annualRate.scale()),
        Rounding::halfUp))};

    return assessLateFee(monthly, policy);
}

//------------------------------------------------------------------------------

WaterfallEngine::WaterfallEngine(Journal journal) : j_(journal)
{
}

WaterfallLedger
WaterfallEngine::compute(
    LoanTerms const& terms,
    PaymentEvents const& payments) const
{
    terms.validate();

    auto const events = normalizePayments(payments, terms.originationDate, j_);
    detail::checkChronological(events);

    auto const& penaltyRate = terms.penaltyRate && *terms.penaltyRate
        ? *terms.penaltyRate
        : terms.annualRate;
    auto const grace = boost::gregorian::days(terms.lateFeePolicy.graceDays);

    Money principal = terms.principal;
    Money interestOwed;
    Money lateFeesOwed;
    Money penaltyOwed;
    Date lastEvent = terms.originationDate;

    WaterfallLedger ledger;
    ledger.reserve(events.size());

    for (auto const& event : events)
    {
        WaterfallRow row;
        row.paymentDate = event.date;

        auto const cycle = cycleOnOrBefore(terms.originationDate, event.date);
        row.dueDate = dueDate(terms.originationDate, cycle);

        auto const days = daysBetween(lastEvent, event.date);

        row.interestAccrued = accrueInterest(principal, terms.annualRate, days);
        interestOwed += row.interestAccrued;

        // Nothing is due before the first due date, so nothing can be late
        if (cycle != 0 && event.date > row.dueDate + grace)
        {
            row.lateFeeAssessed = assessWaterfallLateFee(
                principal, terms.annualRate, terms.lateFeePolicy);
            lateFeesOwed += row.lateFeeAssessed;
        }

        row.penaltyInterestAccrued =
            accrueInterest(lateFeesOwed, penaltyRate, days);
        penaltyOwed += row.penaltyInterestAccrued;

        Money remaining = event.amount;
        row.toPenaltyInterest = allocate(remaining, penaltyOwed);
        row.toLateFees = allocate(remaining, lateFeesOwed);
        row.toInterest = allocate(remaining, interestOwed);
        row.toPrincipal = allocate(remaining, principal);
        row.unapplied = remaining;

        row.paymentAmount = event.amount;
        row.principalBalance = principal;
        row.interestOutstanding = interestOwed;
        row.lateFeesOutstanding = lateFeesOwed;
        row.penaltyInterestOutstanding = penaltyOwed;

        JLOG(j_.trace()) << "Payment " << toIsoString(event.date) << " of "
                         << event.amount << " due " << toIsoString(row.dueDate)
                         << " fee " << row.lateFeeAssessed << " principal "
                         << row.toPrincipal << " balance " << principal;

        if (row.unapplied)
        {
            JLOG(j_.warn()) << "Payment on " << toIsoString(event.date)
                            << " exceeds the loan payoff by "
                            << row.unapplied;
        }

        ledger.push_back(std::move(row));
        lastEvent = event.date;
    }

    JLOG(j_.debug()) << "Computed " << ledger.size()
                     << " waterfall row(s); ending balance " << principal;

    return ledger;
}

}  // namespace shylock
