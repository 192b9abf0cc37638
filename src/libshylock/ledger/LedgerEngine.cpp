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


#include <shylock/basics/contract.h>
#include <shylock/ledger/DayCount.h>
#include <shylock/ledger/DueDateScheduler.h>
#include <shylock/ledger/LateFee.h>
#include <shylock/ledger/LedgerEngine.h>
#include <shylock/ledger/LedgerErrors.h>
#include <shylock/ledger/PaymentNormalizer.h>

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>
#include <stdexcept>

namespace shylock {

namespace detail {

Date
findSatisfyingPayment(
    std::span<PaymentEvent const> consumed,
    Money const& pool,
    Money const& interest,
    Date const& dueDate)
{
    if (!interest)
        return dueDate;

    Money remaining = pool;
    for (auto iter = consumed.rbegin(); iter != consumed.rend(); ++iter)
    {
        auto const share = std::min(iter->amount, remaining);
        if (remaining - share < interest)
            return iter->date;
        remaining -= share;
    }

    Throw<std::logic_error>(
        "Carry pool of " + to_string(pool) +
        " is not backed by the consumed payments");
}

void
checkChronological(PaymentEvents const& payments)
{
    for (std::size_t i = 1; i < payments.size(); ++i)
    {
        if (payments[i].date <= payments[i - 1].date)
            Throw<UnorderedInternalState>(
                "Payment dated " + toIsoString(payments[i].date) +
                " follows " + toIsoString(payments[i - 1].date));
    }
}

std::uint32_t
lastCycle(Date const& originationDate, PaymentEvents const& payments)
{
    if (payments.empty())
        return 2;

    auto const& finalDate = payments.back().date;
    auto cycle = cycleOnOrBefore(originationDate, finalDate);
    if (cycle == 0 || dueDate(originationDate, cycle) < finalDate)
        ++cycle;
    return cycle + 1;
}

}  // namespace detail

//------------------------------------------------------------------------------

LedgerEngine::LedgerEngine(Journal journal) : j_(journal)
{
}

Ledger
LedgerEngine::compute(
    LoanTerms const& terms,
    PaymentEvents const& payments,
    Date const& asOf) const
{
    terms.validate();

    auto const events = normalizePayments(payments, terms.originationDate, j_);
    detail::checkChronological(events);

    auto const last = detail::lastCycle(terms.originationDate, events);
    auto const grace = boost::gregorian::days(terms.lateFeePolicy.graceDays);

    Ledger ledger;
    ledger.reserve(last);

    Money balance = terms.principal;
    Money pool;
    std::size_t cursor = 0;
    bool open = false;

    DueDateScheduler scheduler(terms.originationDate);
    while (!open)
    {
        auto const cycle = scheduler.next();
        if (cycle.index > last)
            break;

        auto const& due = cycle.due;

        CycleRecord row;
        row.cycle = cycle.index;
        row.dueDate = due;
        row.openingPrincipalBalance = balance;
        row.cycleInterest = accrueInterest(
            balance, terms.annualRate, daysBetween(cycle.previous, due));

        auto const& interest = row.cycleInterest;

        while (cursor < events.size() && events[cursor].date <= due)
            pool += events[cursor++].amount;

        if (pool >= interest)
        {
            // Covered by the due date: interest only, surplus carries
            row.satisfyingPaymentDate = detail::findSatisfyingPayment(
                {events.data(), cursor}, pool, interest, due);
            pool -= interest;
            row.amountPosted = interest;
        }
        else
        {
            while (pool < interest && cursor < events.size())
                pool += events[cursor++].amount;

            if (pool >= interest)
            {
                // Every payment consumed here is dated after the due date
                auto const& paidOn = events[cursor - 1].date;
                row.satisfyingPaymentDate = paidOn;
                row.daysLate = daysBetween(due, paidOn);

                if (paidOn > due + grace)
                {
                    row.lateFeeAssessed =
                        assessLateFee(interest, terms.lateFeePolicy);
                    balance += row.lateFeeAssessed;
                }

                // Beyond a full payoff the excess stays on account as credit
                auto const excess = pool - interest;
                row.principalApplied = std::min(excess, balance);
                balance -= row.principalApplied;
                pool = excess - row.principalApplied;
                row.amountPosted = interest + row.principalApplied;
            }
            else
            {
                open = true;
                row.daysLate =
                    std::max<std::int64_t>(0, daysBetween(due, asOf));
                row.lateFeeAssessed =
                    assessLateFee(interest, terms.lateFeePolicy);
                balance += row.lateFeeAssessed;
                row.amountPosted = pool;
                pool = Money{};
            }
        }

        SHYLOCK_ASSERT(
            balance.signum() >= 0,
            "LedgerEngine::compute : principal balance went negative");

        row.endingPrincipalBalance = balance;
        row.carryForward = pool;

        JLOG(j_.trace()) << "Cycle " << row.cycle << " due "
                         << toIsoString(due) << " interest "
                         << row.cycleInterest << " posted "
                         << row.amountPosted << " fee "
                         << row.lateFeeAssessed << " principal "
                         << row.principalApplied << " balance "
                         << row.endingPrincipalBalance << " carry "
                         << row.carryForward << (open ? " (open)" : "");

        ledger.push_back(std::move(row));
    }

    JLOG(j_.debug()) << "Computed " << ledger.size() << " cycle(s) from "
                     << events.size() << " payment event(s); ending balance "
                     << balance << (open ? ", final cycle open" : "");

    return ledger;
}

}  // namespace shylock
