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
#include <shylock/ledger/LedgerErrors.h>
#include <shylock/ledger/LoanTerms.h>

namespace shylock {

void
LoanTerms::validate() const
{
    if (principal.signum() < 0)
        Throw<InvalidTerms>("principal is negative: " + to_string(principal));

    if (originationDate.is_special())
        Throw<InvalidTerms>("origination date is not set");

    if (annualRate.signum() < 0)
        Throw<InvalidTerms>(
            "annual rate is negative: " + to_string(annualRate));

    if (lateFeePolicy.amount.signum() < 0)
        Throw<InvalidTerms>(
            "late fee amount is negative: " + to_string(lateFeePolicy.amount));

    if (lateFeePolicy.graceDays < 0)
        Throw<InvalidTerms>(
            "grace period is negative: " +
            std::to_string(lateFeePolicy.graceDays));

    if (penaltyRate && penaltyRate->signum() < 0)
        Throw<InvalidTerms>(
            "penalty rate is negative: " + to_string(*penaltyRate));
}

std::string
to_string(LateFeePolicy::Kind kind)
{
    switch (kind)
    {
        case LateFeePolicy::Kind::fixed:
            return "fixed";
        case LateFeePolicy::Kind::percentOfCycleInterest:
            return "percent";
    }
    return "unknown";
}

}  // namespace shylock
