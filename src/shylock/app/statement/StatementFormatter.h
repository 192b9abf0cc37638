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


#ifndef SHYLOCK_APP_STATEMENT_STATEMENTFORMATTER_H_INCLUDED
#define SHYLOCK_APP_STATEMENT_STATEMENTFORMATTER_H_INCLUDED

#include <shylock/app/statement/StatementContext.h>
#include <shylock/ledger/CycleRecord.h>
#include <shylock/ledger/LedgerSummary.h>
#include <shylock/ledger/LoanTerms.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <ostream>

namespace shylock {

/** Write a paginated text statement for a capitalization ledger.

    The statement opens with the loan details and summary totals, followed
    by the ledger rows under a "Payment & Accrual Activity" heading,
    `context.rowsPerPage` rows to a page.
*/
void
writeStatement(
    std::ostream& os,
    StatementContext const& context,
    LoanTerms const& terms,
    Ledger const& ledger,
    LedgerSummary const& summary);

/** Write the ledger as CSV, one line per cycle. */
void
writeLedgerCsv(std::ostream& os, Ledger const& ledger);

/** Write a paginated text statement for a waterfall ledger. */
void
writeWaterfallStatement(
    std::ostream& os,
    StatementContext const& context,
    LoanTerms const& terms,
    WaterfallLedger const& ledger,
    WaterfallSummary const& summary);

/** Write the waterfall ledger as CSV, one line per payment. */
void
writeWaterfallCsv(std::ostream& os, WaterfallLedger const& ledger);

}  // namespace shylock

#endif
