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


#ifndef SHYLOCK_LEDGER_PAYMENTNORMALIZER_H_INCLUDED
#define SHYLOCK_LEDGER_PAYMENTNORMALIZER_H_INCLUDED

#include <shylock/basics/Date.h>
#include <shylock/basics/Expected.h>
#include <shylock/basics/Journal.h>
#include <shylock/ledger/PaymentEvent.h>

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace shylock {

/** A payment as it appeared in an import file, before any parsing. */
struct PaymentRow
{
    // 1-based line number in the source, header included.
    std::size_t line = 0;
    std::string date;
    std::string amount;
};

using PaymentRows = std::vector<PaymentRow>;

/** Outcome of cleaning imported rows. */
struct CleanedPayments
{
    PaymentEvents events;

    std::size_t badDate = 0;
    std::size_t badAmount = 0;
    std::size_t nonPositive = 0;

    std::size_t
    dropped() const
    {
        return badDate + badAmount + nonPositive;
    }
};

/** Put payment events into the form the ledger engine consumes.

    Sorts by date, drops events dated before origination and events with a
    non-positive amount, and pools events sharing a date into one event
    whose amount is their sum. The result has strictly increasing dates.
*/
PaymentEvents
normalizePayments(
    PaymentEvents events,
    Date const& originationDate,
    Journal journal);

/** Read the raw payment rows of a CSV file.

    The header must name either `Date` and `Amount` or `Payment Date` and
    `Amount` columns, in any order and letter case. Other columns are
    ignored. Fields may be double-quoted, with `""` for a literal quote.

    @return The rows, or a message if the required columns are missing.
*/
Expected<PaymentRows, std::string>
readPaymentRows(std::istream& in);

/** Parse imported rows into payment events.

    Dates may be `YYYY-MM-DD` or `MM/DD/YYYY`. Amounts may carry a `$`,
    thousands separators and accounting parentheses. Rows that do not
    parse, or whose amount is not positive, are dropped and counted.
*/
CleanedPayments
cleanPaymentRows(PaymentRows const& rows, Journal journal);

namespace detail {

/** Split one CSV record into fields. */
std::vector<std::string>
splitCsvLine(std::string const& line);

}  // namespace detail

}  // namespace shylock

#endif
