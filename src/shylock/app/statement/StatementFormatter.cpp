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


#include <shylock/app/statement/StatementFormatter.h>
#include <shylock/basics/Money.h>
#include <shylock/basics/Rate.h>

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace shylock {

namespace {

std::string const activityHeading = "Payment & Accrual Activity";

/** A block of text columns sized to fit their widest cell. */
class TextTable
{
public:
    struct Column
    {
        std::string label;
        bool alignRight;
    };

private:
    std::vector<Column> columns_;
    std::vector<std::vector<std::string>> rows_;

public:
    explicit TextTable(std::vector<Column> columns)
        : columns_(std::move(columns))
    {
    }

    void
    add(std::vector<std::string> row)
    {
        row.resize(columns_.size());
        rows_.push_back(std::move(row));
    }

    void
    write(std::ostream& os) const
    {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (auto const& c : columns_)
            widths.push_back(c.label.size());

        for (auto const& row : rows_)
            for (std::size_t i = 0; i < row.size(); ++i)
                widths[i] = std::max(widths[i], row[i].size());

        auto line = [&](auto const& cellAt) {
            for (std::size_t i = 0; i < columns_.size(); ++i)
            {
                if (i != 0)
                    os << "  ";
                os << (columns_[i].alignRight ? std::right : std::left)
                   << std::setw(static_cast<int>(widths[i])) << cellAt(i);
            }
            os << std::left << '\n';
        };

        line([&](std::size_t i) -> std::string const& {
            return columns_[i].label;
        });

        std::size_t total = 0;
        for (auto const w : widths)
            total += w;
        total += 2 * (widths.size() - 1);
        os << std::string(total, '-') << '\n';

        for (auto const& row : rows_)
            line([&](std::size_t i) -> std::string const& { return row[i]; });
    }
};

std::string
generatedOn(Date const& date)
{
    if (date.is_special())
        return "";

    auto const ymd = date.year_month_day();
    std::ostringstream ss;
    ss << ymd.month.as_short_string() << ' ' << std::setw(2)
       << std::setfill('0') << ymd.day.as_number() << ", "
       << static_cast<unsigned>(ymd.year);
    return ss.str();
}

void
writeHeader(
    std::ostream& os,
    StatementContext const& context,
    LoanTerms const& terms)
{
    os << "Loan Statement\n";
    os << context.loanName;
    if (auto const when = generatedOn(context.generatedOn); !when.empty())
        os << " - Generated " << when;
    os << "\n\n";

    os << "Lender: " << context.lenderName << '\n';
    os << "Borrower: " << context.borrowerName << '\n';
    os << "Origination: " << toUsString(terms.originationDate) << '\n';
    os << "APR: " << formatPercent(terms.annualRate, 3)
       << " (ACT/365 simple interest)\n\n";
}

// Label and value pairs, with the values lined up
void
writeTotals(
    std::ostream& os,
    std::vector<std::pair<std::string, Money>> const& totals)
{
    std::size_t width = 0;
    for (auto const& [label, amount] : totals)
        width = std::max(width, label.size());

    for (auto const& [label, amount] : totals)
        os << std::left << std::setw(static_cast<int>(width + 2))
           << (label + ":") << std::right << std::setw(16)
           << formatCurrency(amount) << std::left << '\n';
    os << '\n';
}

template <class Row, class MakeTable, class AddRow>
void
writeActivity(
    std::ostream& os,
    std::vector<Row> const& rows,
    std::size_t rowsPerPage,
    MakeTable&& makeTable,
    AddRow&& addRow)
{
    if (rowsPerPage == 0)
        rowsPerPage = rows.size() ? rows.size() : 1;

    if (rows.empty())
    {
        os << activityHeading << "\n\nNo activity.\n";
        return;
    }

    auto const pages =
        rows.size() / rowsPerPage + (rows.size() % rowsPerPage != 0);
    for (std::size_t page = 0; page < pages; ++page)
    {
        os << activityHeading;
        if (pages > 1)
            os << " (page " << (page + 1) << " of " << pages << ")";
        os << "\n\n";

        TextTable table = makeTable();
        auto const first = page * rowsPerPage;
        auto const last =
            first + std::min(rowsPerPage, rows.size() - first);
        for (auto i = first; i < last; ++i)
            addRow(table, rows[i]);
        table.write(os);

        if (page + 1 != pages)
            os << '\n';
    }
}

std::string
csvField(std::string const& s)
{
    if (s.find_first_of(",\"\n") == std::string::npos)
        return s;

    std::string quoted = "\"";
    for (auto const c : s)
    {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

void
writeCsvLine(std::ostream& os, std::vector<std::string> const& fields)
{
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        if (i != 0)
            os << ',';
        os << csvField(fields[i]);
    }
    os << '\n';
}

}  // namespace

void
writeStatement(
    std::ostream& os,
    StatementContext const& context,
    LoanTerms const& terms,
    Ledger const& ledger,
    LedgerSummary const& summary)
{
    writeHeader(os, context, terms);

    writeTotals(
        os,
        {{"Beginning Principal Balance", summary.beginningPrincipal},
         {"Payments Posted (Total)", summary.paymentsPosted},
         {"Accrued Interest (All Cycles)", summary.interestAccrued},
         {"Late Fees Assessed (Total)", summary.lateFees},
         {"Allocated to Principal (Total)", summary.appliedToPrincipal},
         {"Ending Principal Balance", summary.endingPrincipal}});

    os << "Allocation: Early payments satisfy the next due interest; "
          "principal reduces only if the cycle is satisfied on/after the "
          "due date and the same-day payment exceeds the interest due.\n";
    os << "Late fee is capitalized at grace when the cycle is not satisfied "
          "by due+grace.\n";
    if (summary.finalCycleOpen)
        os << "The final cycle is open: no payment has yet covered its "
              "interest.\n";
    os << '\n';

    writeActivity(
        os,
        ledger,
        context.rowsPerPage,
        [] {
            return TextTable({
                {"Due Date", false},
                {"Payment Date (Posted)", false},
                {"Days Late", true},
                {"Payment Amount (Posted)", true},
                {"Late Fee (Assessed)", true},
                {"Accrued Interest (Cycle)", true},
                {"Allocated to Principal", true},
                {"Principal Balance (End)", true},
            });
        },
        [](TextTable& table, CycleRecord const& row) {
            table.add({
                toUsString(row.dueDate),
                row.satisfyingPaymentDate
                    ? toUsString(*row.satisfyingPaymentDate)
                    : "Open",
                std::to_string(row.daysLate),
                formatCurrency(row.amountPosted),
                formatCurrency(row.lateFeeAssessed),
                formatCurrency(row.cycleInterest),
                formatCurrency(row.principalApplied),
                formatCurrency(row.endingPrincipalBalance),
            });
        });
}

void
writeLedgerCsv(std::ostream& os, Ledger const& ledger)
{
    writeCsvLine(
        os,
        {"Due Date",
         "Payment Date (Posted)",
         "Days Late",
         "Payment Amount (Posted)",
         "Accrued Interest (Cycle)",
         "Late Fee (Assessed)",
         "Allocated to Principal",
         "Principal Balance (End)"});

    for (auto const& row : ledger)
    {
        writeCsvLine(
            os,
            {toIsoString(row.dueDate),
             row.satisfyingPaymentDate
                 ? toIsoString(*row.satisfyingPaymentDate)
                 : std::string{},
             std::to_string(row.daysLate),
             to_string(row.amountPosted),
             to_string(row.cycleInterest),
             to_string(row.lateFeeAssessed),
             to_string(row.principalApplied),
             to_string(row.endingPrincipalBalance)});
    }
}

void
writeWaterfallStatement(
    std::ostream& os,
    StatementContext const& context,
    LoanTerms const& terms,
    WaterfallLedger const& ledger,
    WaterfallSummary const& summary)
{
    writeHeader(os, context, terms);

    auto const& policy = terms.lateFeePolicy;
    os << "Late Fee: " << to_string(policy.kind) << ' '
       << to_string(policy.amount) << "; Grace: " << policy.graceDays
       << " day(s); Penalty APR: "
       << formatPercent(
              terms.penaltyRate && *terms.penaltyRate ? *terms.penaltyRate
                                                      : terms.annualRate,
              3)
       << "\n\n";

    writeTotals(
        os,
        {{"Beginning Principal Balance", summary.beginningPrincipal},
         {"Payments Received (Total)", summary.paymentsReceived},
         {"Loan Interest Accrued", summary.interestAccrued},
         {"Penalty Interest Accrued", summary.penaltyInterestAccrued},
         {"Late Fees Assessed (Total)", summary.lateFees},
         {"Allocated to Principal (Total)", summary.appliedToPrincipal},
         {"Unapplied (Total)", summary.unapplied},
         {"Ending Principal Balance", summary.endingPrincipal},
         {"Loan Interest Outstanding", summary.interestOutstanding},
         {"Late Fees Outstanding", summary.lateFeesOutstanding},
         {"Penalty Interest Outstanding",
          summary.penaltyInterestOutstanding}});

    os << "Allocation: penalty interest, then late fees, then loan "
          "interest, then principal.\n";
    os << "Late fees are held separately and accrue penalty interest; they "
          "are never capitalized.\n\n";

    writeActivity(
        os,
        ledger,
        context.rowsPerPage,
        [] {
            return TextTable({
                {"Payment Date", false},
                {"Due Date", false},
                {"Payment", true},
                {"Loan Interest", true},
                {"Penalty Interest", true},
                {"Late Fee", true},
                {"To Penalty", true},
                {"To Fees", true},
                {"To Interest", true},
                {"To Principal", true},
                {"Principal Balance", true},
            });
        },
        [](TextTable& table, WaterfallRow const& row) {
            table.add({
                toUsString(row.paymentDate),
                toUsString(row.dueDate),
                formatCurrency(row.paymentAmount),
                formatCurrency(row.interestAccrued),
                formatCurrency(row.penaltyInterestAccrued),
                formatCurrency(row.lateFeeAssessed),
                formatCurrency(row.toPenaltyInterest),
                formatCurrency(row.toLateFees),
                formatCurrency(row.toInterest),
                formatCurrency(row.toPrincipal),
                formatCurrency(row.principalBalance),
            });
        });
}

void
writeWaterfallCsv(std::ostream& os, WaterfallLedger const& ledger)
{
    writeCsvLine(
        os,
        {"Payment Date",
         "Due Date",
         "Payment Amount",
         "Accrued Loan Interest",
         "Penalty Interest Accrued",
         "Late Fee (Assessed)",
         "Allocated to Penalty Interest",
         "Allocated to Late Fees",
         "Allocated to Loan Interest",
         "Allocated to Principal",
         "Unapplied",
         "Principal Balance (End)",
         "Loan Interest Outstanding (End)",
         "Late Fees Outstanding (End)",
         "Penalty Interest Outstanding (End)"});

    for (auto const& row : ledger)
    {
        writeCsvLine(
            os,
            {toIsoString(row.paymentDate),
             toIsoString(row.dueDate),
             to_string(row.paymentAmount),
             to_string(row.interestAccrued),
             to_string(row.penaltyInterestAccrued),
             to_string(row.lateFeeAssessed),
             to_string(row.toPenaltyInterest),
             to_string(row.toLateFees),
             to_string(row.toInterest),
             to_string(row.toPrincipal),
             to_string(row.unapplied),
             to_string(row.principalBalance),
             to_string(row.interestOutstanding),
             to_string(row.lateFeesOutstanding),
             to_string(row.penaltyInterestOutstanding)});
    }
}

}  // namespace shylock
