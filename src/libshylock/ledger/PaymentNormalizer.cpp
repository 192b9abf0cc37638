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


#include <shylock/ledger/PaymentNormalizer.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <optional>

namespace shylock {

namespace {

std::optional<std::size_t>
findColumn(std::vector<std::string> const& header, std::string const& name)
{
    auto const iter = std::find(header.begin(), header.end(), name);
    if (iter == header.end())
        return std::nullopt;
    return static_cast<std::size_t>(iter - header.begin());
}

}  // namespace

namespace detail {

std::vector<std::string>
splitCsvLine(std::string const& line)
{
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char const c = line[i];
        if (quoted)
        {
            if (c != '"')
                field += c;
            else if (i + 1 < line.size() && line[i + 1] == '"')
                field += line[++i];
            else
                quoted = false;
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            fields.push_back(std::move(field));
            field.clear();
        }
        else if (c != '\r')
        {
            field += c;
        }
    }

    fields.push_back(std::move(field));
    return fields;
}

}  // namespace detail

PaymentEvents
normalizePayments(
    PaymentEvents events,
    Date const& originationDate,
    Journal journal)
{
    std::stable_sort(
        events.begin(), events.end(), [](auto const& a, auto const& b) {
            return a.date < b.date;
        });

    auto const firstKept = std::find_if(
        events.begin(), events.end(), [&originationDate](auto const& e) {
            return e.date >= originationDate;
        });

    if (firstKept != events.begin())
    {
        JLOG(journal.warn())
            << "Dropping " << (firstKept - events.begin())
            << " payment(s) dated before origination "
            << toIsoString(originationDate) << "; earliest is "
            << toIsoString(events.front().date);
    }

    PaymentEvents result;
    result.reserve(static_cast<std::size_t>(events.end() - firstKept));

    for (auto iter = firstKept; iter != events.end(); ++iter)
    {
        if (iter->amount.signum() <= 0)
        {
            JLOG(journal.debug())
                << "Ignoring non-positive payment of " << iter->amount
                << " on " << toIsoString(iter->date);
            continue;
        }

        if (!result.empty() && result.back().date == iter->date)
            result.back().amount += iter->amount;
        else
            result.push_back(*iter);
    }

    JLOG(journal.trace()) << "Normalized " << events.size()
                          << " payment(s) into " << result.size()
                          << " event(s)";
    return result;
}

Expected<PaymentRows, std::string>
readPaymentRows(std::istream& in)
{
    static std::string const missing =
        "CSV must include columns: Date, Amount "
        "(or Payment Date, Amount)";

    std::string line;
    std::size_t lineNo = 0;

    // Leading blank lines are not a header
    std::vector<std::string> header;
    while (header.empty() && std::getline(in, line))
    {
        ++lineNo;
        boost::algorithm::trim(line);
        if (line.empty())
            continue;

        // A UTF-8 byte order mark from spreadsheet exports
        if (line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);

        header = detail::splitCsvLine(line);
    }

    for (auto& name : header)
    {
        boost::algorithm::trim(name);
        boost::algorithm::to_lower(name);
    }

    auto dateCol = findColumn(header, "date");
    if (!dateCol)
        dateCol = findColumn(header, "payment date");
    auto const amountCol = findColumn(header, "amount");

    if (!dateCol || !amountCol)
        return Unexpected(missing);

    PaymentRows rows;
    while (std::getline(in, line))
    {
        ++lineNo;
        if (boost::algorithm::trim_copy(line).empty())
            continue;

        auto const fields = detail::splitCsvLine(line);
        PaymentRow row;
        row.line = lineNo;
        if (*dateCol < fields.size())
            row.date = boost::algorithm::trim_copy(fields[*dateCol]);
        if (*amountCol < fields.size())
            row.amount = boost::algorithm::trim_copy(fields[*amountCol]);
        rows.push_back(std::move(row));
    }

    return rows;
}

CleanedPayments
cleanPaymentRows(PaymentRows const& rows, Journal journal)
{
    CleanedPayments result;
    result.events.reserve(rows.size());

    for (auto const& row : rows)
    {
        auto const date = parseDate(row.date);
        if (!date)
        {
            ++result.badDate;
            JLOG(journal.debug()) << "Line " << row.line
                                  << ": unparsable date '" << row.date << "'";
            continue;
        }

        auto const amount = moneyFromString(row.amount);
        if (!amount)
        {
            ++result.badAmount;
            JLOG(journal.debug())
                << "Line " << row.line << ": unparsable amount '"
                << row.amount << "'";
            continue;
        }

        if (amount->signum() <= 0)
        {
            ++result.nonPositive;
            continue;
        }

        result.events.push_back({*date, *amount});
    }

    if (result.dropped() != 0)
    {
        JLOG(journal.warn())
            << "Dropped " << result.dropped() << " of " << rows.size()
            << " payment row(s): " << result.badDate << " bad date, "
            << result.badAmount << " bad amount, " << result.nonPositive
            << " not positive";
    }

    JLOG(journal.info()) << "Loaded " << result.events.size()
                         << " payment(s)";
    return result;
}

}  // namespace shylock
