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


#ifndef SHYLOCK_APP_LOAN_LOANCONFIG_H_INCLUDED
#define SHYLOCK_APP_LOAN_LOANCONFIG_H_INCLUDED

#include <shylock/app/statement/StatementContext.h>
#include <shylock/basics/BasicConfig.h>
#include <shylock/basics/Date.h>
#include <shylock/basics/Expected.h>
#include <shylock/ledger/LoanTerms.h>

#include <optional>
#include <string>

namespace shylock {

/** Section names used in a loan file. */
struct ConfigSection
{
    static std::string
    loan()
    {
        return "loan";
    }

    static std::string
    lateFee()
    {
        return "late_fee";
    }

    static std::string
    penalty()
    {
        return "penalty";
    }

    static std::string
    ledger()
    {
        return "ledger";
    }

    static std::string
    statement()
    {
        return "statement";
    }
};

/** Which ledger computation to run. */
enum class LedgerPolicy {
    // Late fees are capitalized into principal (LedgerEngine).
    capitalize,

    // Legacy per-payment waterfall (WaterfallEngine).
    waterfall,
};

std::optional<LedgerPolicy>
policyFromString(std::string const& s);

std::string
to_string(LedgerPolicy policy);

/** A loan file with every default resolved. */
struct LoanConfig
{
    LoanTerms terms;

    LedgerPolicy policy = LedgerPolicy::capitalize;

    // Empty means "today" to the caller.
    std::optional<Date> asOf;

    // generatedOn is left for the caller to fill in.
    StatementContext statement;
};

/** Read loan terms and statement settings from parsed configuration.

    `principal`, `origination_date` and `annual_rate` in `[loan]` are
    required. Everything else has a default.

    @return The resolved configuration, or a message naming the section
            and key that is missing or malformed.
*/
Expected<LoanConfig, std::string>
loadLoanConfig(BasicConfig const& config);

/** Read and parse a loan file into `config`.

    @return Nothing, or a message if the file cannot be read.
*/
Expected<void, std::string>
readConfigFile(std::string const& path, BasicConfig& config);

}  // namespace shylock

#endif
