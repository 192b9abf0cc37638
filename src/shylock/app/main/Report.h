#ifndef SHYLOCK_APP_MAIN_REPORT_H_INCLUDED
#define SHYLOCK_APP_MAIN_REPORT_H_INCLUDED

#include <shylock/app/loan/LoanConfig.h>
#include <shylock/basics/Date.h>
#include <shylock/basics/Expected.h>
#include <shylock/basics/Log.h>
#include <shylock/ledger/PaymentEvent.h>

#include <string>

namespace shylock {

enum class ReportFormat {
    statement,
    csv,
};

/** Compute the ledger selected by `loan.policy` and render it.

    Nothing is rendered unless the whole ledger computes, so a caller can
    hold off creating its destination until this returns.

    @throws InvalidTerms if the loan terms cannot produce a ledger.
*/
std::string
renderReport(
    LoanConfig const& loan,
    PaymentEvents const& payments,
    Date const& asOf,
    ReportFormat format,
    Logs& logs);

/** Replace the contents of the file at `path` with `contents`. */
Expected<void, std::string>
writeReportFile(std::string const& path, std::string const& contents);

}  // namespace shylock

#endif
