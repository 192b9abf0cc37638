#include <shylock/app/main/Report.h>
#include <shylock/app/statement/StatementFormatter.h>
#include <shylock/ledger/LedgerEngine.h>
#include <shylock/ledger/LedgerSummary.h>
#include <shylock/ledger/WaterfallLedger.h>

#include <fstream>
#include <sstream>

namespace shylock {

std::string
renderReport(
    LoanConfig const& loan,
    PaymentEvents const& payments,
    Date const& asOf,
    ReportFormat format,
    Logs& logs)
{
    std::ostringstream os;

    if (loan.policy == LedgerPolicy::waterfall)
    {
        WaterfallEngine const engine(logs.journal("Waterfall"));
        auto const ledger = engine.compute(loan.terms, payments);
        if (format == ReportFormat::csv)
            writeWaterfallCsv(os, ledger);
        else
            writeWaterfallStatement(
                os,
                loan.statement,
                loan.terms,
                ledger,
                summarize(loan.terms, ledger));
        return os.str();
    }

    LedgerEngine const engine(logs.journal("Ledger"));
    auto const ledger = engine.compute(loan.terms, payments, asOf);
    if (format == ReportFormat::csv)
        writeLedgerCsv(os, ledger);
    else
        writeStatement(
            os,
            loan.statement,
            loan.terms,
            ledger,
            summarize(loan.terms, ledger));
    return os.str();
}

Expected<void, std::string>
writeReportFile(std::string const& path, std::string const& contents)
{
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file)
        return Unexpected("Unable to open output file: " + path);

    file << contents;
    file.close();
    if (!file)
        return Unexpected("Unable to write output file: " + path);
    return {};
}

}  // namespace shylock
