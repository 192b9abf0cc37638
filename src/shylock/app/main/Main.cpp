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


#include <shylock/app/loan/LoanConfig.h>
#include <shylock/app/main/BuildInfo.h>
#include <shylock/app/main/Report.h>
#include <shylock/basics/Log.h>
#include <shylock/ledger/PaymentNormalizer.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace shylock {

namespace {

void
printHelp(po::options_description const& desc)
{
    std::cerr << "shylock [options]\n"
              << "Compute the ledger of a privately held loan.\n\n"
              << desc << std::endl;
}

// Reports a failure on the console and in the log
int
fail(Journal const& j, std::string const& message)
{
    JLOG(j.error()) << message;
    std::cerr << "shylock: " << message << std::endl;
    return EXIT_FAILURE;
}

Expected<PaymentEvents, std::string>
loadPayments(std::string const& path, Journal const& j)
{
    std::ifstream file(path);
    if (!file)
        return Unexpected("Unable to open payments file: " + path);

    auto const rows = readPaymentRows(file);
    if (!rows)
        return Unexpected(rows.error() + ": " + path);

    return cleanPaymentRows(*rows, j).events;
}

// Everything after option parsing, once logging is set up
int
runLedger(po::variables_map const& vm, Logs& logs)
{
    auto const j = logs.journal("Application");

    if (!vm.count("conf"))
        return fail(j, "A loan file is required (--conf).");

    auto const format = vm["format"].as<std::string>();
    if (!boost::iequals(format, "statement") && !boost::iequals(format, "csv"))
        return fail(j, "Unknown output format '" + format + "'.");

    BasicConfig config;
    auto const confFile = vm["conf"].as<std::string>();
    if (auto const loaded = readConfigFile(confFile, config); !loaded)
        return fail(j, loaded.error());

    // Command line values take precedence over the loan file
    if (vm.count("policy"))
        config.overwrite(
            ConfigSection::ledger(), "policy", vm["policy"].as<std::string>());
    if (vm.count("as-of"))
        config.overwrite(
            ConfigSection::ledger(), "as_of", vm["as-of"].as<std::string>());

    auto loan = loadLoanConfig(config);
    if (!loan)
        return fail(j, loan.error());

    JLOG(j.info()) << "Loaded " << confFile << ": principal "
                   << loan->terms.principal << ", rate "
                   << loan->terms.annualRate << ", policy "
                   << to_string(loan->policy);

    PaymentEvents payments;
    if (vm.count("payments"))
    {
        auto loaded = loadPayments(
            vm["payments"].as<std::string>(), logs.journal("Payments"));
        if (!loaded)
            return fail(j, loaded.error());
        payments = std::move(*loaded);
    }

    auto const now = today();
    loan->statement.generatedOn = now;
    auto const asOf = loan->asOf.value_or(now);
    auto const outputFormat = boost::iequals(format, "csv")
        ? ReportFormat::csv
        : ReportFormat::statement;

    // The output file is only created once the ledger has computed
    std::string report;
    try
    {
        report = renderReport(*loan, payments, asOf, outputFormat, logs);
    }
    catch (std::exception const& e)
    {
        return fail(j, e.what());
    }

    if (vm.count("output"))
    {
        auto const written =
            writeReportFile(vm["output"].as<std::string>(), report);
        if (!written)
            return fail(j, written.error());
    }
    else
    {
        std::cout << report;
        std::cout.flush();
    }

    return EXIT_SUCCESS;
}

}  // namespace

int
run(int argc, char** argv)
{
    po::variables_map vm;

    // Set up option parsing.
    //
    po::options_description desc("General Options");
    // clang-format off
    desc.add_options()
    ("help,h", "Display this message.")
    ("conf", po::value<std::string>(), "Specify the loan file.")
    ("payments", po::value<std::string>(), "Specify the payments CSV file.")
    ("as-of", po::value<std::string>(),
        "Measure an open cycle's days late against this date "
        "(YYYY-MM-DD or MM/DD/YYYY). Defaults to [ledger] as_of, then today.")
    ("format", po::value<std::string>()->default_value("statement"),
        "Output format. Choices are 'statement', 'csv'.")
    ("output,o", po::value<std::string>(),
        "Write to this file instead of standard output.")
    ("policy", po::value<std::string>(),
        "Override [ledger] policy. Choices are 'capitalize', 'waterfall'.")
    ("log-level", po::value<std::string>()->default_value("warning"),
        "Log severity threshold: trace, debug, info, warning, error, fatal.")
    ("quiet,q", "Only log fatal errors.")
    ("version", "Display the build version.")
    ;
    // clang-format on

    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (std::exception const& e)
    {
        std::cerr << "shylock: Incorrect command line syntax.\n"
                  << "Use '--help' for a list of options.\n"
                  << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help"))
    {
        printHelp(desc);
        return EXIT_SUCCESS;
    }

    if (vm.count("version"))
    {
        std::cout << "shylock version " << BuildInfo::getVersionString()
                  << std::endl;
        return EXIT_SUCCESS;
    }

    auto threshold = Logs::fromString(vm["log-level"].as<std::string>());
    if (!threshold)
    {
        std::cerr << "shylock: Unknown log level '"
                  << vm["log-level"].as<std::string>() << "'" << std::endl;
        return EXIT_FAILURE;
    }
    if (vm.count("quiet"))
        threshold = severities::kFatal;

    Logs logs(*threshold, std::cerr);
    setDebugLogSink(logs.makeSink("Debug", *threshold));
    auto const result = runLedger(vm, logs);
    setDebugLogSink(nullptr);
    return result;
}

}  // namespace shylock

int
main(int argc, char** argv)
{
    return shylock::run(argc, argv);
}
