#include <shylock/basics/Log.h>

#include <tests/libshylock/CaptureSink.h>

#include <doctest/doctest.h>

#include <sstream>

using namespace shylock;

TEST_SUITE_BEGIN("Log");

TEST_CASE("severity names")
{
    CHECK(Logs::fromString("trace") == severities::kTrace);
    CHECK(Logs::fromString("Debug") == severities::kDebug);
    CHECK(Logs::fromString("information") == severities::kInfo);
    CHECK(Logs::fromString("WARNING") == severities::kWarning);
    CHECK(Logs::fromString("warn") == severities::kWarning);
    CHECK(Logs::fromString("errors") == severities::kError);
    CHECK(Logs::fromString("fatal") == severities::kFatal);
    CHECK(!Logs::fromString("loud"));

    CHECK(Logs::toString(severities::kWarning) == "Warning");
    CHECK(Logs::toString(severities::kTrace) == "Trace");
}

TEST_CASE("format")
{
    std::string out;
    Logs::format(out, "balance went negative", severities::kError, "Ledger");
    CHECK(out.find(" UTC Ledger:ERR balance went negative") !=
          std::string::npos);

    Logs::format(out, "m", severities::kInfo, "");
    CHECK(out.find(" UTC NFO m") != std::string::npos);

    Logs::format(out, std::string(20000, 'x'), severities::kDebug, "P");
    CHECK(out.size() == 12 * 1024);
    CHECK(out.substr(out.size() - 3) == "...");
}

TEST_CASE("partitions honor the threshold")
{
    std::ostringstream os;
    Logs logs(severities::kWarning, os);

    auto const j = logs.journal("Payments");
    j.info() << "hidden";
    j.warn() << "dropped " << 2 << " rows";
    CHECK(os.str().find("hidden") == std::string::npos);
    CHECK(os.str().find("Payments:WRN dropped 2 rows") != std::string::npos);

    logs.threshold(severities::kDebug);
    CHECK(logs.threshold() == severities::kDebug);
    CHECK(j.active(severities::kDebug));
    j.debug() << "now visible";
    CHECK(os.str().find("Payments:DBG now visible") != std::string::npos);

    // The same partition name maps to the same sink
    CHECK(&logs["Payments"] == &j.sink());
}

TEST_CASE("debug log sink")
{
    auto capture = std::make_unique<test::CaptureSink>();
    auto* raw = capture.get();

    auto previous = setDebugLogSink(std::move(capture));
    debugLog().warn() << "seen";
    CHECK(raw->contains(severities::kWarning, "seen"));

    auto mine = setDebugLogSink(std::move(previous));
    CHECK(mine.get() == raw);

    // Once detached, the debug journal drains elsewhere
    debugLog().warn() << "unseen";
    CHECK(!raw->contains(severities::kWarning, "unseen"));
}

TEST_SUITE_END();
