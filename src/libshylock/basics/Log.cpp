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

#include <shylock/basics/Log.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <functional>
#include <iostream>
#include <utility>

namespace shylock {

Logs::Sink::Sink(
    std::string const& partition,
    severities::Severity thresh,
    Logs& logs)
    : Journal::Sink(thresh, false), logs_(logs), partition_(partition)
{
}

void
Logs::Sink::write(severities::Severity level, std::string const& text)
{
    if (level < threshold())
        return;

    logs_.write(level, partition_, text, console());
}

//------------------------------------------------------------------------------

Logs::Logs(severities::Severity thresh, std::ostream& out)
    : thresh_(thresh), out_(out)
{
}

Journal::Sink&
Logs::get(std::string const& name)
{
    std::lock_guard lock(mutex_);
    auto const result = sinks_.emplace(name, makeSink(name, thresh_));
    return *result.first->second;
}

Journal::Sink&
Logs::operator[](std::string const& name)
{
    return get(name);
}

Journal
Logs::journal(std::string const& name)
{
    return Journal(get(name));
}

severities::Severity
Logs::threshold() const
{
    std::lock_guard lock(mutex_);
    return thresh_;
}

void
Logs::threshold(severities::Severity thresh)
{
    std::lock_guard lock(mutex_);
    thresh_ = thresh;
    for (auto& sink : sinks_)
        sink.second->threshold(thresh);
}

void
Logs::write(
    severities::Severity level,
    std::string const& partition,
    std::string const& text,
    bool console)
{
    std::string s;
    format(s, text, level, partition);
    std::lock_guard lock(mutex_);
    out_ << s << '\n';
    if (console)
        out_.flush();
}

std::unique_ptr<Journal::Sink>
Logs::makeSink(std::string const& name, severities::Severity threshold)
{
    return std::make_unique<Sink>(name, threshold, *this);
}

std::optional<severities::Severity>
Logs::fromString(std::string const& s)
{
    using namespace boost::algorithm;

    if (iequals(s, "trace"))
        return severities::kTrace;

    if (iequals(s, "debug"))
        return severities::kDebug;

    if (iequals(s, "info") || iequals(s, "information"))
        return severities::kInfo;

    if (iequals(s, "warn") || iequals(s, "warning") || iequals(s, "warnings"))
        return severities::kWarning;

    if (iequals(s, "error") || iequals(s, "errors"))
        return severities::kError;

    if (iequals(s, "fatal") || iequals(s, "fatals"))
        return severities::kFatal;

    return std::nullopt;
}

std::string
Logs::toString(severities::Severity s)
{
    switch (s)
    {
        case severities::kTrace:
            return "Trace";
        case severities::kDebug:
            return "Debug";
        case severities::kInfo:
            return "Info";
        case severities::kWarning:
            return "Warning";
        case severities::kError:
            return "Error";
        case severities::kFatal:
            return "Fatal";
        default:
            break;
    }
    return "Unknown";
}

void
Logs::format(
    std::string& output,
    std::string const& message,
    severities::Severity severity,
    std::string const& partition)
{
    output.reserve(message.size() + partition.size() + 100);

    output = boost::posix_time::to_simple_string(
        boost::posix_time::microsec_clock::universal_time());
    output += " UTC ";

    if (!partition.empty())
        output += partition + ":";

    switch (severity)
    {
        case severities::kTrace:
            output += "TRC ";
            break;
        case severities::kDebug:
            output += "DBG ";
            break;
        case severities::kInfo:
            output += "NFO ";
            break;
        case severities::kWarning:
            output += "WRN ";
            break;
        case severities::kError:
            output += "ERR ";
            break;
        default:
            output += "FTL ";
            break;
    }

    output += message;

    // Limit the maximum length of the output
    if (output.size() > maximumMessageCharacters)
    {
        output.resize(maximumMessageCharacters - 3);
        output += "...";
    }
}

//------------------------------------------------------------------------------

class DebugSink
{
private:
    std::reference_wrapper<Journal::Sink> sink_;
    std::unique_ptr<Journal::Sink> holder_;
    std::mutex m_;

public:
    DebugSink() : sink_(Journal::getNullSink())
    {
    }

    DebugSink(DebugSink const&) = delete;
    DebugSink&
    operator=(DebugSink const&) = delete;

    DebugSink(DebugSink&&) = delete;
    DebugSink&
    operator=(DebugSink&&) = delete;

    std::unique_ptr<Journal::Sink>
    set(std::unique_ptr<Journal::Sink> sink)
    {
        std::lock_guard _(m_);

        using std::swap;
        swap(holder_, sink);

        if (holder_)
            sink_ = *holder_;
        else
            sink_ = Journal::getNullSink();

        return sink;
    }

    Journal::Sink&
    get()
    {
        std::lock_guard _(m_);
        return sink_.get();
    }
};

static DebugSink&
debugSink()
{
    static DebugSink _;
    return _;
}

std::unique_ptr<Journal::Sink>
setDebugLogSink(std::unique_ptr<Journal::Sink> sink)
{
    return debugSink().set(std::move(sink));
}

Journal
debugLog()
{
    return Journal(debugSink().get());
}

}  // namespace shylock
