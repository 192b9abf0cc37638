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

#ifndef SHYLOCK_BASICS_LOG_H_INCLUDED
#define SHYLOCK_BASICS_LOG_H_INCLUDED

#include <shylock/basics/Journal.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace shylock {

/** Manages partitions for logging. */
class Logs
{
private:
    class Sink : public Journal::Sink
    {
    private:
        Logs& logs_;
        std::string partition_;

    public:
        Sink(
            std::string const& partition,
            severities::Severity thresh,
            Logs& logs);

        Sink(Sink const&) = delete;
        Sink&
        operator=(Sink const&) = delete;

        void
        write(severities::Severity level, std::string const& text) override;
    };

    std::mutex mutable mutex_;
    std::map<std::string, std::unique_ptr<Journal::Sink>> sinks_;
    severities::Severity thresh_;
    std::ostream& out_;

public:
    /** Create the partition manager.

        @param thresh The initial threshold for every partition.
        @param out Destination of formatted log lines.
    */
    Logs(severities::Severity thresh, std::ostream& out);

    Logs(Logs const&) = delete;
    Logs&
    operator=(Logs const&) = delete;

    virtual ~Logs() = default;

    Journal::Sink&
    get(std::string const& name);

    Journal::Sink&
    operator[](std::string const& name);

    Journal
    journal(std::string const& name);

    severities::Severity
    threshold() const;

    /** Change the threshold of this manager and every existing partition. */
    void
    threshold(severities::Severity thresh);

    void
    write(
        severities::Severity level,
        std::string const& partition,
        std::string const& text,
        bool console);

    virtual std::unique_ptr<Journal::Sink>
    makeSink(std::string const& partition, severities::Severity startingLevel);

public:
    static std::optional<severities::Severity>
    fromString(std::string const& s);

    static std::string
    toString(severities::Severity s);

    static void
    format(
        std::string& output,
        std::string const& message,
        severities::Severity severity,
        std::string const& partition);

private:
    enum {
        // Maximum line length for log messages.
        // If the message exceeds this length it will be truncated with
        // ellipses.
        maximumMessageCharacters = 12 * 1024
    };
};

//------------------------------------------------------------------------------
// Debug logging:

/** Set the sink for the debug journal.

    @param sink unique_ptr to new debug Sink.
    @return unique_ptr to the previous Sink.  nullptr if there was no Sink.
*/
std::unique_ptr<Journal::Sink>
setDebugLogSink(std::unique_ptr<Journal::Sink> sink);

/** Returns a debug journal.
    The journal may drain to a null sink, so its output
    may never be seen.  Never use it for critical information.
*/
Journal
debugLog();

}  // namespace shylock

#endif
