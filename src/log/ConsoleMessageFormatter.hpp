#pragma once

#include <plog/Record.h>
#include <plog/Severity.h>
#include <plog/Util.h>

// Terminal formatter: the bare message, prefixed only for problems.
// Timestamps and thread ids belong in the file log, not in installer output.
struct ConsoleMessageFormatter
{
    static plog::util::nstring header() { return plog::util::nstring(); }

    static plog::util::nstring format(const plog::Record& record)
    {
        plog::util::nostringstream ss;
        switch (record.getSeverity())
        {
        case plog::fatal:
        case plog::error:
            ss << PLOG_NSTR("error: ");
            break;
        case plog::warning:
            ss << PLOG_NSTR("warning: ");
            break;
        default:
            break;
        }
        ss << record.getMessage() << PLOG_NSTR("\n");
        return ss.str();
    }
};
