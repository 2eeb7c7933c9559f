// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <ctime>
#include <vector>
#include "i18n.h"
#include "zstring.h"


namespace zen
{
//problems that did not stop the operation: degraded tool output, failed clean-up, ...
enum MessageType
{
    MSG_TYPE_WARNING,
    MSG_TYPE_ERROR,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    Zstringc message; //UTF-8
};
using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, utfTo<Zstringc>(msg)});
}


struct ErrorLogStats
{
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_WARNING ? count.warning : count.error);
    return count;
}


//stderr line: "[12:34:56]  Warning:  message"; continuation lines are aligned with the message
inline
std::string formatMessage(const LogEntry& entry)
{
    char timeTag[16] = {};
    std::tm tmLocal = {};
    if (::localtime_r(&entry.time, &tmLocal))
        std::strftime(timeTag, sizeof(timeTag), "%H:%M:%S", &tmLocal);

    const std::wstring typeLabel = entry.type == MSG_TYPE_WARNING ? _("Warning") : _("Error");

    const std::string prefix = '[' + std::string(timeTag) + "]  " + utfTo<std::string>(typeLabel) + ":  ";
    const std::string indent(unicodeLength(prefix), ' '); //label may be translated

    std::string output;
    split(trimCpy(entry.message), '\n', [&](std::string_view line)
    {
        if (line.empty()) //collapse blank lines
            return;
        output += output.empty() ? prefix : '\n' + indent;
        output += line;
    });
    if (output.empty())
        output = prefix;
    return output + '\n';
}
}

#endif //ERROR_LOG_H_8917590832147915
