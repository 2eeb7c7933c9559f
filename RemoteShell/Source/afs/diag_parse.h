// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DIAG_PARSE_H_8812093746510293847
#define DIAG_PARSE_H_8812093746510293847

#include <optional>
#include "shell_quote.h"


namespace rsh
{
//parsing of remote tool output is permissive: malformed input yields empty/zero values, never an exception

struct SpaceUsage
{
    uint64_t bytesTotal = 0;
    uint64_t bytesUsed  = 0;
    uint64_t bytesAvail = 0;

    bool operator==(const SpaceUsage&) const = default;
};

//"8dbc7733dbd10d2efc5c0a0d8dad90f958581821  RELEASE.md\n" => "8dbc7733dbd10d2efc5c0a0d8dad90f958581821"
//empty if the first token is not a hex string; no length check
std::string parseHash(const std::string& output); //noexcept

//"df -k" output: header line + one data line; columns 2-4 are 1K-blocks total/used/available
SpaceUsage parseUsage(const std::string& output); //noexcept

//"<used> <free>" in bytes as returned by a PowerShell PSDrive query
SpaceUsage parsePowerShellUsage(const std::string& output); //noexcept

//output of the probe command SHELL_PROBE_COMMAND; none if the shell is not recognized
std::optional<ShellDialect> parseShellProbe(const std::string& output); //noexcept

//evaluates differently in each shell: sh expands ${ShellId} (empty), cmd expands %ComSpec%, PowerShell expands ${ShellId}
const char SHELL_PROBE_COMMAND[] = "echo ${ShellId}%ComSpec%";
}

#endif //DIAG_PARSE_H_8812093746510293847
