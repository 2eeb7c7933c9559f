// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "diag_parse.h"
#include <charconv>
#include <limits>

using namespace zen;
using namespace rsh;


namespace
{
std::vector<std::string_view> splitWhiteSpace(std::string_view line)
{
    std::vector<std::string_view> fields;
    split2(line, [](char c) { return isWhiteSpace(c); }, [&](std::string_view field)
    {
        if (!field.empty())
            fields.push_back(field);
    });
    return fields;
}


//strict: digits only, no sign, no overflow
std::optional<uint64_t> parseUnsigned(std::string_view str)
{
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); }))
        return std::nullopt;

    uint64_t number = 0;
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), number);
    if (rv.ec != std::errc() || rv.ptr != str.data() + str.size())
        return std::nullopt;
    return number;
}


std::optional<uint64_t> blocksToBytes(std::string_view blocks)
{
    const uint64_t blockSize = 1024;

    const std::optional<uint64_t> count = parseUnsigned(blocks);
    if (!count || *count > std::numeric_limits<uint64_t>::max() / blockSize)
        return std::nullopt;
    return *count * blockSize;
}
}


std::string rsh::parseHash(const std::string& output) //noexcept
{
    std::string_view str = output;

    const auto itFirst = std::find_if(str.begin(), str.end(), [](char c) { return !isWhiteSpace(c); });
    str = str.substr(itFirst - str.begin());

    //GNU coreutils prefix the line with '\' if the file name contains a backslash or line break
    if (startsWith(str, '\\'))
        str = str.substr(1);

    const auto itEnd = std::find_if(str.begin(), str.end(), [](char c) { return isWhiteSpace(c); });
    const std::string_view hash = str.substr(0, itEnd - str.begin());

    if (hash.empty() || !std::all_of(hash.begin(), hash.end(), [](char c) { return isHexDigit(c); }))
        return std::string();

    return std::string(hash);
}


/* Linux:
        Filesystem     1K-blocks     Used Available Use% Mounted on
        /dev/root       91283092 81111888  10154820  89% /
   macOS:
        Filesystem   1024-blocks     Used Available Capacity iused      ifree %iused  Mounted on
        /dev/disk0s2   244277768 94454848 149566920    39%  997820 4293969459    0%   /
   long device names wrap onto a second line (POSIX df without -P):
        Filesystem     1K-blocks     Used Available Use% Mounted on
        server.example.com:/export/home
                        91283092 81111888  10154820  89% /home                        */
SpaceUsage rsh::parseUsage(const std::string& output) //noexcept
{
    std::vector<std::string_view> lines;
    split(output, '\n', [&](std::string_view line)
    {
        line = trimCpy(line);
        if (!line.empty())
            lines.push_back(line);
    });

    if (lines.size() < 2) //header + data line
        return {};

    std::vector<std::string_view> fields = splitWhiteSpace(lines[1]);
    if (fields.size() == 1 && lines.size() >= 3)
        for (const std::string_view field : splitWhiteSpace(lines[2]))
            fields.push_back(field);

    if (fields.size() < 4)
        return {};

    const std::optional<uint64_t> bytesTotal = blocksToBytes(fields[1]);
    const std::optional<uint64_t> bytesUsed  = blocksToBytes(fields[2]);
    const std::optional<uint64_t> bytesAvail = blocksToBytes(fields[3]);

    if (!bytesTotal || !bytesUsed || !bytesAvail)
        return {};

    return {.bytesTotal = *bytesTotal, .bytesUsed = *bytesUsed, .bytesAvail = *bytesAvail};
}


SpaceUsage rsh::parsePowerShellUsage(const std::string& output) //noexcept
{
    const std::vector<std::string_view> fields = splitWhiteSpace(output);
    if (fields.size() != 2)
        return {};

    const std::optional<uint64_t> bytesUsed = parseUnsigned(fields[0]);
    const std::optional<uint64_t> bytesFree = parseUnsigned(fields[1]);
    if (!bytesUsed || !bytesFree || *bytesUsed > std::numeric_limits<uint64_t>::max() - *bytesFree)
        return {};

    return {.bytesTotal = *bytesUsed + *bytesFree, .bytesUsed = *bytesUsed, .bytesAvail = *bytesFree};
}


std::optional<ShellDialect> rsh::parseShellProbe(const std::string& output) //noexcept
{
    if (contains(output, "Microsoft.PowerShell"))
        return ShellDialect::powershell;
    if (contains(output, "%ComSpec%")) //sh: ${ShellId} expands to nothing, %ComSpec% stays literal
        return ShellDialect::posix;
    if (contains(output, "${ShellId}")) //cmd: %ComSpec% expands to "C:\Windows\system32\cmd.exe"
        return ShellDialect::cmd;
    return std::nullopt;
}
