// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/shell_quote.h"

using namespace zen;
using namespace rsh;


TEST(ShellQuote, UnixEscape)
{
    const std::pair<std::string, std::string> testData[] =
    {
        {"", ""},
        {"/this/is/harmless", "/this/is/harmless"},
        {"$(rm -rf /)", "\\$\\(rm\\ -rf\\ /\\)"},
        {"/test/\n", "/test/'\n'"},
        {":\"'", ":\\\"\\'"},
        {"a_b.c,d:e@f-g", "a_b.c,d:e@f-g"},
        {"\xe4\xbd\xa0\xe5\xa5\xbd", "\xe4\xbd\xa0\xe5\xa5\xbd"}, //non-ASCII passes unchanged
        {"a;b|c&d", "a\\;b\\|c\\&d"},
    };
    for (const auto& [unescaped, escaped] : testData)
        EXPECT_EQ(quoteOrEscapeShellPath(ShellDialect::posix, unescaped), escaped) << "input: " << unescaped;
}


TEST(ShellQuote, Cmd)
{
    EXPECT_EQ(quoteOrEscapeShellPath(ShellDialect::cmd, ""), "\"\"");
    EXPECT_EQ(quoteOrEscapeShellPath(ShellDialect::cmd, "c:/this/is/harmless"), "\"c:/this/is/harmless\"");
    EXPECT_EQ(quoteOrEscapeShellPath(ShellDialect::cmd, "c:/test&notepad"), "\"c:/test&notepad\"");

    EXPECT_THROW(quoteOrEscapeShellPath(ShellDialect::cmd, "c:/test\"&\"notepad"), SysErrorUnsupportedPath);
}


TEST(ShellQuote, PowerShell)
{
    const std::pair<std::string, std::string> testData[] =
    {
        {"", "''"},
        {"c:/this/is/harmless", "'c:/this/is/harmless'"},
        {"c:/test&notepad", "'c:/test&notepad'"},
        {"c:/test\"&\"notepad", "'c:/test\"&\"notepad'"},
        {"c:/test'&'notepad", "'c:/test''&''notepad'"},
    };
    for (const auto& [unescaped, escaped] : testData)
        EXPECT_EQ(quoteOrEscapeShellPath(ShellDialect::powershell, unescaped), escaped) << "input: " << unescaped;
}


TEST(ShellQuote, DialectNames)
{
    for (const ShellDialect dialect : {ShellDialect::posix, ShellDialect::cmd, ShellDialect::powershell})
        EXPECT_EQ(parseShellDialect(getShellDialectName(dialect)), dialect);

    EXPECT_EQ(getShellDialectName(ShellDialect::posix), "unix");

    EXPECT_THROW(parseShellDialect("bash"), SysError);
    EXPECT_THROW(parseShellDialect(""), SysError);
    EXPECT_THROW(parseShellDialect("Unix"), SysError);
}
