// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/diag_parse.h"

using namespace zen;
using namespace rsh;


TEST(DiagParse, Hash)
{
    EXPECT_EQ(parseHash("8dbc7733dbd10d2efc5c0a0d8dad90f958581821  RELEASE.md\n"), "8dbc7733dbd10d2efc5c0a0d8dad90f958581821");
    EXPECT_EQ(parseHash("03cfd743661f07975fa2f1220c5194cbaff48451  -\n"), "03cfd743661f07975fa2f1220c5194cbaff48451");

    //GNU coreutils: escaped file name
    EXPECT_EQ(parseHash("\\0bee89b07a248e27c83fc3d5951213c1  a\\\\b\n"), "0bee89b07a248e27c83fc3d5951213c1");
    //PowerShell Get-FileHash: upper-case, no file name; returned verbatim
    EXPECT_EQ(parseHash("  0BEE89B07A248E27C83FC3D5951213C1\r\n"), "0BEE89B07A248E27C83FC3D5951213C1");
    //no length check
    EXPECT_EQ(parseHash("abc"), "abc");

    EXPECT_EQ(parseHash(""), "");
    EXPECT_EQ(parseHash("\n"), "");
    EXPECT_EQ(parseHash("md5sum: foo: No such file or directory\n"), "");
    EXPECT_EQ(parseHash("0bee89b0-7a248e27  x\n"), "");
}


TEST(DiagParse, Usage)
{
    EXPECT_EQ(parseUsage("Filesystem     1K-blocks     Used Available Use% Mounted on\n"
                         "/dev/root       91283092 81111888  10154820  89% /"),
              (SpaceUsage{93473886208, 83058573312, 10398535680}));

    EXPECT_EQ(parseUsage("Filesystem     1K-blocks  Used Available Use% Mounted on\n"
                         "tmpfs             818256  1636    816620   1% /run"),
              (SpaceUsage{837894144, 1675264, 836218880}));

    EXPECT_EQ(parseUsage("Filesystem   1024-blocks     Used Available Capacity iused      ifree %iused  Mounted on\n"
                         "/dev/disk0s2   244277768 94454848 149566920    39%  997820 4293969459    0%   /"),
              (SpaceUsage{250140434432, 96721764352, 153156526080}));
}


TEST(DiagParse, UsageHeaderIndependent)
{
    const char dataLine[] = "/dev/root       91283092 81111888  10154820  89% /\n";

    EXPECT_EQ(parseUsage(std::string("Filesystem     1K-blocks     Used Available Use% Mounted on\n") + dataLine),
              parseUsage(std::string("Filesystem   1024-blocks     Used Available Capacity iused ifree %iused  Mounted on\n") + dataLine));
}


TEST(DiagParse, UsageWrappedDeviceName)
{
    EXPECT_EQ(parseUsage("Filesystem     1K-blocks     Used Available Use% Mounted on\n"
                         "server.example.com:/export/home\n"
                         "                91283092 81111888  10154820  89% /home\n"),
              (SpaceUsage{93473886208, 83058573312, 10398535680}));
}


TEST(DiagParse, UsageMalformed)
{
    const SpaceUsage zero;

    EXPECT_EQ(parseUsage(""), zero);
    EXPECT_EQ(parseUsage("Filesystem     1K-blocks     Used Available Use% Mounted on\n"), zero); //no data line
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used\n/dev/root 100 50\n"), zero); //too few columns
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used Available\n/dev/root 100 abc 50\n"), zero);
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used Available\n/dev/root -100 50 50\n"), zero);
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used Available\n/dev/root 1.5 50 50\n"), zero);
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used Available\n/dev/root 99999999999999999999 1 1\n"), zero); //uint64 overflow
    EXPECT_EQ(parseUsage("Filesystem 1K-blocks Used Available\n/dev/root 18014398509481984 1 1\n"), zero); //overflow after * 1024
    EXPECT_EQ(parseUsage("df: /nonexistent: No such file or directory\n"), zero);
}


TEST(DiagParse, PowerShellUsage)
{
    EXPECT_EQ(parsePowerShellUsage("81111888 10154820\r\n"), (SpaceUsage{91266708, 81111888, 10154820}));

    EXPECT_EQ(parsePowerShellUsage(""), SpaceUsage());
    EXPECT_EQ(parsePowerShellUsage(" 10154820\r\n"), SpaceUsage());
    EXPECT_EQ(parsePowerShellUsage("x 1"), SpaceUsage());
    EXPECT_EQ(parsePowerShellUsage("18446744073709551615 1"), SpaceUsage()); //overflow
}


TEST(DiagParse, ShellProbe)
{
    EXPECT_EQ(parseShellProbe("%ComSpec%\n"), ShellDialect::posix);
    EXPECT_EQ(parseShellProbe("${ShellId}C:\\Windows\\system32\\cmd.exe\r\n"), ShellDialect::cmd);
    EXPECT_EQ(parseShellProbe("Microsoft.PowerShell%ComSpec%\r\n"), ShellDialect::powershell);

    EXPECT_EQ(parseShellProbe(""), std::nullopt);
    EXPECT_EQ(parseShellProbe("something else\n"), std::nullopt);
}
