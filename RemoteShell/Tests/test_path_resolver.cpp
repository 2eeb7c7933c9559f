// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/path_resolver.h"

using namespace zen;
using namespace rsh;


namespace
{
struct ResolveTestCase
{
    const char* name;
    Zstring root;
    const char* encoding;
    Zstring pathOverride;
    Zstring remotePath;
    Zstring expected;
};
}


TEST(PathResolver, ProtocolPath)
{
    const ResolveTestCase testData[] =
    {
        {"no encoding, simple path",        "/home/user", "None", "", "file.txt",      "/home/user/file.txt"},
        {"no encoding, path with colon",    "/home/user", "None", "", "test:file.txt", "/home/user/test:file.txt"},
        {"Win encoding, path with colon",   "/home/user", "Win",  "", "test:file.txt", "/home/user/test\xef\xbc\x9a" "file.txt"},
        {"Win encoding, special chars",     "/home/user", "Win",  "", "file:name?.txt", "/home/user/file\xef\xbc\x9aname\xef\xbc\x9f.txt"},
        {"Win encoding, subdirectory",      "/home/user", "Win",  "", "dir:name/file?.txt", "/home/user/dir\xef\xbc\x9aname/file\xef\xbc\x9f.txt"},
        {"Win encoding, trailing space",    "/home/user", "Win",  "", "trailing space ", "/home/user/trailing space\xe2\x90\xa0"},
        {"Win encoding, trailing period",   "/home/user", "Win",  "", "trailing.",     "/home/user/trailing\xef\xbc\x8e"},
        {"Win encoding, nested dirs",       "/data",      "Win",  "", "backup:/2024-01-01/file<1>.txt", "/data/backup\xef\xbc\x9a/2024-01-01/file\xef\xbc\x9c" "1\xef\xbc\x9e.txt"},
        {"Win encoding, empty remote",      "/home/user", "Win",  "", "",              "/home/user"},
        {"Win encoding, root path",         "/",          "Win",  "", "test:file.txt", "/test\xef\xbc\x9a" "file.txt"},
    };

    for (const ResolveTestCase& tc : testData)
    {
        const CharEncoder encoder(parseCharEncoding(tc.encoding));
        EXPECT_EQ(resolveProtocolPath(tc.root, tc.remotePath, encoder), tc.expected) << tc.name;

        //no override: shell path == protocol path
        EXPECT_EQ(resolveShellPath(tc.root, tc.remotePath, encoder, Zstring()), tc.expected) << tc.name;
    }
}


TEST(PathResolver, ShellPath)
{
    const ResolveTestCase testData[] =
    {
        {"no encoding",           "/home/user", "None", "", "test:file.txt", "/home/user/test:file.txt"},
        {"Win encoding",          "/home/user", "Win",  "", "test:file.txt", "/home/user/test\xef\xbc\x9a" "file.txt"},
        {"Win encoding, nested",  "/home/user", "Win",  "", "dir:1/subdir?/file*.txt", "/home/user/dir\xef\xbc\x9a" "1/subdir\xef\xbc\x9f/file\xef\xbc\x8a.txt"},
        {"plain override",        "/home/user", "Win",  "/mnt/data", "test:file.txt", "/mnt/data/test\xef\xbc\x9a" "file.txt"},
        {"mount prefix override", "/home/user", "Win",  "@/volume1", "test:file.txt", "/volume1/home/user/test\xef\xbc\x9a" "file.txt"},
        {"mount prefix, empty remote", "/home/user", "None", "@/volume1", "", "/volume1/home/user"},
        {"plain override, empty remote", "/home/user", "None", "/mnt/data", "", "/mnt/data"},
        {"override with trailing slash", "/home/user", "None", "/mnt/data/", "f", "/mnt/data/f"},
        {"bare mount prefix",     "/home/user", "None", "@", "f", "/home/user/f"},
    };

    for (const ResolveTestCase& tc : testData)
        EXPECT_EQ(resolveShellPath(tc.root, tc.remotePath, CharEncoder(parseCharEncoding(tc.encoding)), tc.pathOverride), tc.expected) << tc.name;
}


TEST(PathResolver, AppendPath)
{
    EXPECT_EQ(appendRemotePath("/home/user", ""), "/home/user");
    EXPECT_EQ(appendRemotePath("/home/user", "a/b"), "/home/user/a/b");
    EXPECT_EQ(appendRemotePath("/home/user/", "/a"), "/home/user/a");
    EXPECT_EQ(appendRemotePath("/", "a"), "/a");
    EXPECT_EQ(appendRemotePath("", "a"), "a");
    EXPECT_EQ(appendRemotePath("", ""), "");
}


TEST(PathResolver, ResolverObject)
{
    const RemotePathResolver resolver("/home/user", CharEncoder(ENC_PRESET_WIN), "@/volume1");

    EXPECT_EQ(resolver.getProtocolPath("a:b"), "/home/user/a\xef\xbc\x9a" "b");
    EXPECT_EQ(resolver.getShellPath   ("a:b"), "/volume1/home/user/a\xef\xbc\x9a" "b");

    //segment order is never changed
    EXPECT_EQ(resolver.getProtocolPath("z/y/x"), "/home/user/z/y/x");
}


TEST(PathResolver, EndToEnd)
{
    const CharEncoder encoder(parseCharEncoding("Win"));

    EXPECT_EQ(resolveProtocolPath("/home/user", "test:file.txt", encoder), "/home/user/test\xef\xbc\x9a" "file.txt");
    EXPECT_EQ(encoder.toStandardName("test\xef\xbc\x9a" "file.txt"), "test:file.txt");

    //directory listing: encoded directory path for reading, decoded child names
    EXPECT_EQ(resolveProtocolPath("/home/user", "parent:dir", encoder), "/home/user/parent\xef\xbc\x9a" "dir");
    EXPECT_EQ(appendRemotePath("parent:dir", encoder.toStandardName("file\xef\xbc\x9f.txt")), "parent:dir/file?.txt");
}


TEST(PathResolver, DialectPath)
{
    EXPECT_EQ(toDialectPath(ShellDialect::cmd,        "/C:/data"), "C:/data");
    EXPECT_EQ(toDialectPath(ShellDialect::powershell, "/d:/"), "d:/");
    EXPECT_EQ(toDialectPath(ShellDialect::posix,      "/C:/data"), "/C:/data");
    EXPECT_EQ(toDialectPath(ShellDialect::cmd,        "/home/user"), "/home/user");
    EXPECT_EQ(toDialectPath(ShellDialect::cmd,        "/C"), "/C");
}
