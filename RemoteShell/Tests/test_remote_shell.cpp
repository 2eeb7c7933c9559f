// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/remote_shell.h"

using namespace zen;
using namespace rsh;


namespace
{
//scripted exec channel: unknown commands fail like "command not found"
class FakeExecutor : public ShellExecutor
{
public:
    void setOutput(const std::string& command, const std::string& output) { outputs_[command] = output; }

    void setConnectionLost() { connectionLost_ = true; }

    std::string runCommand(const std::string& command) override //throw SysError, SysErrorExitCode
    {
        commands.push_back(command);

        if (connectionLost_)
            throw SysError(formatSystemError("libssh2_channel_open_session", L"LIBSSH2_ERROR_SOCKET_SEND", L"Unable to send data"));

        if (auto it = outputs_.find(command);
            it != outputs_.end())
            return it->second;

        throw SysErrorExitCode(formatSystemError(command, L"Exit code 127", L"sh: command not found"), 127);
    }

    std::vector<std::string> commands;

private:
    std::map<std::string, std::string> outputs_;
    bool connectionLost_ = false;
};


RemoteShellCfg makeCfg(const Zstring& rootPath, CharEncoding encoding, std::optional<ShellDialect> shellType)
{
    RemoteShellCfg cfg;
    cfg.login.server = "server";
    cfg.login.username = "user";
    cfg.rootPath = rootPath;
    cfg.encoding = encoding;
    cfg.shellType = shellType;
    return cfg;
}


ErrorLogStats fetchExtraLogStats()
{
    return getStats(fetchExtraLog());
}
}


TEST(RemoteShell, UnixHashConfigured)
{
    RemoteShellCfg cfg = makeCfg("/home/user", ENC_PRESET_WIN, ShellDialect::posix);
    cfg.hashCommands[HashAlgorithm::md5]    = "md5sum";
    cfg.hashCommands[HashAlgorithm::sha1]   = HASH_COMMAND_DISABLED;
    cfg.hashCommands[HashAlgorithm::sha256] = HASH_COMMAND_DISABLED;

    FakeExecutor executor;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);
    EXPECT_TRUE(executor.commands.empty()); //nothing to detect

    const std::string command = "md5sum /home/user/my\\ test\xef\xbc\x9a" "file.txt";
    executor.setOutput(command, "0BEE89B07A248E27C83FC3D5951213C1  /home/user/my test\xef\xbc\x9a" "file.txt\n");

    EXPECT_EQ(fs.getFileHash("my test:file.txt", HashAlgorithm::md5, executor), "0bee89b07a248e27c83fc3d5951213c1");
    EXPECT_EQ(executor.commands.back(), command);

    //disabled hash type
    EXPECT_THROW(fs.getFileHash("a.txt", HashAlgorithm::sha1, executor), FileError);
}


TEST(RemoteShell, UnixDetection)
{
    fetchExtraLog();

    FakeExecutor executor;
    executor.setOutput(SHELL_PROBE_COMMAND, "%ComSpec%\n");
    executor.setOutput("echo abc | md5sum",      "0bee89b07a248e27c83fc3d5951213c1  -\n");
    executor.setOutput("echo abc | sha1 -r",     "not a hash\n");
    executor.setOutput("echo abc | shasum -a 1", "03cfd743661f07975fa2f1220c5194cbaff48451  -\n");
    //no sha256 tool at all

    const RemoteShellFs fs = createRemoteShellFs(makeCfg("/home/user", DEFAULT_REMOTE_ENCODING, std::nullopt), executor);

    EXPECT_EQ(fs.getShellDialect(), ShellDialect::posix);
    EXPECT_EQ(fs.getHashCommand(HashAlgorithm::md5), "md5sum");
    EXPECT_EQ(fs.getHashCommand(HashAlgorithm::sha1), "shasum -a 1");
    EXPECT_EQ(fs.getHashCommand(HashAlgorithm::sha256), "");

    EXPECT_EQ(executor.commands.front(), SHELL_PROBE_COMMAND);
    EXPECT_EQ(std::count(executor.commands.begin(), executor.commands.end(), "echo abc | md5 -r"), 0); //first candidate matched

    try
    {
        (void)fs.getFileHash("a.txt", HashAlgorithm::sha256, executor);
        ADD_FAILURE() << "unsupported hash type must fail";
    }
    catch (const FileError& e) { EXPECT_NE(e.toString().find(L"SHA256"), std::wstring::npos); }

    EXPECT_EQ(fetchExtraLogStats().warning, 0);
}


TEST(RemoteShell, PathOverrideAppliedToShellCommands)
{
    RemoteShellCfg cfg = makeCfg("/home/user", ENC_PRESET_WIN, ShellDialect::posix);
    cfg.pathOverride = "@/volume1";
    cfg.hashCommands[HashAlgorithm::sha1] = "sha1sum";

    FakeExecutor executor;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);

    EXPECT_EQ(fs.getProtocolPath("test:file.txt"), "/home/user/test\xef\xbc\x9a" "file.txt");
    EXPECT_EQ(fs.getShellPath   ("test:file.txt"), "/volume1/home/user/test\xef\xbc\x9a" "file.txt");

    executor.setOutput("sha1sum /volume1/home/user/test\xef\xbc\x9a" "file.txt", "8dbc7733dbd10d2efc5c0a0d8dad90f958581821  x\n");
    EXPECT_EQ(fs.getFileHash("test:file.txt", HashAlgorithm::sha1, executor), "8dbc7733dbd10d2efc5c0a0d8dad90f958581821");

    executor.setOutput("df -k /volume1/home/user",
                       "Filesystem     1K-blocks     Used Available Use% Mounted on\n"
                       "/dev/md0        91283092 81111888  10154820  89% /volume1\n");
    EXPECT_EQ(fs.getSpaceUsage(executor), (SpaceUsage{93473886208, 83058573312, 10398535680}));
}


TEST(RemoteShell, DegradedParse)
{
    RemoteShellCfg cfg = makeCfg("", ENC_PRESET_NONE, ShellDialect::posix);
    cfg.hashCommands[HashAlgorithm::md5] = "md5sum";

    FakeExecutor executor;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);
    fetchExtraLog();

    executor.setOutput("md5sum a.txt", "garbage\n");
    EXPECT_EQ(fs.getFileHash("a.txt", HashAlgorithm::md5, executor), "");
    EXPECT_EQ(fetchExtraLogStats().warning, 1);

    //empty root: login directory
    executor.setOutput("df -k .", "unexpected\n");
    EXPECT_EQ(fs.getSpaceUsage(executor), SpaceUsage());
    EXPECT_EQ(fetchExtraLogStats().warning, 1);
}


TEST(RemoteShell, CommandFailure)
{
    RemoteShellCfg cfg = makeCfg("/home/user", ENC_PRESET_NONE, ShellDialect::posix);
    cfg.hashCommands[HashAlgorithm::md5] = "md5sum";

    FakeExecutor executor;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);

    //exit code != 0, e.g. file not found
    EXPECT_THROW(fs.getFileHash("missing.txt", HashAlgorithm::md5, executor), FileError);
}


TEST(RemoteShell, CmdDialect)
{
    RemoteShellCfg cfg = makeCfg("/C:/data", ENC_PRESET_NONE, ShellDialect::cmd);
    cfg.hashCommands[HashAlgorithm::md5] = "md5sum.exe";

    FakeExecutor executor;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);

    EXPECT_EQ(fs.getHashCommand(HashAlgorithm::sha1), ""); //no default

    executor.setOutput("md5sum.exe \"C:/data/a b.txt\"", "0bee89b07a248e27c83fc3d5951213c1 *C:/data/a b.txt\r\n");
    EXPECT_EQ(fs.getFileHash("a b.txt", HashAlgorithm::md5, executor), "0bee89b07a248e27c83fc3d5951213c1");

    //'"' cannot be quoted for cmd
    const size_t commandCount = executor.commands.size();
    EXPECT_THROW(fs.getFileHash("a\"b.txt", HashAlgorithm::md5, executor), FileError);
    EXPECT_EQ(executor.commands.size(), commandCount);

    EXPECT_THROW(fs.getSpaceUsage(executor), FileError);
}


TEST(RemoteShell, PowerShellDialect)
{
    FakeExecutor executor;
    executor.setOutput(SHELL_PROBE_COMMAND, "Microsoft.PowerShell%ComSpec%\r\n");

    const RemoteShellFs fs = createRemoteShellFs(makeCfg("/C:/data", ENC_PRESET_NONE, std::nullopt), executor);
    EXPECT_EQ(fs.getShellDialect(), ShellDialect::powershell);
    EXPECT_EQ(executor.commands.size(), 1U); //no hash probing

    const Zstring hashCommand = getDefaultHashCommand(ShellDialect::powershell, HashAlgorithm::sha256);
    EXPECT_EQ(fs.getHashCommand(HashAlgorithm::sha256), hashCommand);
    EXPECT_NE(hashCommand.find("Get-FileHash -Algorithm SHA256"), Zstring::npos);

    executor.setOutput(hashCommand + " 'C:/data/it''s.txt'", "EDEAAFF3F1774AD2888673770C6D64097E391BC362D7D6FB34982DDF0EFD18CB\r\n");
    EXPECT_EQ(fs.getFileHash("it's.txt", HashAlgorithm::sha256, executor), "edeaaff3f1774ad2888673770c6d64097e391bc362d7d6fb34982ddf0efd18cb");

    executor.setOutput("Get-Item 'C:/data' -ErrorAction Stop | Select-Object -First 1 -ExpandProperty PSDrive | ForEach-Object { \"$($_.Used) $($_.Free)\" }",
                       "100 50\r\n");
    EXPECT_EQ(fs.getSpaceUsage(executor), (SpaceUsage{150, 100, 50}));
}


TEST(RemoteShell, ShellUnavailable)
{
    {
        RemoteShellCfg cfg = makeCfg("/home/user", ENC_PRESET_NONE, std::nullopt);
        cfg.shellDisabled = true;

        FakeExecutor executor;
        const RemoteShellFs fs = createRemoteShellFs(cfg, executor);
        EXPECT_TRUE(executor.commands.empty());
        EXPECT_EQ(fs.getShellDialect(), std::nullopt);

        EXPECT_THROW(fs.getFileHash("a.txt", HashAlgorithm::md5, executor), ErrorShellUnavailable);
        EXPECT_THROW(fs.getSpaceUsage(executor), ErrorShellUnavailable);
    }
    {
        fetchExtraLog();

        FakeExecutor executor;
        executor.setOutput(SHELL_PROBE_COMMAND, "restricted shell\n");

        const RemoteShellFs fs = createRemoteShellFs(makeCfg("/home/user", ENC_PRESET_NONE, std::nullopt), executor);
        EXPECT_EQ(fs.getShellDialect(), std::nullopt);
        EXPECT_EQ(fetchExtraLogStats().warning, 1);

        EXPECT_THROW(fs.getSpaceUsage(executor), ErrorShellUnavailable);
    }
}


TEST(RemoteShell, ConnectionLost)
{
    FakeExecutor executor;
    executor.setConnectionLost();

    EXPECT_THROW(createRemoteShellFs(makeCfg("/home/user", ENC_PRESET_NONE, std::nullopt), executor), FileError);
}


TEST(RemoteShell, DecodeListedName)
{
    FakeExecutor executor;
    RemoteShellCfg cfg = makeCfg("/home/user", ENC_PRESET_WIN, ShellDialect::posix);
    cfg.shellDisabled = true;
    const RemoteShellFs fs = createRemoteShellFs(cfg, executor);

    EXPECT_EQ(fs.getProtocolPath("mydir"), "/home/user/mydir");
    EXPECT_EQ(fs.decodeListedName("mydir", "test\xef\xbc\x9a" "file.txt"), "mydir/test:file.txt");

    EXPECT_EQ(fs.getProtocolPath("parent:dir"), "/home/user/parent\xef\xbc\x9a" "dir");
    EXPECT_EQ(fs.decodeListedName("parent:dir", "file\xef\xbc\x9f.txt"), "parent:dir/file?.txt");

    EXPECT_EQ(fs.decodeListedName("", "a\xef\xbc\x9a"), "a:");

    EXPECT_EQ(fs.getDisplayPath("a:b"), L"sftp://user@server/home/user/a\xff1a" L"b");
}


TEST(RemoteShell, QuotedShellPathLoginDirectory)
{
    const RemotePathResolver loginDir{Zstring(), CharEncoder(ENC_PRESET_NONE), Zstring()};

    EXPECT_EQ(getQuotedShellPath(ShellDialect::posix,      loginDir, ""), ".");
    EXPECT_EQ(getQuotedShellPath(ShellDialect::powershell, loginDir, ""), "'.'");
    EXPECT_EQ(getQuotedShellPath(ShellDialect::cmd,        loginDir, ""), "\".\"");

    EXPECT_EQ(getQuotedShellPath(ShellDialect::posix, loginDir, "a b"), "a\\ b");

    const RemotePathResolver winRoot("/C:/data", CharEncoder(ENC_PRESET_WIN), Zstring());
    EXPECT_EQ(getQuotedShellPath(ShellDialect::powershell, winRoot, "x:y"), "'C:/data/x\xef\xbc\x9ay'");
    EXPECT_THROW(getQuotedShellPath(ShellDialect::cmd, RemotePathResolver("/q\"", CharEncoder(ENC_PRESET_NONE), Zstring()), ""), SysErrorUnsupportedPath);
}
