// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>
#include <zen/file_error.h>
#include "afs/remote_shell.h"
#include "afs/ssh_exec.h"
#include "base/return_codes.h"

using namespace zen;
using namespace rsh;


namespace
{
const wchar_t TAB_SPACE[] = L"    ";


void showSyntaxHelp()
{
    std::cerr << utfTo<std::string>(_("Syntax:") + L"\n\n" +
                                    L"rshell <sftp://user@server/path[|option=value]> <command> [arguments]" L"\n\n" +
                                    _("Commands:") + L'\n' +
                                    TAB_SPACE + L"resolve <path>              " + _("Show SFTP and shell path of a remote item.") + L'\n' +
                                    TAB_SPACE + L"quote <path>                " + _("Show remote path as quoted for the shell.") + L'\n' +
                                    TAB_SPACE + L"encode <name>               " + _("Encode a file name for storage on the remote host.") + L'\n' +
                                    TAB_SPACE + L"decode <name>               " + _("Decode a file name listed on the remote host.") + L'\n' +
                                    TAB_SPACE + L"hash <md5|sha1|sha256> <path>  " + _("Calculate hash of a remote file.") + L'\n' +
                                    TAB_SPACE + L"about                       " + _("Show disk usage of the remote root folder.") + L'\n' +
                                    TAB_SPACE + L"detect                      " + _("Show shell type and hash commands of the remote host.") + L'\n') << std::flush;
}


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


void printLine(const Zstring& line)
{
    std::cout << line << '\n';
}


void printErrorLog(const ErrorLog& log)
{
    for (const LogEntry& entry : log)
        std::cerr << formatMessage(entry);
}


class RemoteSession
{
public:
    explicit RemoteSession(const RemoteShellCfg& cfg) : cfg_(cfg) //throw FileError
    {
        libssh2Init(); //throw SysError
        ZEN_ON_SCOPE_FAIL(libssh2TearDown());
        try
        {
            executor_ = std::make_unique<SshShellExecutor>(cfg.login); //throw SysError, SysErrorPassword
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getRemoteDisplayPath(cfg, Zstring()))), e.toString()); }
    }

    ~RemoteSession()
    {
        executor_.reset(); //before libssh2 tear down!
        libssh2TearDown();
    }

    ShellExecutor& getExecutor() { return *executor_; }

    RemoteShellFs createFs() { return createRemoteShellFs(cfg_, *executor_); } //throw FileError

private:
    RemoteSession           (const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    const RemoteShellCfg cfg_;
    std::unique_ptr<SshShellExecutor> executor_;
};


void runCommand(const std::vector<Zstring>& args) //throw FileError, SysError
{
    if (args.size() < 2)
        throw SysError(_("Missing command line arguments."));

    const Zstring& phrase  = args[0];
    const Zstring& command = args[1];
    const std::vector<Zstring> cmdArgs(args.begin() + 2, args.end());

    auto requireArgs = [&](size_t count)
    {
        if (cmdArgs.size() != count)
            throw SysError(replaceCpy(_("Wrong number of arguments for command %x."), L"%x", fmtPath(command)));
    };

    if (!acceptsRemotePhrase(phrase))
        throw SysError(replaceCpy(_("Invalid remote path %x. Expected syntax: sftp://user@server/path"), L"%x", fmtPath(phrase)));

    const RemoteShellCfg cfg = parseRemotePhrase(phrase); //throw SysError
    const CharEncoder encoder(cfg.encoding);
    const RemotePathResolver resolver(cfg.rootPath, encoder, cfg.pathOverride);

    if (command == Zstr("resolve"))
    {
        requireArgs(1);
        printLine(resolver.getProtocolPath(cmdArgs[0]));
        printLine(resolver.getShellPath   (cmdArgs[0]));
    }
    else if (command == Zstr("encode"))
    {
        requireArgs(1);
        printLine(encoder.fromStandardName(cmdArgs[0]));
    }
    else if (command == Zstr("decode"))
    {
        requireArgs(1);
        printLine(encoder.toStandardName(cmdArgs[0]));
    }
    else if (command == Zstr("quote"))
    {
        requireArgs(1);
        auto printQuoted = [&](ShellDialect dialect)
        {
            try
            {
                printLine(getQuotedShellPath(dialect, resolver, cmdArgs[0])); //throw SysErrorUnsupportedPath
            }
            catch (const SysErrorUnsupportedPath& e)
            {
                throw FileError(replaceCpy(_("Cannot quote path %x."), L"%x", fmtPath(toDialectPath(dialect, resolver.getShellPath(cmdArgs[0])))), e.toString());
            }
        };

        if (cfg.shellType) //offline
            printQuoted(*cfg.shellType);
        else
        {
            RemoteSession session(cfg); //throw FileError
            const RemoteShellFs fs = session.createFs(); //throw FileError
            if (!fs.getShellDialect())
                throw ErrorShellUnavailable(replaceCpy(_("Cannot quote path %x."), L"%x", fmtPath(fs.getDisplayPath(cmdArgs[0]))),
                                            _("The remote host does not provide a supported shell."));
            printQuoted(*fs.getShellDialect());
        }
    }
    else if (command == Zstr("hash"))
    {
        requireArgs(2);
        const HashAlgorithm algo = parseHashAlgorithm(cmdArgs[0]); //throw SysError

        RemoteSession session(cfg); //throw FileError
        const RemoteShellFs fs = session.createFs(); //throw FileError

        const std::string hash = fs.getFileHash(cmdArgs[1], algo, session.getExecutor()); //throw FileError
        if (!hash.empty())
            printLine(hash + "  " + cmdArgs[1]);
    }
    else if (command == Zstr("about"))
    {
        requireArgs(0);
        RemoteSession session(cfg); //throw FileError
        const RemoteShellFs fs = session.createFs(); //throw FileError

        const SpaceUsage usage = fs.getSpaceUsage(session.getExecutor()); //throw FileError
        printLine("Total:     " + numberTo<Zstring>(usage.bytesTotal));
        printLine("Used:      " + numberTo<Zstring>(usage.bytesUsed));
        printLine("Available: " + numberTo<Zstring>(usage.bytesAvail));
    }
    else if (command == Zstr("detect"))
    {
        requireArgs(0);
        RemoteSession session(cfg); //throw FileError
        const RemoteShellFs fs = session.createFs(); //throw FileError

        printLine("shell:     " + (fs.getShellDialect() ? getShellDialectName(*fs.getShellDialect()) : std::string(HASH_COMMAND_DISABLED)));

        for (const HashAlgorithm algo : {HashAlgorithm::md5, HashAlgorithm::sha1, HashAlgorithm::sha256})
        {
            const Zstring& hashCommand = fs.getHashCommand(algo);
            printLine(getHashAlgorithmName(algo) + "sum: " + (hashCommand.empty() ? HASH_COMMAND_DISABLED : hashCommand));
        }
    }
    else
        throw SysError(replaceCpy(_("Unknown command %x."), L"%x", fmtPath(command)));
}
}


int main(int argc, char* argv[])
{
    //report log entries that nobody fetched, e.g. from a failed SSH disconnect during shutdown
    initExtraLog([](const ErrorLog& log) { printErrorLog(log); });

    //remove first argument which is exe path by convention
    const std::vector<Zstring> args(argv + std::min(argc, 1), argv + argc);

    RshReturnCode returnCode = RSH_RC_SUCCESS;
    try
    {
        runCommand(args); //throw FileError, SysError
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        raiseReturnCode(returnCode, RSH_RC_ERROR);
    }
    catch (const SysError& e) //command line errors
    {
        notifyAppError(e.toString());
        showSyntaxHelp();
        raiseReturnCode(returnCode, RSH_RC_ERROR);
    }
    catch (const std::exception& e)
    {
        notifyAppError(utfTo<std::wstring>(std::string(e.what())));
        raiseReturnCode(returnCode, RSH_RC_EXCEPTION);
    }

    const ErrorLog extraLog = fetchExtraLog();
    printErrorLog(extraLog);
    raiseReturnCode(returnCode, mapToReturnCode(getStats(extraLog)));

    return static_cast<int>(returnCode);
}
