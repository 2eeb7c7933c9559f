// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_shell.h"
#include <algorithm>
#include <zen/open_ssl.h>

using namespace zen;
using namespace rsh;


namespace
{
const HashAlgorithm allHashAlgorithms[] = {HashAlgorithm::md5, HashAlgorithm::sha1, HashAlgorithm::sha256};

//"echo abc | md5sum" => "0bee89b07a248e27c83fc3d5951213c1  -"
const char HASH_PROBE_TEXT[] = "abc";


DigestType getDigestType(HashAlgorithm algo)
{
    switch (algo)
    {
        case HashAlgorithm::md5:
            return DigestType::md5;
        case HashAlgorithm::sha1:
            return DigestType::sha1;
        case HashAlgorithm::sha256:
            return DigestType::sha256;
    }
    assert(false);
    return DigestType::md5;
}


std::wstring getHashDisplayName(HashAlgorithm algo)
{
    std::wstring name = utfTo<std::wstring>(getHashAlgorithmName(algo));
    std::transform(name.begin(), name.end(), name.begin(), [](wchar_t c) { return asciiToUpper(c); });
    return name;
}


std::string toLowerHex(std::string hash)
{
    std::transform(hash.begin(), hash.end(), hash.begin(), [](char c) { return asciiToLower(c); });
    return hash;
}


std::optional<ShellDialect> detectShellDialect(const RemoteShellCfg& cfg, ShellExecutor& executor) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot determine shell type of %x."), L"%x", fmtPath(getRemoteDisplayPath(cfg, Zstring())));
    try
    {
        const std::string output = executor.runCommand(SHELL_PROBE_COMMAND); //throw SysError, SysErrorExitCode

        if (const std::optional<ShellDialect> dialect = parseShellProbe(output))
            return dialect;

        logExtraWarning(errorMsg + L"\n\n" + replaceCpy<std::wstring>(L"Unexpected output: %x", L"%x", utfTo<std::wstring>(trimCpy(output))));
        return std::nullopt;
    }
    catch (const SysErrorExitCode& e) //exec channel is there, but no shell we know
    {
        logExtraWarning(errorMsg + L"\n\n" + e.toString());
        return std::nullopt;
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


Zstring probeHashCommand(const RemoteShellCfg& cfg, HashAlgorithm algo, ShellExecutor& executor) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot determine %y hash command of %x."), L"%x", fmtPath(getRemoteDisplayPath(cfg, Zstring()))),
                                             L"%y", getHashDisplayName(algo));
    try
    {
        const std::string expectedHash = formatAsHexString(createHash(std::string(HASH_PROBE_TEXT) + '\n' /*appended by echo*/, getDigestType(algo))); //throw SysError

        for (const Zstring& command : getHashCommandCandidates(algo))
            try
            {
                const std::string output = executor.runCommand(std::string("echo ") + HASH_PROBE_TEXT + " | " + command); //throw SysError, SysErrorExitCode
                if (toLowerHex(parseHash(output)) == expectedHash)
                    return command;
            }
            catch (const SysErrorExitCode&) {} //e.g. 127: command not found => try next candidate

        return Zstring();
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}
}


Zstring rsh::getDefaultHashCommand(ShellDialect dialect, HashAlgorithm algo)
{
    switch (dialect)
    {
        case ShellDialect::posix: //needs probing
        case ShellDialect::cmd:   //no built-in hash tool
            return Zstring();

        case ShellDialect::powershell:
        {
            const Zstring algoName = [&]
            {
                switch (algo)
                {
                    //*INDENT-OFF*
                    case HashAlgorithm::md5:    return Zstr("MD5");
                    case HashAlgorithm::sha1:   return Zstr("SHA1");
                    case HashAlgorithm::sha256: return Zstr("SHA256");
                    //*INDENT-ON*
                }
                assert(false);
                return Zstr("");
            }();
            //script block taking the quoted path as argument
            return Zstr("&{param($Path) Get-FileHash -Algorithm ") + algoName +
                   Zstr(" -LiteralPath $Path -ErrorAction Stop | Select-Object -First 1 -ExpandProperty Hash}");
        }
    }
    assert(false);
    return Zstring();
}


std::vector<Zstring> rsh::getHashCommandCandidates(HashAlgorithm algo)
{
    switch (algo)
    {
        case HashAlgorithm::md5:
            return {Zstr("md5sum"), Zstr("md5 -r")};
        case HashAlgorithm::sha1:
            return {Zstr("sha1sum"), Zstr("sha1 -r"), Zstr("shasum -a 1")};
        case HashAlgorithm::sha256:
            return {Zstr("sha256sum"), Zstr("sha256 -r"), Zstr("shasum -a 256")};
    }
    assert(false);
    return {};
}


RemoteShellFs rsh::createRemoteShellFs(const RemoteShellCfg& cfg, ShellExecutor& executor) //throw FileError
{
    std::optional<ShellDialect> dialect;
    if (!cfg.shellDisabled)
        dialect = cfg.shellType ? cfg.shellType : detectShellDialect(cfg, executor); //throw FileError

    std::map<HashAlgorithm, Zstring> hashCommands;
    for (const HashAlgorithm algo : allHashAlgorithms)
    {
        Zstring& command = hashCommands[algo];

        if (!dialect)
            continue;

        if (auto it = cfg.hashCommands.find(algo);
            it != cfg.hashCommands.end())
        {
            if (it->second != HASH_COMMAND_DISABLED)
                command = it->second;
        }
        else if (*dialect == ShellDialect::posix)
            command = probeHashCommand(cfg, algo, executor); //throw FileError
        else
            command = getDefaultHashCommand(*dialect, algo);
    }

    return RemoteShellFs(cfg, dialect, hashCommands);
}


const Zstring& RemoteShellFs::getHashCommand(HashAlgorithm algo) const
{
    static const Zstring noCommand;
    auto it = hashCommands_.find(algo);
    return it != hashCommands_.end() ? it->second : noCommand;
}


Zstring RemoteShellFs::decodeListedName(const Zstring& dirRemotePath, const Zstring& storedName) const
{
    return appendRemotePath(dirRemotePath, resolver_.getEncoder().toStandardName(storedName));
}


ShellDialect RemoteShellFs::getDialectOrThrow(const std::wstring& errorMsg) const //throw ErrorShellUnavailable
{
    if (!dialect_)
        throw ErrorShellUnavailable(errorMsg, cfg_.shellDisabled ?
                                    _("Shell access is disabled.") :
                                    _("The remote host does not provide a supported shell."));
    return *dialect_;
}


std::string rsh::getQuotedShellPath(ShellDialect dialect, const RemotePathResolver& resolver, const Zstring& remotePath) //throw SysErrorUnsupportedPath
{
    Zstring shellPath = toDialectPath(dialect, resolver.getShellPath(remotePath));
    if (shellPath.empty()) //login directory
        shellPath = Zstr(".");

    return quoteOrEscapeShellPath(dialect, shellPath); //throw SysErrorUnsupportedPath
}


std::string RemoteShellFs::getFileHash(const Zstring& remotePath, HashAlgorithm algo, ShellExecutor& executor) const //throw FileError, ErrorShellUnavailable
{
    const std::wstring errorMsg = replaceCpy(_("Cannot calculate hash of %x."), L"%x", fmtPath(getDisplayPath(remotePath)));

    const ShellDialect dialect = getDialectOrThrow(errorMsg); //throw ErrorShellUnavailable

    const Zstring& hashCommand = getHashCommand(algo);
    if (hashCommand.empty())
        throw FileError(errorMsg, replaceCpy(_("Hash type %x is not supported by the remote host."), L"%x", getHashDisplayName(algo)));
    try
    {
        const std::string output = executor.runCommand(hashCommand + ' ' + getQuotedShellPath(dialect, resolver_, remotePath)); //throw SysError, SysErrorExitCode

        const std::string hash = toLowerHex(parseHash(output));
        if (hash.empty())
            logExtraWarning(errorMsg + L"\n\n" + replaceCpy<std::wstring>(L"Unexpected output: %x", L"%x", utfTo<std::wstring>(trimCpy(output))));
        return hash;
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


SpaceUsage RemoteShellFs::getSpaceUsage(ShellExecutor& executor) const //throw FileError, ErrorShellUnavailable
{
    const std::wstring errorMsg = replaceCpy(_("Cannot determine free disk space for %x."), L"%x", fmtPath(getDisplayPath(Zstring())));

    const ShellDialect dialect = getDialectOrThrow(errorMsg); //throw ErrorShellUnavailable
    try
    {
        SpaceUsage usage;
        std::string output;
        switch (dialect)
        {
            case ShellDialect::posix:
                output = executor.runCommand("df -k " + getQuotedShellPath(dialect, resolver_, Zstring())); //throw SysError, SysErrorExitCode
                usage = parseUsage(output);
                break;

            case ShellDialect::powershell:
                output = executor.runCommand("Get-Item " + getQuotedShellPath(dialect, resolver_, Zstring()) + //throw SysError, SysErrorUnsupportedPath
                                             " -ErrorAction Stop | Select-Object -First 1 -ExpandProperty PSDrive | ForEach-Object { \"$($_.Used) $($_.Free)\" }");
                usage = parsePowerShellUsage(output);
                break;

            case ShellDialect::cmd:
                throw SysError(replaceCpy(_("Operation not supported by shell type %x."), L"%x", utfTo<std::wstring>(getShellDialectName(dialect))));
        }

        if (usage == SpaceUsage())
            logExtraWarning(errorMsg + L"\n\n" + replaceCpy<std::wstring>(L"Unexpected output: %x", L"%x", utfTo<std::wstring>(trimCpy(output))));
        return usage;
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}
