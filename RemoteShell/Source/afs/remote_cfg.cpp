// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_cfg.h"

using namespace zen;
using namespace rsh;


namespace
{
const Zchar sftpPrefix[] = Zstr("sftp:");

const HashAlgorithm allHashAlgorithms[] = {HashAlgorithm::md5, HashAlgorithm::sha1, HashAlgorithm::sha256};


Zstring getHashOptionName(HashAlgorithm algo)
{
    return getHashAlgorithmName(algo) + Zstr("sum"); //"md5sum", "sha1sum", "sha256sum"
}


//according to the SFTP path syntax, the username must not contain raw @ and :
//-> we don't need a full urlencode!
Zstring encodeUsername(Zstring name)
{
    replace(name, Zstr('%'), Zstr("%25")); //first!
    replace(name, Zstr('@'), Zstr("%40"));
    replace(name, Zstr(':'), Zstr("%3A"));
    return name;
}


Zstring decodeUsername(Zstring name)
{
    replace(name, Zstr("%40"), Zstr('@'));
    replace(name, Zstr("%3A"), Zstr(':'));
    replace(name, Zstr("%3a"), Zstr(':'));
    replace(name, Zstr("%25"), Zstr('%')); //last!
    return name;
}


//"2001:db8::ff00:42:8329", "[::1]:2222", "[::1]" => address + port (0 if none)
std::optional<std::pair<Zstring, int>> parseIpv6Address(ZstringView str)
{
    if (startsWith(str, Zstr('[')))
    {
        const size_t posEnd = str.find(Zstr(']'));
        if (posEnd == ZstringView::npos)
            return std::nullopt;

        const ZstringView address = str.substr(1, posEnd - 1);
        const ZstringView rest    = str.substr(posEnd + 1);

        int port = 0;
        if (!rest.empty())
        {
            if (!startsWith(rest, Zstr(':')))
                return std::nullopt;
            port = stringTo<int>(rest.substr(1));
        }
        return std::pair(Zstring(address), port);
    }

    //unbracketed: at least two colons and nothing but hex digits, colons and dots (IPv4-mapped)
    if (std::count(str.begin(), str.end(), Zstr(':')) >= 2 &&
        std::all_of(str.begin(), str.end(), [](Zchar c) { return isHexDigit(c) || c == Zstr(':') || c == Zstr('.'); }))
        return std::pair(Zstring(str), 0);

    return std::nullopt;
}


Zstring formatServerPort(const SftpLogin& login)
{
    Zstring server = login.server;
    if (parseIpv6Address(server) && login.portCfg > 0)
        server = Zstr('[') + server + Zstr(']'); //e.g. [::1]:2222

    if (login.portCfg > 0)
        server += Zstr(':') + numberTo<Zstring>(login.portCfg);
    return server;
}


std::wstring fmtOption(ZstringView optPhrase)
{
    return L'"' + utfTo<std::wstring>(optPhrase) + L'"';
}
}


std::string rsh::getHashAlgorithmName(HashAlgorithm algo)
{
    switch (algo)
    {
        case HashAlgorithm::md5:
            return "md5";
        case HashAlgorithm::sha1:
            return "sha1";
        case HashAlgorithm::sha256:
            return "sha256";
    }
    assert(false);
    return std::string();
}


HashAlgorithm rsh::parseHashAlgorithm(const std::string& name) //throw SysError
{
    for (const HashAlgorithm algo : allHashAlgorithms)
        if (equalAsciiNoCase(name, getHashAlgorithmName(algo)))
            return algo;

    throw SysError(replaceCpy(_("Unknown hash algorithm %x."), L"%x", fmtOption(name)));
}


bool rsh::acceptsRemotePhrase(const Zstring& phrase) //noexcept
{
    return startsWithAsciiNoCase(trimCpy(phrase), sftpPrefix);
}


RemoteShellCfg rsh::parseRemotePhrase(const Zstring& phrase) //throw SysError
{
    Zstring pathPhrase = trimCpy(phrase);

    if (!startsWithAsciiNoCase(pathPhrase, sftpPrefix))
        throw SysError(replaceCpy(_("Invalid remote path %x. Expected syntax: sftp://user@server/path"), L"%x", fmtOption(phrase)));

    pathPhrase = pathPhrase.substr(std::size(sftpPrefix) - 1);
    trim(pathPhrase, TrimSide::left, [](Zchar c) { return c == Zstr('/') || c == Zstr('\\'); });

    const ZstringView fullPath = beforeFirst<ZstringView>(pathPhrase, Zstr('|'), IfNotFoundReturn::all);
    const ZstringView options  =  afterFirst<ZstringView>(pathPhrase, Zstr('|'), IfNotFoundReturn::none);

    //'@' in root path or options (e.g. path_override=@/volume1) is not a credentials separator
    const auto itPath = std::find(fullPath.begin(), fullPath.end(), Zstr('/'));
    const ZstringView authority = fullPath.substr(0, itPath - fullPath.begin());

    const ZstringView credentials = beforeLast(authority, Zstr('@'), IfNotFoundReturn::none);
    const ZstringView serverPort  =  afterLast(authority, Zstr('@'), IfNotFoundReturn::all);

    RemoteShellCfg cfg;
    cfg.login.username = decodeUsername(Zstring(beforeFirst(credentials, Zstr(':'), IfNotFoundReturn::all)));
    cfg.login.password =                Zstring( afterFirst(credentials, Zstr(':'), IfNotFoundReturn::none));

    cfg.rootPath = Zstring(fullPath.substr(itPath - fullPath.begin()));
    if (cfg.rootPath.size() > 1)
        trim(cfg.rootPath, TrimSide::right, [](Zchar c) { return c == Zstr('/'); });

    if (std::optional<std::pair<Zstring, int /*optional: port*/>> ip6AndPort = parseIpv6Address(serverPort))
    {
        cfg.login.server  = ip6AndPort->first;
        cfg.login.portCfg = ip6AndPort->second; //0 if empty
    }
    else
    {
        cfg.login.server       = Zstring(beforeLast(serverPort, Zstr(':'), IfNotFoundReturn::all));
        const ZstringView port =          afterLast(serverPort, Zstr(':'), IfNotFoundReturn::none);
        cfg.login.portCfg = stringTo<int>(port); //0 if empty
    }

    if (cfg.login.server.empty())
        throw SysError(_("Server name must not be empty."));

    split(options, Zstr('|'), [&](ZstringView optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (optPhrase.empty())
            return;

        const ZstringView optName  = beforeFirst(optPhrase, Zstr('='), IfNotFoundReturn::all);
        const Zstring     optValue = Zstring(afterFirst(optPhrase, Zstr('='), IfNotFoundReturn::none));

        if (optName == Zstr("timeout"))
            cfg.login.timeoutSec = std::max(1, stringTo<int>(optValue));
        else if (optName == Zstr("keyfile"))
        {
            cfg.login.authType = SftpAuthType::keyFile;
            cfg.login.privateKeyFilePath = optValue;
        }
        else if (optPhrase == Zstr("agent"))
            cfg.login.authType = SftpAuthType::agent;
        else if (optPhrase == Zstr("zlib"))
            cfg.login.allowZlib = true;
        else if (optName == Zstr("shell"))
        {
            if (optValue == Zstr("none"))
            {
                cfg.shellDisabled = true;
                cfg.shellType = std::nullopt;
            }
            else
            {
                cfg.shellDisabled = false;
                cfg.shellType = parseShellDialect(optValue); //throw SysError
            }
        }
        else if (optName == Zstr("enc"))
            cfg.encoding = parseCharEncoding(optValue); //throw SysError
        else if (optName == Zstr("path_override"))
            cfg.pathOverride = optValue;
        else
        {
            for (const HashAlgorithm algo : allHashAlgorithms)
                if (optName == getHashOptionName(algo))
                {
                    if (trimCpy(optValue).empty())
                        throw SysError(replaceCpy(_("Missing value for option %x."), L"%x", fmtOption(optName)));

                    cfg.hashCommands[algo] = trimCpy(optValue);
                    return;
                }

            throw SysError(replaceCpy(_("Unknown option %x."), L"%x", fmtOption(optPhrase)));
        }
    });

    return cfg;
}


//expects "clean" configuration data
Zstring rsh::concatenateRemotePhrase(const RemoteShellCfg& cfg) //noexcept
{
    Zstring username;
    if (!cfg.login.username.empty())
        username = encodeUsername(cfg.login.username) + Zstr("@");

    Zstring rootPath = cfg.rootPath;
    if (!rootPath.empty() && !startsWith(rootPath, Zstr('/')))
        rootPath = Zstr('/') + rootPath;

    const SftpLogin loginDefault;

    Zstring options;
    if (cfg.login.timeoutSec != loginDefault.timeoutSec)
        options += Zstr("|timeout=") + numberTo<Zstring>(cfg.login.timeoutSec);

    if (cfg.login.allowZlib)
        options += Zstr("|zlib");

    switch (cfg.login.authType)
    {
        case SftpAuthType::password:
            break;

        case SftpAuthType::keyFile:
            options += Zstr("|keyfile=") + cfg.login.privateKeyFilePath;
            break;

        case SftpAuthType::agent:
            options += Zstr("|agent");
            break;
    }

    if (cfg.shellDisabled)
        options += Zstr("|shell=none");
    else if (cfg.shellType)
        options += Zstr("|shell=") + getShellDialectName(*cfg.shellType);

    if (cfg.encoding != DEFAULT_REMOTE_ENCODING)
        options += Zstr("|enc=") + formatCharEncoding(cfg.encoding);

    if (!cfg.pathOverride.empty())
        options += Zstr("|path_override=") + cfg.pathOverride;

    for (const auto& [algo, command] : cfg.hashCommands)
        options += Zstr('|') + getHashOptionName(algo) + Zstr('=') + command;

    return Zstring(sftpPrefix) + Zstr("//") + username + formatServerPort(cfg.login) + rootPath + options;
}


std::wstring rsh::getRemoteDisplayPath(const RemoteShellCfg& cfg, const Zstring& protocolPath)
{
    Zstring displayPath = Zstring(sftpPrefix) + Zstr("//");

    if (!cfg.login.username.empty()) //show username!
        displayPath += cfg.login.username + Zstr('@');

    displayPath += formatServerPort(cfg.login);

    if (!protocolPath.empty())
    {
        if (!startsWith(protocolPath, Zstr('/')))
            displayPath += Zstr('/');
        displayPath += protocolPath;
    }
    return utfTo<std::wstring>(displayPath);
}
