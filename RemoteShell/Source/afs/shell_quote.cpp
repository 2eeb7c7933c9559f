// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "shell_quote.h"

using namespace zen;
using namespace rsh;


namespace
{
bool isSafePosixChar(char c)
{
    if (!isAsciiChar(c)) //UTF-8 sequences are harmless for sh
        return true;

    if (isAsciiAlpha(c) || isDigit(c))
        return true;

    switch (c)
    {
        case '_':
        case '.':
        case ',':
        case ':':
        case '/':
        case '@':
        case '-':
            return true;
    }
    return false;
}


std::string escapePosixPath(const Zstring& path)
{
    std::string output;
    output.reserve(path.size() * 2);

    for (const char c : path)
        if (c == '\n')
            output += "'\n'"; //backslash + line feed would be a line continuation
        else
        {
            if (!isSafePosixChar(c))
                output += '\\';
            output += c;
        }
    return output;
}
}


ShellDialect rsh::parseShellDialect(const std::string& tag) //throw SysError
{
    if (tag == "unix")
        return ShellDialect::posix;
    if (tag == "cmd")
        return ShellDialect::cmd;
    if (tag == "powershell")
        return ShellDialect::powershell;

    throw SysError(replaceCpy(_("Unknown shell type %x."), L"%x", L'"' + utfTo<std::wstring>(tag) + L'"'));
}


std::string rsh::getShellDialectName(ShellDialect dialect)
{
    switch (dialect)
    {
        case ShellDialect::posix:
            return "unix";
        case ShellDialect::cmd:
            return "cmd";
        case ShellDialect::powershell:
            return "powershell";
    }
    assert(false);
    return std::string();
}


std::string rsh::quoteOrEscapeShellPath(ShellDialect dialect, const Zstring& path) //throw SysErrorUnsupportedPath
{
    switch (dialect)
    {
        case ShellDialect::posix:
            return escapePosixPath(path);

        case ShellDialect::cmd:
            //cmd.exe has no escape for '"' inside a quoted argument
            if (contains(path, '"'))
                throw SysErrorUnsupportedPath(replaceCpy(_("The path %x cannot be quoted for the Windows command interpreter."),
                                                         L"%x", L'"' + utfTo<std::wstring>(path) + L'"'));
            return '"' + path + '"';

        case ShellDialect::powershell:
            return '\'' + replaceCpy(path, '\'', "''") + '\'';
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
