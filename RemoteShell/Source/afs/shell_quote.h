// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SHELL_QUOTE_H_1729384650173829456
#define SHELL_QUOTE_H_1729384650173829456

#include <zen/sys_error.h>


namespace rsh
{
enum class ShellDialect
{
    posix,      //"unix": sh, bash, zsh, ...
    cmd,        //Windows command interpreter
    powershell,
};

//configuration tags: "unix", "cmd", "powershell"
ShellDialect parseShellDialect(const std::string& tag); //throw SysError
std::string getShellDialectName(ShellDialect dialect);


DEFINE_NEW_SYS_ERROR(SysErrorUnsupportedPath)

/*  make a path safe to embed as a single argument into a command line:
        posix:      backslash-escape all but [A-Za-z0-9_.,:/@-] and non-ASCII; line feeds become '\n' (single-quoted)
        cmd:        "path"   => paths containing '"' cannot be quoted
        powershell: 'path'   => embedded ' is doubled                       */
std::string quoteOrEscapeShellPath(ShellDialect dialect, const Zstring& path); //throw SysErrorUnsupportedPath
}

#endif //SHELL_QUOTE_H_1729384650173829456
