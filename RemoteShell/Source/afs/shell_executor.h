// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SHELL_EXECUTOR_H_6619283740192837465
#define SHELL_EXECUTOR_H_6619283740192837465

#include <zen/sys_error.h>


namespace rsh
{
//remote command failed: exit status != 0
struct SysErrorExitCode : public zen::SysError
{
    SysErrorExitCode(const std::wstring& msg, int ec) : SysError(msg), exitCode(ec) {}

    const int exitCode;
};


struct ShellExecutor
{
    virtual ~ShellExecutor() {}

    //run "command" in the remote user's default shell and return its stdout
    virtual std::string runCommand(const std::string& command) = 0; //throw SysError, SysErrorExitCode
};
}

#endif //SHELL_EXECUTOR_H_6619283740192837465
