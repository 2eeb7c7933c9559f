// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_EXEC_H_2093847561092837465
#define SSH_EXEC_H_2093847561092837465

#include <memory>
#include "shell_executor.h"
#include "remote_cfg.h"


namespace rsh
{
//call from main thread: before creating the first and after destroying the last SshShellExecutor
void libssh2Init(); //throw SysError
void libssh2TearDown();


DEFINE_NEW_SYS_ERROR(SysErrorPassword)

//SSH session with one exec channel per command
class SshShellExecutor : public ShellExecutor
{
public:
    explicit SshShellExecutor(const SftpLogin& login); //throw SysError, SysErrorPassword
    ~SshShellExecutor();

    //thread-safe: commands are serialized
    std::string runCommand(const std::string& command) override; //throw SysError, SysErrorExitCode

private:
    SshShellExecutor           (const SshShellExecutor&) = delete;
    SshShellExecutor& operator=(const SshShellExecutor&) = delete;

    class SshSession;
    const std::unique_ptr<SshSession> session_;
};
}

#endif //SSH_EXEC_H_2093847561092837465
