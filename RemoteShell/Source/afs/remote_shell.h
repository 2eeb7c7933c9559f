// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_SHELL_H_7740192837465019283
#define REMOTE_SHELL_H_7740192837465019283

#include <zen/file_error.h>
#include "remote_cfg.h"
#include "path_resolver.h"
#include "diag_parse.h"
#include "shell_executor.h"


namespace rsh
{
/*  remote host as seen through an SFTP root folder plus the user's shell:

        - remote paths are standard-form '/'-separated paths relative to the configured root
        - names are stored on the host in encoded form, see CharEncoder
        - checksums and disk usage are computed by shell commands; all output parsing is permissive */
class RemoteShellFs
{
public:
    const RemoteShellCfg& getConfig() const { return cfg_; }

    //none: shell access disabled or no supported shell found
    std::optional<ShellDialect> getShellDialect() const { return dialect_; }

    //empty: hash type not supported
    const Zstring& getHashCommand(HashAlgorithm algo) const;

    Zstring getProtocolPath(const Zstring& remotePath) const { return resolver_.getProtocolPath(remotePath); }
    Zstring getShellPath   (const Zstring& remotePath) const { return resolver_.getShellPath   (remotePath); }

    //name as returned by a directory listing of "dirRemotePath" => standard-form remote path of the child item
    Zstring decodeListedName(const Zstring& dirRemotePath, const Zstring& storedName) const;

    std::wstring getDisplayPath(const Zstring& remotePath) const { return getRemoteDisplayPath(cfg_, getProtocolPath(remotePath)); }

    //lower-case hex; empty if the output could not be parsed (=> warning in extra log)
    std::string getFileHash(const Zstring& remotePath, HashAlgorithm algo, ShellExecutor& executor) const; //throw FileError, ErrorShellUnavailable

    //disk usage of the volume containing the root folder; zero if the output could not be parsed (=> warning in extra log)
    SpaceUsage getSpaceUsage(ShellExecutor& executor) const; //throw FileError, ErrorShellUnavailable

private:
    RemoteShellFs(const RemoteShellCfg& cfg, std::optional<ShellDialect> dialect, const std::map<HashAlgorithm, Zstring>& hashCommands) :
        cfg_(cfg), dialect_(dialect), hashCommands_(hashCommands),
        resolver_(cfg.rootPath, CharEncoder(cfg.encoding), cfg.pathOverride) {}

    ShellDialect getDialectOrThrow(const std::wstring& errorMsg) const; //throw ErrorShellUnavailable

    friend RemoteShellFs createRemoteShellFs(const RemoteShellCfg& cfg, ShellExecutor& executor);

    const RemoteShellCfg cfg_;
    const std::optional<ShellDialect> dialect_;
    const std::map<HashAlgorithm, Zstring> hashCommands_; //resolved: empty if unsupported
    const RemotePathResolver resolver_;
};


//detect shell type and hash commands unless configured
RemoteShellFs createRemoteShellFs(const RemoteShellCfg& cfg, ShellExecutor& executor); //throw FileError


//shell path of "remotePath" as single command line argument; the login directory (empty path) becomes "."
std::string getQuotedShellPath(ShellDialect dialect, const RemotePathResolver& resolver, const Zstring& remotePath); //throw SysErrorUnsupportedPath


//prefix of the hash command line; the quoted path is appended
Zstring getDefaultHashCommand(ShellDialect dialect, HashAlgorithm algo); //empty if none
std::vector<Zstring> getHashCommandCandidates(HashAlgorithm algo); //"unix" shells: probed in this order
}

#endif //REMOTE_SHELL_H_7740192837465019283
