// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PATH_RESOLVER_H_5520193847561029384
#define PATH_RESOLVER_H_5520193847561029384

#include "char_encoder.h"
#include "shell_quote.h"


namespace rsh
{
//path override: "<root>" replaces the root for shell commands; "@<prefix>" is prepended to the regular absolute path
const Zchar PATH_OVERRIDE_MOUNT_PREFIX = Zstr('@');

//join with exactly one '/' between "basePath" and "relPath"; empty "relPath" returns "basePath" unchanged
Zstring appendRemotePath(const Zstring& basePath, const Zstring& relPath);

//absolute path as seen by the SFTP protocol
Zstring resolveProtocolPath(const Zstring& root, const Zstring& remotePath, const CharEncoder& encoder);

//absolute path as seen by shell commands: might differ from the protocol path for chroot-ed SFTP servers (e.g. NAS devices)
Zstring resolveShellPath(const Zstring& root, const Zstring& remotePath, const CharEncoder& encoder, const Zstring& pathOverride);

//"/C:/data" => "C:/data" for Windows shells
Zstring toDialectPath(ShellDialect dialect, const Zstring& absPath);


class RemotePathResolver
{
public:
    RemotePathResolver(const Zstring& root, const CharEncoder& encoder, const Zstring& pathOverride) :
        root_(root), encoder_(encoder), pathOverride_(pathOverride) {}

    Zstring getProtocolPath(const Zstring& remotePath) const { return resolveProtocolPath(root_, remotePath, encoder_); }
    Zstring getShellPath   (const Zstring& remotePath) const { return resolveShellPath(root_, remotePath, encoder_, pathOverride_); }

    const Zstring& getRoot() const { return root_; }
    const CharEncoder& getEncoder() const { return encoder_; }
    const Zstring& getPathOverride() const { return pathOverride_; }

private:
    const Zstring root_;
    const CharEncoder encoder_; //by value: no global encoding state
    const Zstring pathOverride_;
};
}

#endif //PATH_RESOLVER_H_5520193847561029384
