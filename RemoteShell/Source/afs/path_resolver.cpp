// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "path_resolver.h"

using namespace zen;
using namespace rsh;


Zstring rsh::appendRemotePath(const Zstring& basePath, const Zstring& relPath)
{
    const auto isSeparator = [](Zchar c) { return c == Zstr('/'); };

    Zstring relPathTrm = relPath;
    trim(relPathTrm, TrimSide::left, isSeparator);
    if (relPathTrm.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    Zstring basePathTrm = basePath;
    trim(basePathTrm, TrimSide::right, isSeparator);
    return basePathTrm + Zstr('/') + relPathTrm; //basePath "/" => "/<relPath>"
}


Zstring rsh::resolveProtocolPath(const Zstring& root, const Zstring& remotePath, const CharEncoder& encoder)
{
    if (remotePath.empty())
        return root;

    return appendRemotePath(root, encoder.fromStandardPath(remotePath));
}


Zstring rsh::resolveShellPath(const Zstring& root, const Zstring& remotePath, const CharEncoder& encoder, const Zstring& pathOverride)
{
    if (pathOverride.empty())
        return resolveProtocolPath(root, remotePath, encoder);

    if (pathOverride[0] == PATH_OVERRIDE_MOUNT_PREFIX)
        return appendRemotePath(pathOverride.substr(1), resolveProtocolPath(root, remotePath, encoder));

    return resolveProtocolPath(pathOverride, remotePath, encoder);
}


Zstring rsh::toDialectPath(ShellDialect dialect, const Zstring& absPath)
{
    switch (dialect)
    {
        case ShellDialect::posix:
            return absPath;

        case ShellDialect::cmd:
        case ShellDialect::powershell:
            if (absPath.size() >= 3 &&
                absPath[0] == Zstr('/') &&
                isAsciiAlpha(absPath[1]) &&
                absPath[2] == Zstr(':'))
                return absPath.substr(1);
            return absPath;
    }
    assert(false);
    return absPath;
}
