// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include "i18n.h"
#include "scope_guard.h"
    #include <fcntl.h>    //open
    #include <unistd.h>   //close, read
    #include <sys/stat.h>

using namespace zen;


std::string zen::getFileContent(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type."));

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        ZEN_ON_SCOPE_EXIT(::close(fdFile)); //read-only: nothing to lose on close() failure

        std::string content;
        char buffer[64 * 1024];
        for (;;)
        {
            ssize_t bytesRead = 0;
            do
            {
                bytesRead = ::read(fdFile, buffer, sizeof(buffer));
            }
            while (bytesRead < 0 && errno == EINTR);

            if (bytesRead < 0)
                THROW_LAST_SYS_ERROR("read");
            if (bytesRead == 0) //"zero indicates end of file"
                return content;

            content.append(buffer, bytesRead);
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
