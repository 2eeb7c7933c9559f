// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


enum class DigestType
{
    md5,
    sha1,
    sha256,
};

//raw digest bytes; use formatAsHexString() for the "*sum" tool representation
std::string createHash(std::string_view data, DigestType type); //throw SysError
}

#endif //OPEN_SSL_H_801974580936508934568792347506
