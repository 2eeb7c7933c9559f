// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_23498325972583947678456437
#define SOCKET_H_23498325972583947678456437

#include "sys_error.h"


namespace zen
{
using SocketType = int;
const SocketType invalidSocket = -1;

std::wstring formatGaiErrorCode(int ec);

void setNonBlocking(SocketType socket, bool nonBlocking); //throw SysError


//blocking TCP connection (Nagle disabled); connect() gives up after "timeoutSec" per resolved address
class Socket //throw SysError
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec); //throw SysError
    ~Socket();

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};
}

#endif //SOCKET_H_23498325972583947678456437
