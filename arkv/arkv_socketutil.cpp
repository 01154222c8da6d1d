// Copyright (C) 2015 Acrosync LLC
//
// Unless explicitly acquired and licensed from Licensor under another
// license, the contents of this file are subject to the Reciprocal Public
// License ("RPL") Version 1.5, or subsequent versions as allowed by the RPL,
// and You may not copy or use this file in either source code or executable
// form, except in compliance with the terms and conditions of the RPL.
//
// All software distributed under the RPL is provided strictly on an "AS
// IS" basis, WITHOUT WARRANTY OF ANY KIND, EITHER EXPRESS OR IMPLIED, AND
// LICENSOR HEREBY DISCLAIMS ALL SUCH WARRANTIES, INCLUDING WITHOUT
// LIMITATION, ANY WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
// PURPOSE, QUIET ENJOYMENT, OR NON-INFRINGEMENT. See the RPL for specific
// language governing rights and limitations under the RPL. 

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <netdb.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <signal.h>

#include <arkv/arkv_socketutil.h>
#include <arkv/arkv_util.h>

#include <arkv/arkv_log.h>

namespace arkv
{

namespace {

// Seconds to wait for a TCP connection to be established.
const int ConnectTimeout = 10;

// Connect 'sock' to 'address' within 'ConnectTimeout' seconds.  Return 0 or an errno value.
int connectWithTimeout(int sock, const struct sockaddr *address, socklen_t length)
{
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    int result = ::connect(sock, address, length);
    if (result != 0 && errno != EINPROGRESS) {
        return errno;
    }

    if (result != 0) {
        fd_set fdset;
        struct timeval tv;
        FD_ZERO(&fdset);
        FD_SET(sock, &fdset);
        tv.tv_sec = ConnectTimeout;
        tv.tv_usec = 0;

        result = select(sock + 1, NULL, &fdset, NULL, &tv);
        if (result < 0) {
            return errno;
        } else if (result == 0) {
            return ETIMEDOUT;
        }

        int error = 0;
        socklen_t errorLength = sizeof(error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &errorLength) != 0) {
            return errno;
        }
        if (error != 0) {
            return error;
        }
    }

    // libssh2 runs in blocking mode on this socket.
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    return 0;
}

} // unnamed namespace

void SocketUtil::startup()
{
    // A write to a connection closed by the server must fail with EPIPE instead of killing the process.
    signal(SIGPIPE, SIG_IGN);
}

void SocketUtil::cleanup()
{
}

int SocketUtil::create(const char *host, int port, std::stringstream *error)
{
    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_family = PF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::stringstream service;
    service << port;

    struct addrinfo *info = 0;
    int result = getaddrinfo(host, service.str().c_str(), &hints, &info);
    if (result != 0) {
        *error << "Failed to resolve the host '" << host << "': " << gai_strerror(result);
        return -1;
    }

    int lastError = 0;
    for (struct addrinfo *ptr = info; ptr != 0; ptr = ptr->ai_next) {
        if (ptr->ai_family != AF_INET && ptr->ai_family != AF_INET6) {
            continue;
        }

        int sock = socket(ptr->ai_family, SOCK_STREAM, IPPROTO_TCP);
        if (sock == -1) {
            lastError = errno;
            continue;
        }

#ifdef __APPLE__
        // Ignore SIGPIPE
        int value = 1;
        setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, (void *)&value, sizeof(value));
#endif

        lastError = connectWithTimeout(sock, ptr->ai_addr, ptr->ai_addrlen);
        if (lastError == 0) {
            freeaddrinfo(info);
            return sock;
        }

        LOG_DEBUG(SOCKET_CONNECT) << "Failed to connect to an address of '" << host << ":" << port << "': "
                                  << strerror(lastError) << LOG_END
        close(sock);
    }

    freeaddrinfo(info);
    if (lastError == 0) {
        *error << "Failed to resolve the host '" << host << "' into an ip address";
    } else {
        *error << "Failed to connect to '" << host << ":" << port << "': " << strerror(lastError);
    }
    return -1;
}

void SocketUtil::close(int socket)
{
    ::close(socket);
}

void SocketUtil::tuneBuffers(int sock, int bufferLength)
{
    int result = setsockopt(sock, SOL_SOCKET, SO_SNDBUF, (char*)&bufferLength, sizeof(bufferLength));
    if (result < 0) {
        LOG_WARNING(SOCKET_SNDBUF) << "Failed to change the TCP send buffer size: " << strerror(errno) << LOG_END
    }
    result = setsockopt(sock, SOL_SOCKET, SO_RCVBUF, (char*)&bufferLength, sizeof(bufferLength));
    if (result < 0) {
        LOG_WARNING(SOCKET_RCVBUF) << "Failed to change the TCP receive buffer size: " << strerror(errno) << LOG_END
    }

    int flag = 1;
    result = setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, (char*)&flag, sizeof(flag));
    if (result < 0) {
        LOG_WARNING(SOCKET_NODELAY) << "Failed to set the TCP_NODELAY option: " << strerror(errno) << LOG_END
    }
}

} // close namespace arkv
