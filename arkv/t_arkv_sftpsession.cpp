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

#include <arkv/arkv_sftpsession.h>

#include <arkv/arkv_destination.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_util.h>

#include <testutil/testutil_assert.h>

#include <memory>
#include <string>
#include <thread>

#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace arkv;

// Open a listening socket on a free loopback port and return it, with the port in 'port'.
int listenOnLoopback(int *port)
{
    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT(sock >= 0);

    struct sockaddr_in address;
    ::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    ASSERT(::bind(sock, reinterpret_cast<struct sockaddr *>(&address), sizeof(address)) == 0);
    ASSERT(::listen(sock, 1) == 0);

    socklen_t length = sizeof(address);
    ASSERT(::getsockname(sock, reinterpret_cast<struct sockaddr *>(&address), &length) == 0);
    *port = ntohs(address.sin_port);
    return sock;
}

// Answer one connection with something that isn't an SSH server banner, then hang up.
void serveGarbage(int listener)
{
    int client = ::accept(listener, 0, 0);
    if (client < 0) {
        return;
    }
    const char *banner = "HTTP/1.1 400 Bad Request\r\nConnection: close\r\n\r\n";
    ssize_t rc = ::send(client, banner, ::strlen(banner), 0);
    (void)rc;
    ::close(client);
}

int connectAndGetError(const Destination &destination)
{
    SFTPConnector connector;
    try {
        std::unique_ptr<Session> session(connector.connect(destination, "/nonexistent/id_rsa"));
    } catch (Exception &e) {
        return e.getError();
    }
    return Error::None;
}

void testConnectionRefused()
{
    // Take a free port and release it, so nothing listens there.
    int port = 0;
    int sock = listenOnLoopback(&port);
    ::close(sock);

    Destination destination("refused", "127.0.0.1", static_cast<uint16_t>(port), "u", "/r",
                            Credential::password("secret"));
    ASSERT(connectAndGetError(destination) == Error::Connection);
}

void testUnresolvableHost()
{
    Destination destination = Destination::parse("u:secret@no-such-host.invalid:/r");
    ASSERT(connectAndGetError(destination) == Error::Connection);
}

void testHandshakeFailure()
{
    int port = 0;
    int listener = listenOnLoopback(&port);
    std::thread server(serveGarbage, listener);

    Destination destination("garbage", "127.0.0.1", static_cast<uint16_t>(port), "u", "/r",
                            Credential::password("secret"));
    ASSERT(connectAndGetError(destination) == Error::Handshake);

    server.join();
    ::close(listener);
}

void testUnconnectedSession()
{
    SFTPSession session;
    ASSERT(!session.isConnected());
    ASSERT(!session.isAuthenticated());

    bool isDirectory = false;
    ASSERT(!session.stat("/", &isDirectory));
    ASSERT(!session.mkdir("/x", 0755));
    ASSERT(!session.openFile("/x", 0644));
    ASSERT(session.write("x", 1) <= 0);

    // Closing twice is harmless.
    session.close();
    session.close();
}

int main(int argc, char *argv[])
{
    ASSERT(Util::startup());

    testConnectionRefused();
    testUnresolvableHost();
    testHandshakeFailure();
    testUnconnectedSession();

    Util::cleanup();

    TESTUTIL_RETURN
}
