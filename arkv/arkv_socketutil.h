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

#ifndef INCLUDED_ARKV_SOCKETUTIL_H
#define INCLUDED_ARKV_SOCKETUTIL_H

#include <sstream>

namespace arkv
{

struct SocketUtil
{
    // Methods for working with sockets.
    static void startup();
    static void cleanup();

    // Connect to 'host:port', trying every address the host resolves to.  Return a blocking socket, or -1 with the
    // reason in 'error'.
    static int create(const char *host, int port, std::stringstream *error);
    static void close(int socket);

    // Enlarge the send/receive buffers and disable Nagle's algorithm.  Failures are only logged.
    static void tuneBuffers(int socket, int bufferLength);
};

} // close namespace arkv

#endif // INCLUDED_ARKV_SOCKETUTIL_H
