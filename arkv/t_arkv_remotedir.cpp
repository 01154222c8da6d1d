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

#include <arkv/arkv_remotedir.h>

#include <arkv/arkv_log.h>

#include <testutil/testutil_assert.h>
#include <testutil/testutil_memorysession.h>

#include <string>

using namespace arkv;

void testCreateMissingAncestors()
{
    MemoryServer server;
    server.d_directories.insert("/srv");
    MemorySession session(&server);

    RemoteDirectory::ensure(&session, "/srv/archive/2024/logs");
    ASSERT(server.d_directories.count("/srv/archive"));
    ASSERT(server.d_directories.count("/srv/archive/2024"));
    ASSERT(server.d_directories.count("/srv/archive/2024/logs"));
    ASSERT(server.d_mkdirCount == 3);

    // A second call finds the directory with a single stat and creates nothing.
    int statCount = server.d_statCount;
    RemoteDirectory::ensure(&session, "/srv/archive/2024/logs");
    ASSERT(server.d_mkdirCount == 3);
    ASSERT(server.d_statCount == statCount + 1);

    // A sibling only needs the missing leaf.
    RemoteDirectory::ensure(&session, "/srv/archive/2025");
    ASSERT(server.d_mkdirCount == 4);
    ASSERT(server.d_directories.count("/srv/archive/2025"));
}

void testRelativePath()
{
    MemoryServer server;
    MemorySession session(&server);

    RemoteDirectory::ensure(&session, "uploads/d/sub");
    ASSERT(server.d_directories.count("uploads"));
    ASSERT(server.d_directories.count("uploads/d"));
    ASSERT(server.d_directories.count("uploads/d/sub"));
    ASSERT(server.d_mkdirCount == 3);
}

void testFloor()
{
    MemoryServer server;
    MemorySession session(&server);

    RemoteDirectory::ensure(&session, "");
    RemoteDirectory::ensure(&session, "/");
    RemoteDirectory::ensure(&session, ".");
    ASSERT(server.d_mkdirCount == 0);
    ASSERT(server.d_statCount == 0);

    ASSERT(RemoteDirectory::isFloor(""));
    ASSERT(RemoteDirectory::isFloor("/"));
    ASSERT(RemoteDirectory::isFloor("."));
    ASSERT(!RemoteDirectory::isFloor("/a"));
}

void testMkdirFailure()
{
    MemoryServer server;
    server.d_failMkdir = "/data/b";
    MemorySession session(&server);

    bool thrown = false;
    try {
        RemoteDirectory::ensure(&session, "/data/b/c");
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::RemoteDir);
        ASSERT(e.getMessage().find("/data/b") != std::string::npos);
    }
    ASSERT(thrown);

    // Directories above the failure were created; nothing below it was attempted.
    ASSERT(server.d_directories.count("/data"));
    ASSERT(!server.d_directories.count("/data/b/c"));
    ASSERT(server.d_mkdirCount == 2);
}

int main(int argc, char *argv[])
{
    testCreateMissingAncestors();
    testRelativePath();
    testFloor();
    testMkdirFailure();

    TESTUTIL_RETURN
}
