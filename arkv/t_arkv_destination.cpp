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

#include <arkv/arkv_destination.h>

#include <arkv/arkv_log.h>

#include <testutil/testutil_assert.h>

#include <string>

using namespace arkv;

void testFullDescriptor()
{
    Destination destination = Destination::parse("backup=alice:pa=ss@example.com:2222:/srv/archive");
    ASSERT(destination.getName() == "backup");
    ASSERT(destination.getUsername() == "alice");
    ASSERT(destination.getHost() == "example.com");
    ASSERT(destination.getPort() == 2222);
    ASSERT(destination.getRemotePath() == "/srv/archive");
    ASSERT(destination.getCredential().getType() == Credential::Password);
    ASSERT(destination.getCredential().getPassword() == "pa=ss");
    ASSERT(destination.describe() == "backup (example.com)");
}

void testDefaults()
{
    Destination destination = Destination::parse("bob@10.0.0.5:uploads");
    ASSERT(destination.getName() == "10.0.0.5");
    ASSERT(destination.getUsername() == "bob");
    ASSERT(destination.getHost() == "10.0.0.5");
    ASSERT(destination.getPort() == Destination::DefaultPort);
    ASSERT(destination.getRemotePath() == "uploads");
    ASSERT(destination.getCredential().getType() == Credential::PrivateKey);
}

void testRemotePathWithColon()
{
    // A non-numeric segment after the host is the start of the remote path.
    Destination destination = Destination::parse("carol@host:/data/a:b");
    ASSERT(destination.getPort() == Destination::DefaultPort);
    ASSERT(destination.getRemotePath() == "/data/a:b");

    // An empty password is still a password.
    destination = Destination::parse("dave:@host:/x");
    ASSERT(destination.getCredential().getType() == Credential::Password);
    ASSERT(destination.getCredential().getPassword().empty());
}

void testMalformed()
{
    const char *MALFORMED[] = {
        "",
        "host:/path",
        "@host:/path",
        ":secret@host:/path",
        "user@host",
        "user@:/path",
        "user@host:",
        "user@host:22:",
        "user@host:70000:/path",
        "user@host:0:/path",
    };

    for (unsigned int i = 0; i < sizeof(MALFORMED) / sizeof(MALFORMED[0]); ++i) {
        bool thrown = false;
        try {
            Destination::parse(MALFORMED[i]);
        } catch (Exception &e) {
            thrown = true;
            ASSERT(e.getError() == Error::Config);
        }
        ASSERT(thrown);
    }
}

int main(int argc, char *argv[])
{
    testFullDescriptor();
    testDefaults();
    testRemotePathWithColon();
    testMalformed();

    TESTUTIL_RETURN
}
