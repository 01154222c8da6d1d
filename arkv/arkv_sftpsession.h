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

#ifndef INCLUDED_ARKV_SFTPSESSION_H
#define INCLUDED_ARKV_SFTPSESSION_H

#include <arkv/arkv_session.h>

#include <string>

struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace arkv
{

class Destination;

// Implementation of the Session interface on top of libssh2's SFTP subsystem.
class SFTPSession : public Session
{
public:
    // The send/receive buffer size requested on the transport socket.
    enum { SocketBufferSize = 2 * 1024 * 1024 };

    // Milliseconds to wait for any blocking libssh2 call.
    enum { SessionTimeout = 100000 };

    SFTPSession();
    ~SFTPSession();

    static bool startup();
    static void cleanup();

    // Connect to the destination, perform the SSH handshake, and authenticate with the destination's credential
    // (using 'keyFile' for a 'PrivateKey' credential).  Throws a 'Connection', 'Handshake' or 'Auth' error.
    void connect(const Destination &destination, const char *keyFile);

    virtual bool isAuthenticated();
    virtual bool stat(const char *remotePath, bool *isDirectory);
    virtual bool mkdir(const char *remotePath, int mode);
    virtual bool openFile(const char *remotePath, int mode);
    virtual int write(const char *buffer, int size);
    virtual bool closeFile();
    virtual void close();
    virtual std::string getLastError();

    bool isConnected() const {
        return d_sftp != 0;
    }

private:
    // NOT IMPLEMENTED
    SFTPSession(const SFTPSession&);
    SFTPSession& operator=(const SFTPSession&);

    void authenticate(const Destination &destination, const char *keyFile);

    int d_socket;
    _LIBSSH2_SESSION *d_session;
    _LIBSSH2_SFTP *d_sftp;
    _LIBSSH2_SFTP_HANDLE *d_file;
};

// Creates SFTP sessions.
class SFTPConnector : public Connector
{
public:
    virtual Session *connect(const Destination &destination, const char *keyFile);
};

} // namespace arkv

#endif // INCLUDED_ARKV_SFTPSESSION_H
