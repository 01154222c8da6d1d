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

#ifndef INCLUDED_ARKV_SESSION_H
#define INCLUDED_ARKV_SESSION_H

#include <string>

namespace arkv
{

class Destination;

// An authenticated connection to one destination, exposing the remote file system operations needed for an
// upload.  A session is used by a single transfer on a single thread, and is closed on destruction.
class Session
{
public:
    Session();
    virtual ~Session();

    // Whether the server considers this session authenticated.
    virtual bool isAuthenticated() = 0;

    // Query the metadata of 'remotePath'.  Return false if it doesn't exist (or can't be queried).
    virtual bool stat(const char *remotePath, bool *isDirectory) = 0;

    // Create the directory 'remotePath' with the permission bits 'mode'.  Return false on failure.
    virtual bool mkdir(const char *remotePath, int mode) = 0;

    // Create or truncate 'remotePath' for writing; it becomes the current file.  Only one file may be open at a
    // time.  Return false on failure.
    virtual bool openFile(const char *remotePath, int mode) = 0;

    // Write to the current file.  Return the number of bytes written, which may be less than 'size', or a value
    // <= 0 on failure.
    virtual int write(const char *buffer, int size) = 0;

    // Close the current file, if any.  Return false if the server reported an error.
    virtual bool closeFile() = 0;

    // Close the session.  Calling it more than once is harmless.
    virtual void close() = 0;

    // Return a readable description of the last remote error.
    virtual std::string getLastError() = 0;

private:
    // NOT IMPLEMENTED
    Session(const Session&);
    Session& operator=(const Session&);
};

// Creates sessions.  'connect()' either returns a new authenticated session owned by the caller, or throws an
// 'Exception' with a 'Connection', 'Handshake' or 'Auth' error.
class Connector
{
public:
    Connector();
    virtual ~Connector();

    // 'keyFile' is the private key used when the destination's credential is 'PrivateKey'.
    virtual Session *connect(const Destination &destination, const char *keyFile) = 0;

private:
    // NOT IMPLEMENTED
    Connector(const Connector&);
    Connector& operator=(const Connector&);
};

} // namespace arkv
#endif //INCLUDED_ARKV_SESSION_H
