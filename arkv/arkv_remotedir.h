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

#ifndef INCLUDED_ARKV_REMOTEDIR_H
#define INCLUDED_ARKV_REMOTEDIR_H

namespace arkv
{

class Session;

struct RemoteDirectory
{
    // Permission bits of every directory created on the server.
    enum { DirectoryMode = 0755 };

    // Make sure the remote directory 'path' and all its ancestors exist, creating the missing ones from the top
    // down.  Nothing is created if 'path' already exists.  The root ('/'), the empty path and '.' are assumed to
    // exist.  Throws a 'RemoteDir' error if a directory can't be created.
    static void ensure(Session *session, const char *path);

    // If 'path' is one of the paths assumed to exist without being checked.
    static bool isFloor(const char *path);
};

} // namespace arkv

#endif // INCLUDED_ARKV_REMOTEDIR_H
