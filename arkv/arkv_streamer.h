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

#ifndef INCLUDED_ARKV_STREAMER_H
#define INCLUDED_ARKV_STREAMER_H

#include <stdint.h>

namespace arkv
{

class Session;

struct Streamer
{
    enum {
        ChunkSize = 256 * 1024,     // bytes read from the local file at a time
        FileMode = 0644             // permission bits of every file created on the server
    };

    // Copy the content of the local file 'localPath' to the remote file 'remotePath', which is created or
    // truncated.  The parent directory of 'remotePath' must exist.  Return the number of bytes copied.  Throws a
    // 'LocalIO' error if the local file can't be opened or read, and a 'RemoteIO' error if the remote file can't be
    // created, written or closed.
    static int64_t copy(Session *session, const char *localPath, const char *remotePath);
};

} // namespace arkv

#endif // INCLUDED_ARKV_STREAMER_H
