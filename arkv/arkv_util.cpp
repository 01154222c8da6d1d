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

#include <arkv/arkv_util.h>

#include <arkv/arkv_log.h>
#include <arkv/arkv_socketutil.h>
#include <arkv/arkv_sftpsession.h>

#include <string.h>
#include <errno.h>

namespace arkv
{

bool Util::startup()
{
    SocketUtil::startup();
    if (!SFTPSession::startup()) {
        LOG_ERROR(LIBSSH2_INIT) << "libssh2 initialization failed" << LOG_END
        return false;
    }
    return true;
}

void Util::cleanup()
{
    SFTPSession::cleanup();
    SocketUtil::cleanup();
}

std::string Util::getLastError()
{
    return strerror(errno);
}

} // close namesapce arkv
