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
#include <arkv/arkv_pathutil.h>
#include <arkv/arkv_session.h>

#include <string>
#include <vector>

#include <cstring>

namespace arkv
{

bool RemoteDirectory::isFloor(const char *path)
{
    return *path == 0 || ::strcmp(path, "/") == 0 || ::strcmp(path, ".") == 0;
}

void RemoteDirectory::ensure(Session *session, const char *path)
{
    // Climb up until an existing ancestor is found, remembering every missing directory on the way.
    std::vector<std::string> missing;
    std::string current = path;
    while (!isFloor(current.c_str())) {
        LOG_DEBUG(REMOTEDIR_CHECK) << "Checking if directory exists: " << current << LOG_END
        bool isDirectory = false;
        if (session->stat(current.c_str(), &isDirectory)) {
            break;
        }
        missing.push_back(current);
        current = PathUtil::getDirectory(current.c_str());
    }

    // Create them from the top down.
    while (!missing.empty()) {
        const std::string &directory = missing.back();
        LOG_DEBUG(REMOTEDIR_CREATE) << "Creating directory: " << directory << LOG_END
        if (!session->mkdir(directory.c_str(), DirectoryMode)) {
            LOG_FAIL(REMOTEDIR_CREATE, RemoteDir) << "Failed to create remote directory '" << directory << "': "
                                                  << session->getLastError() << LOG_END
        }
        missing.pop_back();
    }
}

} // namespace arkv
