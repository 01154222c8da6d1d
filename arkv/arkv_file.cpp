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

#include <arkv/arkv_file.h>

#include <arkv/arkv_log.h>
#include <arkv/arkv_util.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

namespace arkv
{

const File::Handle File::InvalidHandle = -1;

File::File()
    : d_handle(InvalidHandle)
    , d_path("")
{
}

File::File(const char *fullPath, bool forWrite, bool reportError)
    : d_handle(InvalidHandle)
    , d_path(fullPath)
{
    open(fullPath, forWrite, reportError);
}

bool File::open(const char *fullPath, bool forWrite, bool reportError)
{
    close();
    d_path = fullPath;
    if (forWrite) {
        d_handle = ::open(fullPath, O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    } else {
        d_handle = ::open(fullPath, O_RDONLY);
    }
    
    if (d_handle == InvalidHandle && reportError) {
        LOG_ERROR(FILE_OPEN) << "Failed to open '" << fullPath << "': " << Util::getLastError() << LOG_END
    }
    return d_handle != InvalidHandle;
}

File::~File()
{
    this->close();
}

int File::read(char *buffer, int size)
{
    if (d_handle == InvalidHandle) {
        return -1;
    }
    int rc;
    do {
        rc = static_cast<int>(::read(d_handle, buffer, size));
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        LOG_ERROR(FILE_READ) << "Error reading from '" << d_path << "': " << Util::getLastError() << LOG_END
        return -1;
    }
    return rc;
}

int File::write(const char *buffer, int size)
{
    if (d_handle == InvalidHandle) {
        return 0;
    }
    int bytes = 0;
    while (bytes < size) {
        int rc = static_cast<int>(::write(d_handle, buffer + bytes, size - bytes));
        if (rc == 0) {
            LOG_ERROR(FILE_WRITE) << "Failed to write to '" << d_path << "'" << LOG_END
            return bytes;
        } else if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(FILE_WRITE) << "Error writing '" << d_path << "': " << Util::getLastError() << LOG_END
            return bytes;
        }
        bytes += rc;
    }
    return bytes;
}

void File::close()
{
    if (d_handle == InvalidHandle) {
        return;
    }
    ::close(d_handle);
    d_handle = InvalidHandle;
}

} // close namespace arkv
