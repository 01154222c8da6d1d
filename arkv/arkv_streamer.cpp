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

#include <arkv/arkv_streamer.h>

#include <arkv/arkv_file.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_session.h>
#include <arkv/arkv_util.h>

#include <vector>

namespace arkv
{

namespace {

// Closes the current remote file if the copy is interrupted.
class RemoteFileCloser
{
public:
    RemoteFileCloser(Session *session)
        : d_session(session)
        , d_closed(false)
    {
    }

    ~RemoteFileCloser()
    {
        if (!d_closed) {
            d_session->closeFile();
        }
    }

    bool close()
    {
        d_closed = true;
        return d_session->closeFile();
    }

private:
    // NOT IMPLEMENTED
    RemoteFileCloser(const RemoteFileCloser&);
    RemoteFileCloser& operator=(const RemoteFileCloser&);

    Session *d_session;
    bool d_closed;
};

} // unnamed namespace

int64_t Streamer::copy(Session *session, const char *localPath, const char *remotePath)
{
    LOG_DEBUG(STREAMER_OPEN) << "Opening local file: " << localPath << LOG_END
    File localFile;
    if (!localFile.open(localPath, false, false)) {
        LOG_FAIL(STREAMER_OPEN, LocalIO) << "Failed to open local file '" << localPath << "': "
                                         << Util::getLastError() << LOG_END
    }

    LOG_DEBUG(STREAMER_CREATE) << "Creating remote file: " << remotePath << LOG_END
    if (!session->openFile(remotePath, FileMode)) {
        LOG_FAIL(STREAMER_CREATE, RemoteIO) << "Failed to create remote file '" << remotePath << "': "
                                            << session->getLastError() << LOG_END
    }
    RemoteFileCloser closer(session);

    std::vector<char> chunk(ChunkSize);
    int64_t totalBytes = 0;
    for (;;) {
        int bytes = localFile.read(&chunk[0], ChunkSize);
        if (bytes < 0) {
            LOG_FAIL(STREAMER_READ, LocalIO) << "Failed to read local file '" << localPath << "'" << LOG_END
        }
        if (bytes == 0) {
            break;
        }

        // The whole chunk must be written before the next read.
        int written = 0;
        while (written < bytes) {
            int rc = session->write(&chunk[written], bytes - written);
            if (rc <= 0) {
                LOG_FAIL(STREAMER_WRITE, RemoteIO) << "Failed to write to remote file '" << remotePath << "': "
                                                   << session->getLastError() << LOG_END
            }
            written += rc;
        }
        totalBytes += bytes;
    }

    if (!closer.close()) {
        LOG_FAIL(STREAMER_CLOSE, RemoteIO) << "Failed to close remote file '" << remotePath << "': "
                                           << session->getLastError() << LOG_END
    }

    LOG_DEBUG(STREAMER_DONE) << "Uploaded " << totalBytes << " bytes to " << remotePath << LOG_END
    return totalBytes;
}

} // namespace arkv
