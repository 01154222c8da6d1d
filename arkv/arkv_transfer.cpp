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

#include <arkv/arkv_transfer.h>

#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>
#include <arkv/arkv_remotedir.h>
#include <arkv/arkv_session.h>
#include <arkv/arkv_streamer.h>
#include <arkv/arkv_timeutil.h>
#include <arkv/arkv_treewalker.h>

#include <memory>
#include <vector>

namespace arkv
{

namespace {

const double BytesPerMegabyte = 1048576.0;

} // unnamed namespace

double TransferStats::getMegabytes() const
{
    return static_cast<double>(d_bytes) / BytesPerMegabyte;
}

double TransferStats::getThroughput() const
{
    if (d_seconds <= 0.0) {
        return 0.0;
    }
    return getMegabytes() / d_seconds;
}

Transfer::Transfer(const Destination &destination, const char *keyFile, Connector *connector)
    : d_destination(destination)
    , d_keyFile(keyFile ? keyFile : "")
    , d_connector(connector)
{
}

Transfer::~Transfer()
{
}

void Transfer::run(const char *localPath, TransferStats *stats)
{
    double startTime = TimeUtil::getMonotonicTime();

    const char *name = d_destination.getName().c_str();

    // Enumerate first so that a missing local path fails before any connection is made.
    std::vector<Task> tasks;
    bool isDirectory = TreeWalker::enumerate(localPath, d_destination.getRemotePath().c_str(), &tasks);

    std::unique_ptr<Session> session(d_connector->connect(d_destination, d_keyFile.c_str()));
    if (!session->isAuthenticated()) {
        LOG_FAIL(TRANSFER_AUTH, Auth) << "The session to " << d_destination.describe() << " is not authenticated"
                                      << LOG_END
    }

    int64_t totalBytes = 0;
    for (size_t i = 0; i < tasks.size(); ++i) {
        const Task &task = tasks[i];
        fileOut(name, task.d_relativePath.c_str());

        LOG_DEBUG(TRANSFER_FILE) << "Uploading: " << task.d_localPath << " -> " << task.d_remotePath << LOG_END
        RemoteDirectory::ensure(session.get(), PathUtil::getDirectory(task.d_remotePath.c_str()).c_str());
        totalBytes += Streamer::copy(session.get(), task.d_localPath.c_str(), task.d_remotePath.c_str());
    }

    session->close();

    completeOut(name, static_cast<int>(tasks.size()),
                isDirectory ? 0 : tasks[0].d_relativePath.c_str());

    stats->d_bytes = totalBytes;
    stats->d_seconds = TimeUtil::getMonotonicTime() - startTime;

    LOG_DEBUG(TRANSFER_DONE) << "Uploaded " << totalBytes << " bytes to " << name << " in " << stats->d_seconds
                             << " seconds" << LOG_END
}

} // namespace arkv
