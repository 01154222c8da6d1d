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

#include <arkv/arkv_destination.h>
#include <arkv/arkv_file.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>

#include <testutil/testutil_assert.h>
#include <testutil/testutil_memorysession.h>

#include <string>
#include <vector>

#include <cstring>

using namespace arkv;

// Records the progress notifications of a transfer.
class ProgressRecorder
{
public:
    ProgressRecorder()
        : d_fileCount(-1)
        , d_completeCount(0)
    {
    }

    void onFile(const char *destination, const char *relativePath)
    {
        d_destination = destination;
        d_files.push_back(relativePath);
    }

    void onComplete(const char *destination, int fileCount, const char *fileName)
    {
        ++d_completeCount;
        d_fileCount = fileCount;
        d_fileName = fileName ? fileName : "";
    }

    std::string d_destination;
    std::vector<std::string> d_files;
    int d_fileCount;
    int d_completeCount;
    std::string d_fileName;
};

void createFile(const char *top, const char *name, const char *content)
{
    File f(PathUtil::join(top, name).c_str(), true);
    ASSERT(f.isValid());
    ASSERT(f.write(content, ::strlen(content)) == static_cast<int>(::strlen(content)));
}

void testDirectoryUpload(const std::string &top)
{
    std::string d = PathUtil::join(top.c_str(), "d");
    ASSERT(PathUtil::createDirectory(d.c_str()));
    ASSERT(PathUtil::createDirectory(PathUtil::join(d.c_str(), "sub").c_str()));
    createFile(d.c_str(), "a", "hello");
    createFile(d.c_str(), "sub/b", "world!");

    MemoryServer server;
    MemoryConnector connector;
    connector.addServer("h1", &server);

    Destination destination = Destination::parse("A=u:secret@h1:/r");
    Transfer transfer(destination, 0, &connector);
    ProgressRecorder recorder;
    transfer.fileOut.connect(&recorder, &ProgressRecorder::onFile);
    transfer.completeOut.connect(&recorder, &ProgressRecorder::onComplete);

    TransferStats stats;
    transfer.run(d.c_str(), &stats);

    ASSERT(server.d_files["/r/d/a"] == "hello");
    ASSERT(server.d_files["/r/d/sub/b"] == "world!");
    ASSERT(server.d_directories.count("/r/d/sub"));
    ASSERT(stats.d_bytes == 11);
    ASSERT(stats.d_seconds > 0.0);
    ASSERT(server.d_closeCount == 1);

    ASSERT(recorder.d_destination == "A");
    ASSERT(recorder.d_files.size() == 2);
    ASSERT(recorder.d_files[0] == "a");
    ASSERT(recorder.d_files[1] == "sub/b");
    ASSERT(recorder.d_completeCount == 1);
    ASSERT(recorder.d_fileCount == 2);
    ASSERT(recorder.d_fileName.empty());

    // Uploading again overwrites the files and creates no directory.
    int mkdirCount = server.d_mkdirCount;
    transfer.run(d.c_str(), &stats);
    ASSERT(server.d_mkdirCount == mkdirCount);
    ASSERT(server.d_files["/r/d/a"] == "hello");
}

void testFileUpload(const std::string &top)
{
    createFile(top.c_str(), "single", "0123456789");

    MemoryServer server;
    MemoryConnector connector;
    connector.addServer("h1", &server);

    Transfer transfer(Destination::parse("u@h1:/r"), "/home/u/.ssh/id_rsa", &connector);
    ProgressRecorder recorder;
    transfer.completeOut.connect(&recorder, &ProgressRecorder::onComplete);

    TransferStats stats;
    transfer.run(PathUtil::join(top.c_str(), "single").c_str(), &stats);

    ASSERT(server.d_files["/r/single"] == "0123456789");
    ASSERT(stats.d_bytes == 10);
    ASSERT(recorder.d_fileCount == 1);
    ASSERT(recorder.d_fileName == "single");
}

void testMissingPathBeforeConnect(const std::string &top)
{
    MemoryServer server;
    MemoryConnector connector;
    connector.addServer("h1", &server);

    Transfer transfer(Destination::parse("u:secret@h1:/r"), 0, &connector);
    TransferStats stats;
    bool thrown = false;
    try {
        transfer.run(PathUtil::join(top.c_str(), "no_such_dir").c_str(), &stats);
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::Path);
    }
    ASSERT(thrown);
    ASSERT(connector.getConnectCount() == 0);
}

void testSessionClosedOnFailure(const std::string &top)
{
    createFile(top.c_str(), "denied", "x");

    MemoryServer server;
    server.d_failOpen = "/r/denied";
    MemoryConnector connector;
    connector.addServer("h1", &server);

    Transfer transfer(Destination::parse("u:secret@h1:/r"), 0, &connector);
    TransferStats stats;
    bool thrown = false;
    try {
        transfer.run(PathUtil::join(top.c_str(), "denied").c_str(), &stats);
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::RemoteIO);
    }
    ASSERT(thrown);
    ASSERT(server.d_closeCount == 1);
}

void testThroughput()
{
    TransferStats stats;
    ASSERT(stats.getThroughput() == 0.0);

    stats.d_bytes = 3 * 1048576;
    stats.d_seconds = 2.0;
    ASSERT(stats.getMegabytes() == 3.0);
    ASSERT(stats.getThroughput() == 1.5);
}

int main(int argc, char *argv[])
{
    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_transfer_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    testDirectoryUpload(top);
    testFileUpload(top);
    testMissingPathBeforeConnect(top);
    testSessionClosedOnFailure(top);
    testThroughput();

    PathUtil::removeDirectoryRecursively(top.c_str());

    TESTUTIL_RETURN
}
