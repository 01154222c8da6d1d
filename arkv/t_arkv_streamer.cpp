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
#include <arkv/arkv_pathutil.h>

#include <testutil/testutil_assert.h>
#include <testutil/testutil_memorysession.h>

#include <openssl/evp.h>

#include <string>
#include <vector>

#include <cstdlib>

using namespace arkv;

std::string getChecksum(const std::string &data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest, &length, EVP_md5(), 0);
    return std::string(reinterpret_cast<char *>(&digest[0]), length);
}

std::string createRandomFile(const char *path, int size)
{
    std::string content;
    content.reserve(size);
    for (int i = 0; i < size; ++i) {
        content += static_cast<char>(std::rand() & 0xff);
    }

    File f(path, true);
    ASSERT(f.isValid());
    ASSERT(f.write(content.data(), size) == size);
    return content;
}

void testMultipleChunks(const std::string &top)
{
    // Two and a half chunks.
    int size = Streamer::ChunkSize * 5 / 2;
    std::string local = PathUtil::join(top.c_str(), "large");
    std::string content = createRandomFile(local.c_str(), size);

    MemoryServer server;
    MemorySession session(&server);
    int64_t bytes = Streamer::copy(&session, local.c_str(), "/large");

    ASSERT(bytes == size);
    ASSERT(server.d_files["/large"].size() == static_cast<size_t>(size));
    ASSERT(getChecksum(server.d_files["/large"]) == getChecksum(content));
}

void testPartialWrites(const std::string &top)
{
    int size = Streamer::ChunkSize + 1000;
    std::string local = PathUtil::join(top.c_str(), "partial");
    std::string content = createRandomFile(local.c_str(), size);

    MemoryServer server;
    server.d_maxWriteSize = 30000;
    MemorySession session(&server);
    int64_t bytes = Streamer::copy(&session, local.c_str(), "/partial");

    ASSERT(bytes == size);
    ASSERT(getChecksum(server.d_files["/partial"]) == getChecksum(content));
}

void testEmptyFile(const std::string &top)
{
    std::string local = PathUtil::join(top.c_str(), "empty");
    createRandomFile(local.c_str(), 0);

    MemoryServer server;
    server.d_files["/empty"] = "stale content";
    MemorySession session(&server);

    ASSERT(Streamer::copy(&session, local.c_str(), "/empty") == 0);
    ASSERT(server.d_files.count("/empty"));
    ASSERT(server.d_files["/empty"].empty());
}

void testWriteFailure(const std::string &top)
{
    std::string local = PathUtil::join(top.c_str(), "broken");
    createRandomFile(local.c_str(), 100000);

    MemoryServer server;
    server.d_failWriteAfter = 40000;
    server.d_maxWriteSize = 20000;
    MemorySession session(&server);

    bool thrown = false;
    try {
        Streamer::copy(&session, local.c_str(), "/broken");
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::RemoteIO);
    }
    ASSERT(thrown);
    ASSERT(server.d_files["/broken"].size() == 40000);
}

void testMissingLocalFile(const std::string &top)
{
    MemoryServer server;
    MemorySession session(&server);

    bool thrown = false;
    try {
        Streamer::copy(&session, PathUtil::join(top.c_str(), "no_such_file").c_str(), "/x");
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::LocalIO);
    }
    ASSERT(thrown);
    ASSERT(server.d_openCount == 0);
}

void testOpenFailure(const std::string &top)
{
    std::string local = PathUtil::join(top.c_str(), "denied");
    createRandomFile(local.c_str(), 10);

    MemoryServer server;
    server.d_failOpen = "/readonly/denied";
    MemorySession session(&server);

    bool thrown = false;
    try {
        Streamer::copy(&session, local.c_str(), "/readonly/denied");
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::RemoteIO);
        ASSERT(e.getMessage().find("/readonly/denied") != std::string::npos);
    }
    ASSERT(thrown);
}

int main(int argc, char *argv[])
{
    TESTUTIL_INIT_RAND;

    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_streamer_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    testMultipleChunks(top);
    testPartialWrites(top);
    testEmptyFile(top);
    testWriteFailure(top);
    testMissingLocalFile(top);
    testOpenFailure(top);

    PathUtil::removeDirectoryRecursively(top.c_str());

    TESTUTIL_RETURN
}
