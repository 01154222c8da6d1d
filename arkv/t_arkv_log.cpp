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

#include <arkv/arkv_log.h>

#include <testutil/testutil_assert.h>

#include <string>
#include <vector>

using namespace arkv;

// Captures log messages instead of printing them.
class LogCapture
{
public:
    void onLog(const char *id, int level, const char *message)
    {
        d_ids.push_back(id);
        d_levels.push_back(level);
        d_messages.push_back(message);
    }

    std::vector<std::string> d_ids;
    std::vector<int> d_levels;
    std::vector<std::string> d_messages;
};

void testLevels(LogCapture *capture)
{
    Log::setLevel(Log::Info);
    LOG_DEBUG(TEST_DEBUG) << "hidden" << LOG_END
    LOG_INFO(TEST_INFO) << "uploaded " << 3 << " files" << LOG_END
    LOG_WARNING(TEST_WARNING) << "slow" << LOG_END

    ASSERT(capture->d_ids.size() == 2);
    ASSERT(capture->d_ids[0] == "TEST_INFO");
    ASSERT(capture->d_levels[0] == Log::Info);
    ASSERT(capture->d_messages[0] == "uploaded 3 files");
    ASSERT(capture->d_levels[1] == Log::Warning);

    Log::setLevel(Log::Debug);
    LOG_DEBUG(TEST_DEBUG) << "shown" << LOG_END
    ASSERT(capture->d_ids.size() == 3);
    ASSERT(capture->d_messages[2] == "shown");
}

void testFailThrows(LogCapture *capture)
{
    // A fatal record throws even when it is below the reporting level.
    Log::setLevel(Log::Assert);
    bool thrown = false;
    try {
        LOG_FAIL(TEST_FAIL, RemoteDir) << "Failed to create '" << std::string("/r/d") << "'" << LOG_END
    } catch (Exception &e) {
        thrown = true;
        ASSERT(std::string(e.getID()) == "TEST_FAIL");
        ASSERT(e.getLevel() == Log::Fatal);
        ASSERT(e.getError() == Error::RemoteDir);
        ASSERT(e.getMessage() == "Failed to create '/r/d'");
    }
    ASSERT(thrown);

    Log::setLevel(Log::Info);
    ASSERT_THROWS(LOG_FATAL(TEST_FATAL) << "internal" << LOG_END, Exception);
    ASSERT(capture->d_messages.back() == "internal");

    // Errors are reported without throwing.
    LOG_ERROR(TEST_ERROR) << "not fatal" << LOG_END
    ASSERT(capture->d_messages.back() == "not fatal");
}

void testErrorLiterals()
{
    ASSERT(std::string(Error::getLiteral(Error::Path)) == "PathError");
    ASSERT(std::string(Error::getLiteral(Error::Connection)) == "ConnectionError");
    ASSERT(std::string(Error::getLiteral(Error::Handshake)) == "HandshakeError");
    ASSERT(std::string(Error::getLiteral(Error::Auth)) == "AuthError");
    ASSERT(std::string(Error::getLiteral(Error::RemoteDir)) == "RemoteDirError");
    ASSERT(std::string(Error::getLiteral(Error::LocalIO)) == "LocalIOError");
    ASSERT(std::string(Error::getLiteral(Error::RemoteIO)) == "RemoteIOError");
    ASSERT(std::string(Error::getLiteral(Error::Internal)) == "InternalError");
    ASSERT(std::string(Log::getLiteral(Log::Warning)) == "WARNING");
}

int main(int argc, char *argv[])
{
    LogCapture capture;
    Log::out.connect(&capture, &LogCapture::onLog);

    testLevels(&capture);
    testFailThrows(&capture);
    testErrorLiterals();

    Log::out.disconnect();

    TESTUTIL_RETURN
}
