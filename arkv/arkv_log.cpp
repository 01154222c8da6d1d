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

#include <mutex>

#include <cstdio>
#include <cstring>
#include <ctime>

namespace arkv
{

namespace {

// Transfers to different destinations log from their own threads.
std::mutex g_outputMutex;

} // unnamed namespace

const char *Error::getLiteral(int type)
{
    switch (type) {
        case Error::None: return "NoError";
        case Error::Path: return "PathError";
        case Error::Connection: return "ConnectionError";
        case Error::Handshake: return "HandshakeError";
        case Error::Auth: return "AuthError";
        case Error::RemoteDir: return "RemoteDirError";
        case Error::LocalIO: return "LocalIOError";
        case Error::RemoteIO: return "RemoteIOError";
        case Error::Config: return "ConfigError";
        case Error::Internal: return "InternalError";
        default: return "UnknownError";
    }
}

int Log::s_level = Log::Info;

block::out<void (const char *id, int level, const char *message)> Log::out;

void Log::setLevel(int level)
{
    s_level = level;
}

int Log::getLevel()
{
    return s_level;
}

const char *Log::getLiteral(int level)
{
    switch (level) {
        case Log::Debug: return "DEBUG";
        case Log::Trace: return "TRACE";
        case Log::Info: return "INFO";
        case Log::Warning: return "WARNING";
        case Log::Error: return "ERROR";
        case Log::Fatal: return "FATAL";
        case Log::Assert: return "ASSERT";
        default: return "UNDEFINED";
    }
}

LogRecord::LogRecord(const char *id, int level, int error)
    : d_id(id)
    , d_level(level)
    , d_error(error)
    , d_message()
{
}

LogRecord::~LogRecord() noexcept(false)
{
    if (d_level >= Log::getLevel()) {
        std::lock_guard<std::mutex> lock(g_outputMutex);

        // If a custom logging handler was installed, call that handler
        if (Log::out.isConnected()) {
            Log::out(d_id, d_level, d_message.c_str());
        } else {
            // Otherwise send the log message to stdout
            std::string message = Log::getLiteral(d_level);
            message += " ";

            time_t t = ::time(0);
            struct tm timeInfo;
            localtime_r(&t, &timeInfo);
            char buffer[100];
            strftime(buffer, sizeof(buffer), "%m/%d/%y %H:%M:%S", &timeInfo);
            message += buffer;
            message += " ";
            message += d_id;
            message += " ";
            message += d_message;

            ::printf("%s\n", message.c_str());
            ::fflush(stdout);
        }
    }

    // An error above the 'Error' level can't be recovered from by the caller.
    if (d_level > Log::Error) {
        throw Exception(d_id, d_level, d_error, d_message.c_str());
    }
}

} // namespace arkv
