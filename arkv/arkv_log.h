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

#ifndef INCLUDED_ARKV_LOG_H
#define INCLUDED_ARKV_LOG_H

#include <block/block_out.h>

#include <string>
#include <sstream>

namespace arkv {

// The categories of errors that abort a transfer.
struct Error
{
    enum Type {
        None,
        Path,           // the local upload root does not exist
        Connection,     // the transport connection could not be opened
        Handshake,      // the SSH handshake or the SFTP subsystem failed
        Auth,           // the credential was rejected or the session is not authenticated
        RemoteDir,      // a remote directory could not be created
        LocalIO,        // a local file could not be opened or read
        RemoteIO,       // a remote file could not be created or written
        Config,         // a malformed destination or command line
        Internal        // a transfer unit terminated abnormally
    };

    // Return the name of the error category, such as "AuthError".
    static const char *getLiteral(int type);
};

// The exception to throw if an error has occurred and the operation can't continue.
class Exception
{
public:
    Exception(const char *id, int level, int error, const char *message)
        : d_id(id)
        , d_level(level)
        , d_error(error)
        , d_message(message)
    {
    }

    Exception(const Exception &other)
        : d_id(other.d_id)
        , d_level(other.d_level)
        , d_error(other.d_error)
        , d_message(other.d_message)
    {
    }

    ~Exception()
    {
    }

    const char *getID() const
    {
        return d_id;
    }

    int getLevel() const
    {
        return d_level;
    }

    // One of the 'Error::Type' values.
    int getError() const
    {
        return d_error;
    }

    const std::string& getMessage() const
    {
        return d_message;
    }

private:
    // NOT IMPLEMENTED
    const Exception& operator=(const Exception&);

    const char *d_id;          // id of the log message
    int d_level;               // severity level
    int d_error;               // error category
    std::string d_message;     // the log message without the level and time prefix
};

struct Log
{
public:
    enum Level {
        Debug,
        Trace,
        Info,
        Warning,
        Error,
        Fatal,
        Assert
    };

    // Accessors for 's_level'
    static void setLevel(int);
    static int getLevel();

    // Basically the string name of the level
    static const char *getLiteral(int level);

    // Any log message with this level or above will be reported.  Others will be ignored.
    static int s_level;

    // A callback for replacing the default logging handler.  Connect it before any transfer thread starts.
    static block::out<void (const char *id, int level, const char *message)> out;
};

// A helper object that will generate a log message on destruction.  A record above the 'Error' level throws an
// 'Exception' after being reported.
class LogRecord
{
public:

    LogRecord(const char *id, int level, int error = Error::None);

    ~LogRecord() noexcept(false);

    LogRecord& operator<<(const char * message)
    {
        d_message += message;
        return *this;
    }

    LogRecord& operator<<(const std::string& message)
    {
        d_message += message;
        return *this;
    }

    template <class T> LogRecord& operator<<(T n)
    {
        std::stringstream stream;
        stream << n;
        d_message += stream.str();
        return *this;
    }

private:
    // NOT IMPLEMENTED
    LogRecord(const LogRecord&);
    LogRecord& operator=(const LogRecord&);

    const char *d_id;
    int d_level;
    int d_error;
    std::string d_message;
};

#define ARKV_LOG(ID, LEVEL, ERROR) \
    if (LEVEL >= arkv::Log::getLevel() || LEVEL > arkv::Log::Error) { \
        arkv::LogRecord(ID, LEVEL, ERROR)

// Use these macros for creating log messages.
#define LOG_DEBUG(ID) ARKV_LOG(#ID, arkv::Log::Debug, arkv::Error::None)
#define LOG_TRACE(ID) ARKV_LOG(#ID, arkv::Log::Trace, arkv::Error::None)
#define LOG_INFO(ID) ARKV_LOG(#ID, arkv::Log::Info, arkv::Error::None)
#define LOG_WARNING(ID) ARKV_LOG(#ID, arkv::Log::Warning, arkv::Error::None)
#define LOG_ERROR(ID) ARKV_LOG(#ID, arkv::Log::Error, arkv::Error::None)
#define LOG_FATAL(ID) ARKV_LOG(#ID, arkv::Log::Fatal, arkv::Error::Internal)
#define LOG_ASSERT(ID) ARKV_LOG(#ID, arkv::Log::Assert, arkv::Error::Internal)

// Report a fatal error of the given 'Error::Type' (without the 'Error::' prefix) and throw.
#define LOG_FAIL(ID, ERROR) ARKV_LOG(#ID, arkv::Log::Fatal, arkv::Error::ERROR)

#define LOG_END ""; }


}

#endif // INCLUDED_ARKV_LOG_H
