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

#include <arkv/arkv_sftpsession.h>

#include <arkv/arkv_destination.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_socketutil.h>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <memory>
#include <sstream>

namespace arkv
{

namespace {

// Return a readable name for an SFTP status code.
const char *getStatusLiteral(unsigned long status)
{
    switch (status) {
    case LIBSSH2_FX_EOF: return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
    case LIBSSH2_FX_FAILURE: return "failure";
    case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
    case LIBSSH2_FX_NO_CONNECTION: return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
    case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
    case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on file system";
    case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
    case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
    default: return "unknown status";
    }
}

} // unnamed namespace

bool SFTPSession::startup()
{
    return 0 == libssh2_init(0);
}

void SFTPSession::cleanup()
{
    libssh2_exit();
}

SFTPSession::SFTPSession()
    : Session()
    , d_socket(-1)
    , d_session(0)
    , d_sftp(0)
    , d_file(0)
{
}

SFTPSession::~SFTPSession()
{
    close();
}

void SFTPSession::connect(const Destination &destination, const char *keyFile)
{
    close();

    const char *host = destination.getHost().c_str();
    int port = destination.getPort();

    LOG_DEBUG(SSH_CONNECT) << "Connecting to " << host << ":" << port << LOG_END

    std::stringstream error;
    d_socket = SocketUtil::create(host, port, &error);
    if (d_socket == -1) {
        LOG_FAIL(SOCKET_CONNECT, Connection) << error.str() << LOG_END
    }

    SocketUtil::tuneBuffers(d_socket, SocketBufferSize);

    d_session = libssh2_session_init();
    if (!d_session) {
        LOG_FAIL(SSH_INIT, Handshake) << "Failed to create a libssh2 session" << LOG_END
    }

    libssh2_session_set_blocking(d_session, 1);

    libssh2_session_set_timeout(d_session, SessionTimeout);

    LOG_DEBUG(SSH_HANDSHAKE) << "Performing SSH handshake with " << host << ":" << port << LOG_END

    int rc = libssh2_session_handshake(d_session, d_socket);
    if (rc != 0) {
        LOG_FAIL(SSH_HANDSHAKE, Handshake) << "Failed to establish an SSH session to '" << host << ":" << port
                                           << "': " << getLastError() << LOG_END
    }

    const char *fingerPrint = libssh2_hostkey_hash(d_session, LIBSSH2_HOSTKEY_HASH_SHA1);
    if (fingerPrint) {
        std::string hash;
        const char *hex = "0123456789ABCDEF";

        for (unsigned int j = 0; j < 20; ++j) {
            unsigned char c = fingerPrint[j];
            if (j != 0) {
                hash += ":";
            }
            hash += hex[c / 16];
            hash += hex[c % 16];
        }
        LOG_DEBUG(SSH_HOSTKEY) << "Host key of '" << host << "': " << hash << LOG_END
    }

    authenticate(destination, keyFile);

    d_sftp = libssh2_sftp_init(d_session);
    if (!d_sftp) {
        LOG_FAIL(SFTP_INIT, Handshake) << "Failed to start the SFTP subsystem on '" << host << "': "
                                       << getLastError() << LOG_END
    }

    LOG_DEBUG(SSH_CONNECT) << "Successfully authenticated to " << host << LOG_END
}

void SFTPSession::authenticate(const Destination &destination, const char *keyFile)
{
    const char *user = destination.getUsername().c_str();
    const Credential &credential = destination.getCredential();

    int rc;
    switch (credential.getType()) {
    case Credential::Password:
        LOG_DEBUG(SSH_AUTH) << "Authenticating with password for user: " << user << LOG_END
        rc = libssh2_userauth_password(d_session, user, credential.getPassword().c_str());
        if (rc != 0) {
            LOG_FAIL(SSH_AUTH, Auth) << "Password authentication failed for user '" << user << "': "
                                     << getLastError() << LOG_END
        }
        break;
    case Credential::PrivateKey:
        if (keyFile == 0 || *keyFile == 0) {
            LOG_FAIL(SSH_AUTH, Auth) << "No private key file is configured for user '" << user << "'" << LOG_END
        }
        LOG_DEBUG(SSH_AUTH) << "Authenticating with SSH key: " << keyFile << " for user: " << user << LOG_END
        rc = libssh2_userauth_publickey_fromfile(d_session, user, NULL, keyFile, NULL);
        if (rc != 0) {
            LOG_FAIL(SSH_AUTH, Auth) << "SSH key authentication failed for user '" << user << "': "
                                     << getLastError() << LOG_END
        }
        break;
    }

    // Some servers accept the request without actually authenticating the session.
    if (!isAuthenticated()) {
        LOG_FAIL(SSH_AUTH, Auth) << "Authentication failed for user '" << user << "'" << LOG_END
    }
}

bool SFTPSession::isAuthenticated()
{
    return d_session && libssh2_userauth_authenticated(d_session);
}

bool SFTPSession::stat(const char *remotePath, bool *isDirectory)
{
    if (!d_sftp) {
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES attributes;
    if (libssh2_sftp_stat(d_sftp, remotePath, &attributes) != 0) {
        return false;
    }
    if (isDirectory) {
        *isDirectory = (attributes.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                       && LIBSSH2_SFTP_S_ISDIR(attributes.permissions);
    }
    return true;
}

bool SFTPSession::mkdir(const char *remotePath, int mode)
{
    if (!d_sftp) {
        return false;
    }
    return libssh2_sftp_mkdir(d_sftp, remotePath, mode) == 0;
}

bool SFTPSession::openFile(const char *remotePath, int mode)
{
    if (!d_sftp) {
        return false;
    }
    closeFile();
    d_file = libssh2_sftp_open(d_sftp, remotePath, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, mode);
    return d_file != 0;
}

int SFTPSession::write(const char *buffer, int size)
{
    if (!d_file) {
        return -1;
    }
    return static_cast<int>(libssh2_sftp_write(d_file, buffer, size));
}

bool SFTPSession::closeFile()
{
    if (!d_file) {
        return true;
    }
    int rc = libssh2_sftp_close(d_file);
    d_file = 0;
    return rc == 0;
}

void SFTPSession::close()
{
    if (d_file) {
        libssh2_sftp_close(d_file);
        d_file = 0;
    }

    if (d_sftp) {
        libssh2_sftp_shutdown(d_sftp);
        d_sftp = 0;
    }

    if (d_session) {
        libssh2_session_disconnect(d_session, "work done");
        libssh2_session_free(d_session);
        d_session = 0;
    }

    if (d_socket != -1) {
        SocketUtil::close(d_socket);
        d_socket = -1;
    }
}

std::string SFTPSession::getLastError()
{
    if (!d_session) {
        return std::string("<no session>");
    }

    char *message;
    int length;
    int rc = libssh2_session_last_error(d_session, &message, &length, 0);
    if (rc == 0) {
        return std::string("<no error>");
    }

    std::string error(message, length);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && d_sftp) {
        unsigned long status = libssh2_sftp_last_error(d_sftp);
        std::stringstream stream;
        stream << error << " (" << getStatusLiteral(status) << ")";
        return stream.str();
    }
    return error;
}

Session *SFTPConnector::connect(const Destination &destination, const char *keyFile)
{
    std::unique_ptr<SFTPSession> session(new SFTPSession());
    session->connect(destination, keyFile);
    return session.release();
}

} // namespace arkv
