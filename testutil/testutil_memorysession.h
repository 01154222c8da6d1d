#ifndef TESTUTIL_MEMORYSESSION
#define TESTUTIL_MEMORYSESSION

#include <arkv/arkv_destination.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_session.h>

#include <atomic>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

//============================================================================
//              In-Memory Remote File System for Session Tests
//============================================================================

// The remote side of one destination: its directories, its files and the failures to inject.  It outlives the
// sessions connected to it so tests can inspect it after a transfer.
struct MemoryServer
{
    MemoryServer()
        : d_password("secret")
        , d_mkdirCount(0)
        , d_statCount(0)
        , d_openCount(0)
        , d_closeCount(0)
        , d_failMkdir()
        , d_failOpen()
        , d_maxWriteSize(0)
        , d_failWriteAfter(-1)
        , d_throwOnConnect(false)
        , d_throwUnknownOnConnect(false)
        , d_acceptButUnauthenticated(false)
    {
        d_directories.insert("/");
    }

    std::string d_password;                        // the only password accepted
    std::set<std::string> d_directories;
    std::map<std::string, std::string> d_files;    // remote path -> content

    int d_mkdirCount;
    int d_statCount;
    int d_openCount;
    int d_closeCount;                               // sessions closed

    std::string d_failMkdir;                        // mkdir of this path fails
    std::string d_failOpen;                         // opening this path fails
    int d_maxWriteSize;                             // if positive, every write accepts at most this many bytes
    int d_failWriteAfter;                           // if not negative, writes return 0 after this many bytes
    bool d_throwOnConnect;                          // connect() throws a std::runtime_error
    bool d_throwUnknownOnConnect;                   // connect() throws something that isn't an exception
    bool d_acceptButUnauthenticated;                // connect() succeeds but the session isn't authenticated
};

class MemorySession : public arkv::Session
{
public:
    explicit MemorySession(MemoryServer *server)
        : d_server(server)
        , d_closed(false)
        , d_written(0)
        , d_lastError()
        , d_currentFile()
        , d_isFileOpen(false)
    {
    }

    virtual ~MemorySession()
    {
        close();
    }

    virtual bool isAuthenticated()
    {
        return !d_closed && !d_server->d_acceptButUnauthenticated;
    }

    virtual bool stat(const char *remotePath, bool *isDirectory)
    {
        ++d_server->d_statCount;
        if (d_server->d_directories.count(remotePath)) {
            *isDirectory = true;
            return true;
        }
        if (d_server->d_files.count(remotePath)) {
            *isDirectory = false;
            return true;
        }
        d_lastError = "no such file";
        return false;
    }

    virtual bool mkdir(const char *remotePath, int)
    {
        ++d_server->d_mkdirCount;
        if (d_server->d_failMkdir == remotePath || d_server->d_directories.count(remotePath)) {
            d_lastError = "permission denied";
            return false;
        }
        d_server->d_directories.insert(remotePath);
        return true;
    }

    virtual bool openFile(const char *remotePath, int)
    {
        ++d_server->d_openCount;
        if (d_server->d_failOpen == remotePath) {
            d_lastError = "permission denied";
            return false;
        }
        d_currentFile = remotePath;
        d_server->d_files[d_currentFile].clear();
        d_isFileOpen = true;
        return true;
    }

    virtual int write(const char *buffer, int size)
    {
        if (!d_isFileOpen) {
            d_lastError = "no file open";
            return -1;
        }
        if (d_server->d_failWriteAfter >= 0 && d_written >= d_server->d_failWriteAfter) {
            d_lastError = "connection lost";
            return 0;
        }
        if (d_server->d_maxWriteSize > 0 && size > d_server->d_maxWriteSize) {
            size = d_server->d_maxWriteSize;
        }
        d_server->d_files[d_currentFile].append(buffer, size);
        d_written += size;
        return size;
    }

    virtual bool closeFile()
    {
        d_isFileOpen = false;
        return true;
    }

    virtual void close()
    {
        if (!d_closed) {
            d_closed = true;
            ++d_server->d_closeCount;
        }
    }

    virtual std::string getLastError()
    {
        return d_lastError;
    }

private:
    MemoryServer *d_server;
    bool d_closed;
    int64_t d_written;
    std::string d_lastError;
    std::string d_currentFile;
    bool d_isFileOpen;
};

// Connects to the memory server registered for the destination's host.  The servers must be registered before
// the connector is shared between threads.
class MemoryConnector : public arkv::Connector
{
public:
    MemoryConnector()
        : d_connectCount(0)
    {
    }

    void addServer(const std::string &host, MemoryServer *server)
    {
        d_servers[host] = server;
    }

    virtual arkv::Session *connect(const arkv::Destination &destination, const char *keyFile)
    {
        ++d_connectCount;

        std::map<std::string, MemoryServer*>::iterator iter = d_servers.find(destination.getHost());
        if (iter == d_servers.end()) {
            LOG_FAIL(MEMORY_CONNECT, Connection) << "Unknown host " << destination.getHost() << LOG_END
        }
        MemoryServer *server = iter->second;

        if (server->d_throwOnConnect) {
            throw std::runtime_error("unexpected failure");
        }
        if (server->d_throwUnknownOnConnect) {
            throw 42;
        }

        const arkv::Credential &credential = destination.getCredential();
        if (credential.getType() == arkv::Credential::Password) {
            if (credential.getPassword() != server->d_password) {
                LOG_FAIL(MEMORY_AUTH, Auth) << "Authentication failed for " << destination.getUsername()
                                            << LOG_END
            }
        } else if (!keyFile || !*keyFile) {
            LOG_FAIL(MEMORY_AUTH, Auth) << "No private key file for " << destination.getUsername() << LOG_END
        }

        return new MemorySession(server);
    }

    int getConnectCount() const
    {
        return d_connectCount;
    }

private:
    std::map<std::string, MemoryServer*> d_servers;
    std::atomic<int> d_connectCount;
};

#endif // TESTUTIL_MEMORYSESSION
