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

#include <arkv/arkv_dispatcher.h>

#include <arkv/arkv_destination.h>
#include <arkv/arkv_file.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>

#include <testutil/testutil_assert.h>
#include <testutil/testutil_memorysession.h>

#include <atomic>
#include <functional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <cstring>

using namespace arkv;

// Counts progress notifications, which arrive from several threads.
class ProgressCounter
{
public:
    ProgressCounter()
        : d_files(0)
        , d_completes(0)
    {
    }

    void onFile(const char *, const char *)
    {
        ++d_files;
    }

    void onComplete(const char *, int, const char *)
    {
        ++d_completes;
    }

    std::atomic<int> d_files;
    std::atomic<int> d_completes;
};

// A dispatcher that can't start the thread of one destination.
class ThreadLimitedDispatcher : public Dispatcher
{
public:
    ThreadLimitedDispatcher(Connector *connector, int failingThread)
        : Dispatcher(0, connector)
        , d_failingThread(failingThread)
        , d_started(0)
    {
    }

protected:
    virtual std::thread startThread(const std::function<void()> &function)
    {
        if (d_started++ == d_failingThread) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return Dispatcher::startThread(function);
    }

private:
    int d_failingThread;
    int d_started;
};

void createFile(const char *top, const char *name, const char *content)
{
    File f(PathUtil::join(top, name).c_str(), true);
    ASSERT(f.isValid());
    ASSERT(f.write(content, ::strlen(content)) == static_cast<int>(::strlen(content)));
}

void testOneFailureDoesNotAffectOthers(const std::string &d)
{
    MemoryServer serverA, serverB, serverC;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);
    connector.addServer("hc", &serverC);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("A=u:wrong@ha:/r"));
    destinations.push_back(Destination::parse("B=u:secret@hb:/r"));
    destinations.push_back(Destination::parse("C=u:secret@hc:/backup"));

    Dispatcher dispatcher(0, &connector);
    ProgressCounter counter;
    dispatcher.fileOut.connect(&counter, &ProgressCounter::onFile);
    dispatcher.completeOut.connect(&counter, &ProgressCounter::onComplete);

    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(!dispatcher.run(destinations, d.c_str(), &results, &failures));

    ASSERT(results.size() == 2);
    ASSERT(results[0].d_destination == "B");
    ASSERT(results[1].d_destination == "C");
    ASSERT(results[0].d_stats.d_bytes == 7);

    ASSERT(failures.size() == 1);
    ASSERT(failures[0].d_destination == "A");
    ASSERT(failures[0].d_error == Error::Auth);

    ASSERT(serverA.d_files.empty());
    ASSERT(serverB.d_files["/r/d/x"] == "abc");
    ASSERT(serverB.d_files["/r/d/y/z"] == "defg");
    ASSERT(serverC.d_files["/backup/d/y/z"] == "defg");

    ASSERT(counter.d_files == 4);
    ASSERT(counter.d_completes == 2);
}

void testAllSucceed(const std::string &d)
{
    MemoryServer serverA, serverB;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("u@ha:/r"));
    destinations.push_back(Destination::parse("u:secret@hb:/r"));

    Dispatcher dispatcher("/home/u/.ssh/id_rsa", &connector);
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(dispatcher.run(destinations, d.c_str(), &results, &failures));
    ASSERT(results.size() == 2);
    ASSERT(failures.empty());
    ASSERT(connector.getConnectCount() == 2);
}

void testAbnormalTermination(const std::string &d)
{
    MemoryServer serverA, serverB, serverC;
    serverA.d_throwOnConnect = true;
    serverB.d_throwUnknownOnConnect = true;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);
    connector.addServer("hc", &serverC);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("A=u:secret@ha:/r"));
    destinations.push_back(Destination::parse("B=u:secret@hb:/r"));
    destinations.push_back(Destination::parse("C=u:secret@hc:/r"));
    destinations.push_back(Destination::parse("D=u:secret@unknown:/r"));

    Dispatcher dispatcher(0, &connector);
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(!dispatcher.run(destinations, d.c_str(), &results, &failures));

    ASSERT(results.size() == 1);
    ASSERT(results[0].d_destination == "C");

    ASSERT(failures.size() == 3);
    ASSERT(failures[0].d_destination == "A");
    ASSERT(failures[0].d_error == Error::Internal);
    ASSERT(failures[0].d_message == "unexpected failure");
    ASSERT(failures[1].d_destination == "B");
    ASSERT(failures[1].d_error == Error::Internal);
    ASSERT(failures[1].d_message == "transfer terminated abnormally");
    ASSERT(failures[2].d_destination == "D");
    ASSERT(failures[2].d_error == Error::Connection);
}

void testUnauthenticatedSession(const std::string &d)
{
    // The server accepts the credential but the session doesn't end up authenticated.
    MemoryServer serverA, serverB;
    serverA.d_acceptButUnauthenticated = true;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("A=u:secret@ha:/r"));
    destinations.push_back(Destination::parse("B=u:secret@hb:/r"));

    Dispatcher dispatcher(0, &connector);
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(!dispatcher.run(destinations, d.c_str(), &results, &failures));

    ASSERT(results.size() == 1);
    ASSERT(results[0].d_destination == "B");
    ASSERT(failures.size() == 1);
    ASSERT(failures[0].d_destination == "A");
    ASSERT(failures[0].d_error == Error::Auth);

    // Nothing is uploaded over the unauthenticated session, and it is still closed.
    ASSERT(serverA.d_files.empty());
    ASSERT(serverA.d_mkdirCount == 0);
    ASSERT(serverA.d_closeCount == 1);
}

void testThreadStartFailure(const std::string &d)
{
    MemoryServer serverA, serverB, serverC;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);
    connector.addServer("hc", &serverC);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("A=u:secret@ha:/r"));
    destinations.push_back(Destination::parse("B=u:secret@hb:/r"));
    destinations.push_back(Destination::parse("C=u:secret@hc:/r"));

    // The second thread can't be started; the threads already running are still joined.
    ThreadLimitedDispatcher dispatcher(&connector, 1);
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(!dispatcher.run(destinations, d.c_str(), &results, &failures));

    ASSERT(results.size() == 2);
    ASSERT(results[0].d_destination == "A");
    ASSERT(results[1].d_destination == "C");
    ASSERT(failures.size() == 1);
    ASSERT(failures[0].d_destination == "B");
    ASSERT(failures[0].d_error == Error::Internal);
    ASSERT(failures[0].d_message.find("thread") != std::string::npos);
    ASSERT(serverB.d_files.empty());
    ASSERT(serverC.d_files["/r/d/x"] == "abc");
}

void testMissingPath(const std::string &top)
{
    MemoryServer serverA, serverB;
    MemoryConnector connector;
    connector.addServer("ha", &serverA);
    connector.addServer("hb", &serverB);

    std::vector<Destination> destinations;
    destinations.push_back(Destination::parse("u:secret@ha:/r"));
    destinations.push_back(Destination::parse("u:secret@hb:/r"));

    Dispatcher dispatcher(0, &connector);
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(!dispatcher.run(destinations, PathUtil::join(top.c_str(), "no_such_dir").c_str(), &results, &failures));
    ASSERT(results.empty());
    ASSERT(failures.size() == 2);
    ASSERT(failures[0].d_error == Error::Path);
    ASSERT(failures[1].d_error == Error::Path);
    ASSERT(connector.getConnectCount() == 0);
}

void testNoDestinations(const std::string &d)
{
    MemoryConnector connector;
    Dispatcher dispatcher(0, &connector);
    std::vector<Destination> destinations;
    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    ASSERT(dispatcher.run(destinations, d.c_str(), &results, &failures));
    ASSERT(results.empty());
    ASSERT(failures.empty());
}

void testReport()
{
    std::vector<TransferResult> results;
    TransferResult result;
    result.d_destination = "B";
    result.d_stats.d_bytes = 5 * 1048576;
    result.d_stats.d_seconds = 2.0;
    results.push_back(result);

    std::vector<TransferFailure> failures;
    std::ostringstream out;
    Dispatcher::report(results, failures, out);
    ASSERT(out.str() == "B: 5.00 MB in 2.0s (2.50 MB/s)\n"
                        "Done!\n");

    TransferFailure failure;
    failure.d_destination = "A";
    failure.d_error = Error::Auth;
    failure.d_message = "Authentication failed";
    failures.push_back(failure);

    std::ostringstream withErrors;
    Dispatcher::report(results, failures, withErrors);
    ASSERT(withErrors.str() == "B: 5.00 MB in 2.0s (2.50 MB/s)\n"
                               "Errors occurred:\n"
                               "A: AuthError: Authentication failed\n");

    // A run where every destination failed doesn't end with "Done!" either.
    std::ostringstream allFailed;
    Dispatcher::report(std::vector<TransferResult>(), failures, allFailed);
    ASSERT(allFailed.str() == "Errors occurred:\n"
                              "A: AuthError: Authentication failed\n");
}

int main(int argc, char *argv[])
{
    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_dispatcher_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    std::string d = PathUtil::join(top.c_str(), "d");
    ASSERT(PathUtil::createDirectory(d.c_str()));
    ASSERT(PathUtil::createDirectory(PathUtil::join(d.c_str(), "y").c_str()));
    createFile(d.c_str(), "x", "abc");
    createFile(d.c_str(), "y/z", "defg");

    testOneFailureDoesNotAffectOthers(d);
    testAllSucceed(d);
    testAbnormalTermination(d);
    testUnauthenticatedSession(d);
    testThreadStartFailure(d);
    testMissingPath(top);
    testNoDestinations(d);
    testReport();

    PathUtil::removeDirectoryRecursively(top.c_str());

    TESTUTIL_RETURN
}
