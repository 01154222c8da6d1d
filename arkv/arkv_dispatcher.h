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

#ifndef INCLUDED_ARKV_DISPATCHER_H
#define INCLUDED_ARKV_DISPATCHER_H

#include <arkv/arkv_destination.h>
#include <arkv/arkv_transfer.h>

#include <block/block_out.h>

#include <functional>
#include <iosfwd>
#include <string>
#include <thread>
#include <vector>

namespace arkv
{

class Connector;

// A destination that was uploaded successfully.
struct TransferResult
{
    std::string d_destination;    // destination name
    TransferStats d_stats;
};

// A destination whose upload was aborted.
struct TransferFailure
{
    TransferFailure()
        : d_error(0)
    {
    }

    std::string d_destination;    // destination name
    int d_error;                  // one of the 'Error::Type' values
    std::string d_message;
};

// Uploads the same local file or directory to several destinations at once, one thread per destination.
class Dispatcher
{
public:
    // Neither 'keyFile' nor 'connector' is owned.  'connector' is shared by all threads and must be thread-safe.
    Dispatcher(const char *keyFile, Connector *connector);

    virtual ~Dispatcher();

    // Upload 'localPath' to every destination in 'destinations' and wait for all of them to finish.  Successes are
    // appended to 'results' and failures to 'failures', both in the order of 'destinations'.  A failure never
    // affects the other destinations; a destination whose thread can't be started fails with an 'Internal' error.
    // Return true if every destination succeeded.
    bool run(const std::vector<Destination> &destinations, const char *localPath,
             std::vector<TransferResult> *results, std::vector<TransferFailure> *failures);

    // Print one line per successful destination, then either the failures under an "Errors occurred:" header or,
    // if there are none, "Done!".
    static void report(const std::vector<TransferResult> &results, const std::vector<TransferFailure> &failures,
                       std::ostream &out);

    // Forwarded from every transfer.  Handlers are called from the transfer threads.
    block::out<void(const char * /*destination*/, const char * /*relativePath*/)> fileOut;
    block::out<void(const char * /*destination*/, int /*fileCount*/, const char * /*fileName*/)> completeOut;

protected:
    // Start a thread running 'function'.  Throws 'std::system_error' if the thread can't be created.
    virtual std::thread startThread(const std::function<void()> &function);

private:
    // NOT IMPLEMENTED
    Dispatcher(const Dispatcher&);
    Dispatcher& operator=(const Dispatcher&);

    struct Unit;

    void runUnit(Unit *unit, const char *localPath);

    void onFile(const char *destination, const char *relativePath);
    void onComplete(const char *destination, int fileCount, const char *fileName);

    std::string d_keyFile;
    Connector *d_connector;
};

} // namespace arkv

#endif // INCLUDED_ARKV_DISPATCHER_H
