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

#include <arkv/arkv_log.h>

#include <exception>
#include <memory>
#include <ostream>
#include <system_error>
#include <thread>

#include <cstdio>

namespace arkv
{

// The state owned by one transfer thread.  Each thread only writes to its own unit.
struct Dispatcher::Unit
{
    explicit Unit(const Destination &destination)
        : d_destination(destination)
        , d_succeeded(false)
    {
    }

    const Destination &d_destination;
    bool d_succeeded;
    TransferStats d_stats;
    TransferFailure d_failure;
};

Dispatcher::Dispatcher(const char *keyFile, Connector *connector)
    : d_keyFile(keyFile ? keyFile : "")
    , d_connector(connector)
{
}

Dispatcher::~Dispatcher()
{
}

bool Dispatcher::run(const std::vector<Destination> &destinations, const char *localPath,
                     std::vector<TransferResult> *results, std::vector<TransferFailure> *failures)
{
    std::vector<std::unique_ptr<Unit> > units;
    for (size_t i = 0; i < destinations.size(); ++i) {
        units.push_back(std::unique_ptr<Unit>(new Unit(destinations[i])));
    }

    // Reserved up front so that adding a started thread never throws.
    std::vector<std::thread> threads;
    threads.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        Unit *unit = units[i].get();
        try {
            threads.push_back(startThread(std::bind(&Dispatcher::runUnit, this, unit, localPath)));
        } catch (std::system_error &e) {
            LOG_ERROR(DISPATCHER_THREAD) << "Failed to start the transfer to " << unit->d_destination.describe()
                                         << ": " << e.what() << LOG_END
            unit->d_failure.d_destination = unit->d_destination.getName();
            unit->d_failure.d_error = Error::Internal;
            unit->d_failure.d_message = std::string("failed to start the transfer thread: ") + e.what();
        }
    }

    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }

    bool allSucceeded = true;
    for (size_t i = 0; i < units.size(); ++i) {
        const Unit &unit = *units[i];
        if (unit.d_succeeded) {
            TransferResult result;
            result.d_destination = unit.d_destination.getName();
            result.d_stats = unit.d_stats;
            results->push_back(result);
        } else {
            failures->push_back(unit.d_failure);
            allSucceeded = false;
        }
    }
    return allSucceeded;
}

std::thread Dispatcher::startThread(const std::function<void()> &function)
{
    return std::thread(function);
}

void Dispatcher::runUnit(Unit *unit, const char *localPath)
{
    unit->d_failure.d_destination = unit->d_destination.getName();

    try {
        Transfer transfer(unit->d_destination, d_keyFile.c_str(), d_connector);
        transfer.fileOut.connect(this, &Dispatcher::onFile);
        transfer.completeOut.connect(this, &Dispatcher::onComplete);
        transfer.run(localPath, &unit->d_stats);
        unit->d_succeeded = true;
    } catch (Exception &e) {
        unit->d_failure.d_error = e.getError();
        unit->d_failure.d_message = e.getMessage();
    } catch (std::exception &e) {
        unit->d_failure.d_error = Error::Internal;
        unit->d_failure.d_message = e.what();
    } catch (...) {
        // Nothing may escape a thread; record it like any other failure.
        unit->d_failure.d_error = Error::Internal;
        unit->d_failure.d_message = "transfer terminated abnormally";
    }
}

void Dispatcher::onFile(const char *destination, const char *relativePath)
{
    fileOut(destination, relativePath);
}

void Dispatcher::onComplete(const char *destination, int fileCount, const char *fileName)
{
    completeOut(destination, fileCount, fileName);
}

void Dispatcher::report(const std::vector<TransferResult> &results, const std::vector<TransferFailure> &failures,
                        std::ostream &out)
{
    char buffer[256];
    for (size_t i = 0; i < results.size(); ++i) {
        const TransferStats &stats = results[i].d_stats;
        ::snprintf(buffer, sizeof(buffer), "%.2f MB in %.1fs (%.2f MB/s)", stats.getMegabytes(), stats.d_seconds,
                   stats.getThroughput());
        out << results[i].d_destination << ": " << buffer << "\n";
    }

    if (!failures.empty()) {
        out << "Errors occurred:\n";
        for (size_t i = 0; i < failures.size(); ++i) {
            out << failures[i].d_destination << ": " << Error::getLiteral(failures[i].d_error) << ": "
                << failures[i].d_message << "\n";
        }
    } else {
        out << "Done!\n";
    }
}

} // namespace arkv
