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

#include <arkv/arkv_config.h>
#include <arkv/arkv_destination.h>
#include <arkv/arkv_dispatcher.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>
#include <arkv/arkv_sftpsession.h>
#include <arkv/arkv_util.h>

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <cstdio>
#include <cstdlib>

#include <unistd.h>

using namespace arkv;

namespace {

// Prints the progress of all transfers, one line per event.
class ProgressPrinter
{
public:
    void onFile(const char *destination, const char *relativePath)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        ::printf("[%s] Uploading %s\n", destination, relativePath);
        ::fflush(stdout);
    }

    void onComplete(const char *destination, int fileCount, const char *fileName)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        if (fileName) {
            ::printf("[%s] Uploaded %s\n", destination, fileName);
        } else {
            ::printf("[%s] Uploaded %d files\n", destination, fileCount);
        }
        ::fflush(stdout);
    }

private:
    std::mutex d_mutex;
};

void usage(const char *program)
{
    ::printf("Usage: %s [-v] [-c config_file] [-k key_file] [-i index] file_or_folder [destination...]\n", program);
    ::printf("       where destination is [name=]user[:password]@host[:port]:remote_path\n");
    ::printf("       -c  configuration file (default: ~/.config/arkv/config.json)\n");
    ::printf("       -k  private key for destinations without a password (default: the configured key, or\n");
    ::printf("           ~/.ssh/id_rsa)\n");
    ::printf("       -i  upload only to the destination at this position (starting from 1)\n");
    ::printf("       -v  print debug messages\n");
    ::printf("       Destinations given on the command line are added after the configured ones.  Passwords on the\n");
    ::printf("       command line are visible to other users; keep them in the configuration file instead.\n");
}

// Return 'path' under the home directory, or an empty string if there is no home directory.
std::string getHomePath(const char *path)
{
    const char *home = ::getenv("HOME");
    if (!home || !*home) {
        return "";
    }
    return PathUtil::join(home, path);
}

// Replace a leading '~/' with the home directory.
std::string expandHome(const std::string &path)
{
    if (path.compare(0, 2, "~/") == 0) {
        std::string expanded = getHomePath(path.c_str() + 2);
        if (!expanded.empty()) {
            return expanded;
        }
    }
    return path;
}

} // unnamed namespace

int main(int argc, char *argv[])
{
    if (argc < 2) {
        usage(argv[0]);
        return 0;
    }

    std::string configFile;
    std::string keyFile;
    int index = 0;
    int option;
    while ((option = ::getopt(argc, argv, "vc:k:i:")) != -1) {
        switch (option) {
        case 'v':
            Log::setLevel(Log::Debug);
            break;
        case 'c':
            configFile = optarg;
            break;
        case 'k':
            keyFile = optarg;
            break;
        case 'i':
            index = ::atoi(optarg);
            if (index <= 0) {
                ::fprintf(stderr, "Invalid destination index: %s\n", optarg);
                return 1;
            }
            break;
        default:
            usage(argv[0]);
            return 1;
        }
    }

    if (argc - optind < 1) {
        usage(argv[0]);
        return 1;
    }

    const char *localPath = argv[optind];

    // A missing default configuration file just means that every destination is on the command line.
    bool isDefaultConfig = configFile.empty();
    if (isDefaultConfig) {
        configFile = getHomePath(".config/arkv/config.json");
    }

    Config config;
    std::vector<Destination> destinations;
    try {
        if (!configFile.empty() && !Config::load(configFile.c_str(), &config) && !isDefaultConfig) {
            ::fprintf(stderr, "Configuration file not found: %s\n", configFile.c_str());
            return 1;
        }
        destinations = config.getDestinations();
        for (int i = optind + 1; i < argc; ++i) {
            destinations.push_back(Destination::parse(argv[i]));
        }
    } catch (Exception &) {
        // Already reported by the log.
        return 1;
    }

    if (destinations.empty()) {
        ::fprintf(stderr, "No destinations: add them to %s or give them on the command line\n",
                  configFile.c_str());
        return 1;
    }

    if (keyFile.empty()) {
        keyFile = config.getKeyFile().empty() ? getHomePath(".ssh/id_rsa") : expandHome(config.getKeyFile());
    }

    if (index > 0) {
        if (index > static_cast<int>(destinations.size())) {
            ::fprintf(stderr, "Destination index %d is out of range (1-%d)\n", index,
                      static_cast<int>(destinations.size()));
            return 1;
        }
        Destination selected = destinations[index - 1];
        destinations.clear();
        destinations.push_back(selected);
    }

    if (!Util::startup()) {
        return 1;
    }

    if (destinations.size() == 1) {
        ::printf("Archiving to %s\n", destinations[0].describe().c_str());
    } else {
        ::printf("Archiving to %d destinations\n", static_cast<int>(destinations.size()));
    }

    ProgressPrinter printer;
    SFTPConnector connector;
    Dispatcher dispatcher(keyFile.c_str(), &connector);
    dispatcher.fileOut.connect(&printer, &ProgressPrinter::onFile);
    dispatcher.completeOut.connect(&printer, &ProgressPrinter::onComplete);

    std::vector<TransferResult> results;
    std::vector<TransferFailure> failures;
    bool succeeded = dispatcher.run(destinations, localPath, &results, &failures);

    ::fflush(stdout);
    Dispatcher::report(results, failures, std::cout);
    std::cout.flush();

    Util::cleanup();

    return succeeded ? 0 : 1;
}
