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

#ifndef INCLUDED_ARKV_TRANSFER_H
#define INCLUDED_ARKV_TRANSFER_H

#include <arkv/arkv_destination.h>

#include <block/block_out.h>

#include <string>

#include <stdint.h>

namespace arkv
{

class Connector;

// The result of one destination's transfer.
struct TransferStats
{
    TransferStats()
        : d_bytes(0)
        , d_seconds(0.0)
    {
    }

    // Return the size in megabytes (1 MB = 1048576 bytes).
    double getMegabytes() const;

    // Return the average speed in megabytes per second, or 0 if no time has elapsed.
    double getThroughput() const;

    int64_t d_bytes;      // total bytes copied
    double d_seconds;     // wall-clock duration of the whole transfer, connection included
};

// Uploads a local file or directory to one destination.
class Transfer
{
public:
    // 'keyFile' is the private key for a 'PrivateKey' credential; 'connector' creates the session.  Neither is owned.
    Transfer(const Destination &destination, const char *keyFile, Connector *connector);

    ~Transfer();

    // Upload 'localPath' to the destination's remote path and fill in 'stats'.  The local path is checked before
    // connecting.  Any error aborts the whole transfer and is thrown as an 'Exception'; the session is always
    // closed before returning.
    void run(const char *localPath, TransferStats *stats);

    const Destination &getDestination() const
    {
        return d_destination;
    }

    // Called before each file is uploaded, with the destination name and the path relative to the upload root.
    block::out<void(const char * /*destination*/, const char * /*relativePath*/)> fileOut;

    // Called once all files have been uploaded.  'fileName' is the uploaded file for a single-file upload and null
    // for a directory upload.
    block::out<void(const char * /*destination*/, int /*fileCount*/, const char * /*fileName*/)> completeOut;

private:
    // NOT IMPLEMENTED
    Transfer(const Transfer&);
    Transfer& operator=(const Transfer&);

    Destination d_destination;
    std::string d_keyFile;
    Connector *d_connector;
};

} // namespace arkv

#endif // INCLUDED_ARKV_TRANSFER_H
