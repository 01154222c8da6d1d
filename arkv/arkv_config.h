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

#ifndef INCLUDED_ARKV_CONFIG_H
#define INCLUDED_ARKV_CONFIG_H

#include <arkv/arkv_destination.h>

#include <string>
#include <vector>

namespace arkv
{

// The run-level settings kept in a configuration file: the private key used by destinations without a password,
// and the list of destinations.  The file is a JSON document of the form
//
//   {
//     "ssh_key_path": "/home/me/.ssh/id_rsa",
//     "destinations": [
//       { "name": "nas", "host": "10.0.0.5", "port": 22, "username": "me", "remote_path": "/backup",
//         "password": "secret" }
//     ]
//   }
//
// where 'ssh_key_path', 'name', 'port' and 'password' may be omitted.  A destination without a password uses the
// private key.
class Config
{
public:
    Config();

    // Read the configuration from 'text'.  Throws a 'Config' error if it is malformed.
    static Config parse(const std::string &text);

    // Read the configuration file 'path' into 'config'.  Return false if the file doesn't exist.  Throws a 'Config'
    // error if it can't be read or is malformed.
    static bool load(const char *path, Config *config);

    // Empty if not configured.
    const std::string &getKeyFile() const
    {
        return d_keyFile;
    }

    const std::vector<Destination> &getDestinations() const
    {
        return d_destinations;
    }

private:
    std::string d_keyFile;
    std::vector<Destination> d_destinations;
};

} // namespace arkv

#endif // INCLUDED_ARKV_CONFIG_H
