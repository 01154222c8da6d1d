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

#include <arkv/arkv_destination.h>

#include <arkv/arkv_log.h>

#include <cstdlib>

namespace arkv
{

Destination Destination::parse(const char *descriptor)
{
    std::string text = descriptor;
    std::string name;

    // A leading 'name=' is recognized only before the account part, so a password may contain '='.
    size_t equal = text.find('=');
    if (equal != std::string::npos && equal < text.find('@') && equal < text.find(':')) {
        name = text.substr(0, equal);
        text = text.substr(equal + 1);
    }

    size_t at = text.find('@');
    if (at == std::string::npos || at == 0) {
        LOG_FAIL(DESTINATION_PARSE, Config) << "Missing user name in destination '" << descriptor << "'" << LOG_END
    }

    std::string account = text.substr(0, at);
    std::string location = text.substr(at + 1);

    std::string username = account;
    bool hasPassword = false;
    std::string password;
    size_t colon = account.find(':');
    if (colon != std::string::npos) {
        username = account.substr(0, colon);
        password = account.substr(colon + 1);
        hasPassword = true;
    }

    if (username.empty()) {
        LOG_FAIL(DESTINATION_PARSE, Config) << "Missing user name in destination '" << descriptor << "'" << LOG_END
    }

    // 'location' is host[:port]:remote_path
    colon = location.find(':');
    if (colon == std::string::npos || colon == 0) {
        LOG_FAIL(DESTINATION_PARSE, Config) << "Missing host or remote path in destination '" << descriptor << "'"
                                            << LOG_END
    }
    std::string host = location.substr(0, colon);
    std::string rest = location.substr(colon + 1);

    long port = DefaultPort;
    size_t next = rest.find(':');
    if (next != std::string::npos && next > 0 && rest.find_first_not_of("0123456789") == next) {
        port = ::strtol(rest.substr(0, next).c_str(), 0, 10);
        rest = rest.substr(next + 1);
        if (port <= 0 || port > 65535) {
            LOG_FAIL(DESTINATION_PARSE, Config) << "Invalid port in destination '" << descriptor << "'" << LOG_END
        }
    }

    if (rest.empty()) {
        LOG_FAIL(DESTINATION_PARSE, Config) << "Missing remote path in destination '" << descriptor << "'" << LOG_END
    }

    if (name.empty()) {
        name = host;
    }

    return Destination(name, host, static_cast<uint16_t>(port), username, rest,
                       hasPassword ? Credential::password(password) : Credential::privateKey());
}

std::string Destination::describe() const
{
    return d_name + " (" + d_host + ")";
}

} // namespace arkv
