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

#ifndef INCLUDED_ARKV_DESTINATION_H
#define INCLUDED_ARKV_DESTINATION_H

#include <string>

#include <stdint.h>

namespace arkv
{

// How a destination authenticates: either with its own password, or with the private key configured for the whole
// run.  Exactly one of the two is active.
class Credential
{
public:
    enum Type {
        Password,
        PrivateKey
    };

    static Credential password(const std::string &password)
    {
        return Credential(Password, password);
    }

    static Credential privateKey()
    {
        return Credential(PrivateKey, std::string());
    }

    Type getType() const
    {
        return d_type;
    }

    // Only meaningful for a 'Password' credential.
    const std::string &getPassword() const
    {
        return d_password;
    }

private:
    Credential(Type type, const std::string &password)
        : d_type(type)
        , d_password(password)
    {
    }

    Type d_type;
    std::string d_password;
};

// One remote upload target.  Read-only once created.
class Destination
{
public:
    enum { DefaultPort = 22 };

    Destination(const std::string &name, const std::string &host, uint16_t port, const std::string &username,
                const std::string &remotePath, const Credential &credential)
        : d_name(name)
        , d_host(host)
        , d_port(port)
        , d_username(username)
        , d_remotePath(remotePath)
        , d_credential(credential)
    {
    }

    // Create a destination from a descriptor of the form '[name=]user[:password]@host[:port]:remote_path'.  The
    // name defaults to the host and the port to 22; no password means key authentication.  Throws a 'Config' error
    // if the descriptor is malformed.
    static Destination parse(const char *descriptor);

    const std::string &getName() const { return d_name; }
    const std::string &getHost() const { return d_host; }
    uint16_t getPort() const { return d_port; }
    const std::string &getUsername() const { return d_username; }
    const std::string &getRemotePath() const { return d_remotePath; }
    const Credential &getCredential() const { return d_credential; }

    // Return 'name (host)' for display.
    std::string describe() const;

private:
    std::string d_name;
    std::string d_host;
    uint16_t d_port;
    std::string d_username;
    std::string d_remotePath;
    Credential d_credential;
};

} // namespace arkv

#endif // INCLUDED_ARKV_DESTINATION_H
