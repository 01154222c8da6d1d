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

#include <arkv/arkv_file.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>
#include <arkv/arkv_util.h>

#include <json/json.h>

#include <sstream>

namespace arkv
{

namespace {

// Return the string member 'key' of 'object', or 'defaultValue' if it is absent.
std::string getString(const Json::Value &object, const char *key, const char *defaultValue, int index)
{
    const Json::Value &value = object[key];
    if (value.isNull()) {
        if (!defaultValue) {
            LOG_FAIL(CONFIG_FIELD, Config) << "Destination #" << index + 1 << " has no '" << key << "'" << LOG_END
        }
        return defaultValue;
    }
    if (!value.isString()) {
        LOG_FAIL(CONFIG_FIELD, Config) << "'" << key << "' of destination #" << index + 1 << " is not a string"
                                       << LOG_END
    }
    return value.asString();
}

Destination parseDestination(const Json::Value &object, int index)
{
    if (!object.isObject()) {
        LOG_FAIL(CONFIG_DESTINATION, Config) << "Destination #" << index + 1 << " is not an object" << LOG_END
    }

    std::string host = getString(object, "host", 0, index);
    std::string username = getString(object, "username", 0, index);
    std::string remotePath = getString(object, "remote_path", 0, index);
    std::string name = getString(object, "name", "", index);
    if (host.empty() || username.empty() || remotePath.empty()) {
        LOG_FAIL(CONFIG_DESTINATION, Config) << "Destination #" << index + 1
                                             << " needs a host, a username and a remote path" << LOG_END
    }
    if (name.empty()) {
        name = host;
    }

    int port = Destination::DefaultPort;
    const Json::Value &portValue = object["port"];
    if (!portValue.isNull()) {
        if (!portValue.isInt() || portValue.asInt() <= 0 || portValue.asInt() > 65535) {
            LOG_FAIL(CONFIG_DESTINATION, Config) << "Invalid port for destination '" << name << "'" << LOG_END
        }
        port = portValue.asInt();
    }

    const Json::Value &password = object["password"];
    if (password.isNull()) {
        return Destination(name, host, static_cast<uint16_t>(port), username, remotePath, Credential::privateKey());
    }
    if (!password.isString()) {
        LOG_FAIL(CONFIG_DESTINATION, Config) << "The password of destination '" << name << "' is not a string"
                                             << LOG_END
    }
    return Destination(name, host, static_cast<uint16_t>(port), username, remotePath,
                       Credential::password(password.asString()));
}

} // unnamed namespace

Config::Config()
    : d_keyFile()
    , d_destinations()
{
}

Config Config::parse(const std::string &text)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        LOG_FAIL(CONFIG_PARSE, Config) << "Malformed configuration: " << errors << LOG_END
    }
    if (!root.isObject()) {
        LOG_FAIL(CONFIG_PARSE, Config) << "The configuration is not a JSON object" << LOG_END
    }

    Config config;

    const Json::Value &keyFile = root["ssh_key_path"];
    if (!keyFile.isNull()) {
        if (!keyFile.isString()) {
            LOG_FAIL(CONFIG_PARSE, Config) << "'ssh_key_path' is not a string" << LOG_END
        }
        config.d_keyFile = keyFile.asString();
    }

    const Json::Value &destinations = root["destinations"];
    if (!destinations.isArray()) {
        LOG_FAIL(CONFIG_PARSE, Config) << "'destinations' is missing or is not an array" << LOG_END
    }
    for (Json::ArrayIndex i = 0; i < destinations.size(); ++i) {
        config.d_destinations.push_back(parseDestination(destinations[i], static_cast<int>(i)));
    }

    return config;
}

bool Config::load(const char *path, Config *config)
{
    if (!PathUtil::exists(path)) {
        return false;
    }

    File file;
    if (!file.open(path, false, false)) {
        LOG_FAIL(CONFIG_OPEN, Config) << "Failed to open the configuration file '" << path << "': "
                                      << Util::getLastError() << LOG_END
    }

    std::string text;
    char buffer[4096];
    int bytes;
    while ((bytes = file.read(buffer, sizeof(buffer))) > 0) {
        text.append(buffer, bytes);
    }
    if (bytes < 0) {
        LOG_FAIL(CONFIG_READ, Config) << "Failed to read the configuration file '" << path << "': "
                                      << Util::getLastError() << LOG_END
    }

    LOG_DEBUG(CONFIG_LOAD) << "Loading configuration from " << path << LOG_END
    *config = parse(text);
    return true;
}

} // namespace arkv
