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

#include <testutil/testutil_assert.h>

#include <string>
#include <vector>

#include <cstring>

using namespace arkv;

class LogCapture
{
public:
    void onLog(const char *id, int, const char *message)
    {
        d_ids.push_back(id);
        d_messages.push_back(message);
    }

    std::vector<std::string> d_ids;
    std::vector<std::string> d_messages;
};

void testParse()
{
    Config config = Config::parse(
        "{\n"
        "  \"ssh_key_path\": \"/home/me/.ssh/id_ed25519\",\n"
        "  \"destinations\": [\n"
        "    { \"name\": \"nas\", \"host\": \"10.0.0.5\", \"port\": 2222, \"username\": \"me\",\n"
        "      \"remote_path\": \"/backup\", \"password\": \"s3:cr@t\" },\n"
        "    { \"host\": \"example.com\", \"username\": \"alice\", \"remote_path\": \"archive\" },\n"
        "    { \"name\": \"cold\", \"host\": \"cold.example.com\", \"port\": 22, \"username\": \"bob\",\n"
        "      \"remote_path\": \"/srv\", \"password\": null }\n"
        "  ]\n"
        "}\n");

    ASSERT(config.getKeyFile() == "/home/me/.ssh/id_ed25519");
    ASSERT(config.getDestinations().size() == 3);

    const Destination &nas = config.getDestinations()[0];
    ASSERT(nas.getName() == "nas");
    ASSERT(nas.getHost() == "10.0.0.5");
    ASSERT(nas.getPort() == 2222);
    ASSERT(nas.getUsername() == "me");
    ASSERT(nas.getRemotePath() == "/backup");
    ASSERT(nas.getCredential().getType() == Credential::Password);
    ASSERT(nas.getCredential().getPassword() == "s3:cr@t");

    // The name defaults to the host and the port to 22; no password means the private key.
    const Destination &plain = config.getDestinations()[1];
    ASSERT(plain.getName() == "example.com");
    ASSERT(plain.getPort() == Destination::DefaultPort);
    ASSERT(plain.getCredential().getType() == Credential::PrivateKey);

    ASSERT(config.getDestinations()[2].getCredential().getType() == Credential::PrivateKey);
}

void testNoKeyFile()
{
    Config config = Config::parse("{ \"destinations\": [] }");
    ASSERT(config.getKeyFile().empty());
    ASSERT(config.getDestinations().empty());
}

void testMalformed()
{
    const char *MALFORMED[] = {
        "",
        "not json",
        "[]",
        "{ \"ssh_key_path\": \"/k\" }",
        "{ \"destinations\": {} }",
        "{ \"ssh_key_path\": 5, \"destinations\": [] }",
        "{ \"destinations\": [ 1 ] }",
        "{ \"destinations\": [ { \"username\": \"u\", \"remote_path\": \"/r\" } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"remote_path\": \"/r\" } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"username\": \"u\" } ] }",
        "{ \"destinations\": [ { \"host\": \"\", \"username\": \"u\", \"remote_path\": \"/r\" } ] }",
        "{ \"destinations\": [ { \"host\": 7, \"username\": \"u\", \"remote_path\": \"/r\" } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"username\": \"u\", \"remote_path\": \"/r\", \"port\": 0 } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"username\": \"u\", \"remote_path\": \"/r\", \"port\": 70000 } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"username\": \"u\", \"remote_path\": \"/r\", \"port\": \"22\" } ] }",
        "{ \"destinations\": [ { \"host\": \"h\", \"username\": \"u\", \"remote_path\": \"/r\", \"password\": 1 } ] }",
    };

    for (unsigned int i = 0; i < sizeof(MALFORMED) / sizeof(MALFORMED[0]); ++i) {
        bool thrown = false;
        try {
            Config::parse(MALFORMED[i]);
        } catch (Exception &e) {
            thrown = true;
            ASSERT(e.getError() == Error::Config);
        }
        ASSERT(thrown);
    }
}

// A malformed configuration is reported by exactly one log record, the one raised with the exception.
void testReportedOnce()
{
    LogCapture capture;
    Log::out.connect(&capture, &LogCapture::onLog);

    ASSERT_THROWS(Config::parse("{ \"destinations\": [ { \"host\": \"h\" } ] }"), Exception);

    Log::out.disconnect();

    ASSERT(capture.d_ids.size() == 1);
    ASSERT(capture.d_ids[0] == "CONFIG_FIELD");
    ASSERT(capture.d_messages[0].find("username") != std::string::npos);
}

void testLoad(const std::string &top)
{
    Config config;
    ASSERT(!Config::load(PathUtil::join(top.c_str(), "missing.json").c_str(), &config));
    ASSERT(config.getDestinations().empty());

    const char *content = "{ \"ssh_key_path\": \"~/.ssh/id_rsa\", \"destinations\": [\n"
                          "  { \"host\": \"h\", \"username\": \"u\", \"remote_path\": \"/r\", \"password\": \"p\" } ] }";
    std::string path = PathUtil::join(top.c_str(), "config.json");
    {
        File f(path.c_str(), true);
        ASSERT(f.isValid());
        ASSERT(f.write(content, ::strlen(content)) == static_cast<int>(::strlen(content)));
    }

    ASSERT(Config::load(path.c_str(), &config));
    ASSERT(config.getKeyFile() == "~/.ssh/id_rsa");
    ASSERT(config.getDestinations().size() == 1);
    ASSERT(config.getDestinations()[0].getCredential().getPassword() == "p");

    std::string broken = PathUtil::join(top.c_str(), "broken.json");
    {
        File f(broken.c_str(), true);
        ASSERT(f.write("{ \"destinations\": [", 19) == 19);
    }
    ASSERT_THROWS(Config::load(broken.c_str(), &config), Exception);
}

int main(int argc, char *argv[])
{
    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_config_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    testParse();
    testNoKeyFile();
    testMalformed();
    testReportedOnce();
    testLoad(top);

    PathUtil::removeDirectoryRecursively(top.c_str());

    TESTUTIL_RETURN
}
