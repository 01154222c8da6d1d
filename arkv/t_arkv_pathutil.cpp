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

#include <arkv/arkv_pathutil.h>

#include <arkv/arkv_entry.h>
#include <arkv/arkv_file.h>
#include <arkv/arkv_util.h>

#include <testutil/testutil_assert.h>

#include <string>
#include <vector>

#include <cstring>

using namespace arkv;

void createFile(const char *top, const char *name, const char *content)
{
    File f(PathUtil::join(top, name).c_str(), true);
    ASSERT(f.isValid());
    int bytes = f.write(content, ::strlen(content));
    ASSERT(bytes == static_cast<int>(::strlen(content)));
}

void testPathComponents()
{
    ASSERT(PathUtil::join("/a", "b") == "/a/b");
    ASSERT(PathUtil::join("/a/", "b") == "/a/b");
    ASSERT(PathUtil::join("", "b") == "b");
    ASSERT(PathUtil::join("uploads", "d/sub/f") == "uploads/d/sub/f");

    ASSERT(PathUtil::getDirectory("/a/b/c") == "/a/b");
    ASSERT(PathUtil::getDirectory("/a") == "/");
    ASSERT(PathUtil::getDirectory("a/b") == "a");
    ASSERT(PathUtil::getDirectory("a") == "");

    ASSERT(PathUtil::getBase("/a/b/c") == "c");
    ASSERT(PathUtil::getBase("/a/b/") == "b");
    ASSERT(PathUtil::getBase("b/") == "b");
    ASSERT(PathUtil::getBase("c") == "c");
}

void testFileOperations(const std::string &top)
{
    const char *content = "this is just a test";
    createFile(top.c_str(), "test_file1", content);

    std::string path = PathUtil::join(top.c_str(), "test_file1");
    ASSERT(PathUtil::exists(path.c_str()));
    ASSERT(PathUtil::isRegularFile(path.c_str()));
    ASSERT(!PathUtil::isDirectory(path.c_str()));
    ASSERT(PathUtil::getSize(path.c_str()) == static_cast<int64_t>(::strlen(content)));
    ASSERT(PathUtil::getAbsolutePath(path.c_str()) ==
           PathUtil::join(PathUtil::getAbsolutePath(top.c_str()).c_str(), "test_file1"));

    char buffer[256];
    File f(path.c_str());
    ASSERT(f.isValid());
    ASSERT(f.read(buffer, 4) == 4);
    ASSERT(::strncmp(buffer, "this", 4) == 0);
    ASSERT(f.read(buffer, sizeof(buffer)) == static_cast<int>(::strlen(content)) - 4);
    ASSERT(f.read(buffer, sizeof(buffer)) == 0);
    f.close();
    ASSERT(!f.isValid());

    File missing;
    ASSERT(!missing.open(PathUtil::join(top.c_str(), "no_such_file").c_str(), false, false));
    ASSERT(PathUtil::getAbsolutePath(PathUtil::join(top.c_str(), "no_such_file").c_str()).empty());
}

void testListDirectory(const std::string &top)
{
    createFile(top.c_str(), "test_file2", "this is another test");

    // Call these two 'file' but they are acutally directories to verify the sorting result.
    ASSERT(PathUtil::createDirectory(PathUtil::join(top.c_str(), "test_file4").c_str()));
    ASSERT(PathUtil::createDirectory(PathUtil::join(top.c_str(), "test_file3").c_str()));
    createFile(top.c_str(), "test_file3/inner", "inner");

    std::vector<Entry*> files, directories;
    Util::EntryListReleaser filesReleaser(&files);
    Util::EntryListReleaser directoriesReleaser(&directories);

    PathUtil::listDirectory(top.c_str(), "", &files, &directories);

    ASSERT(files.size() == 2);
    ASSERT(::strcmp(files[0]->getPath(), "test_file1") == 0);
    ASSERT(::strcmp(files[1]->getPath(), "test_file2") == 0);
    ASSERT(files[0]->isRegular());
    ASSERT(files[1]->getSize() == 20);

    ASSERT(directories.size() == 2);
    ASSERT(::strcmp(directories[0]->getPath(), "test_file3/") == 0);
    ASSERT(::strcmp(directories[1]->getPath(), "test_file4/") == 0);
    ASSERT(directories[0]->isDirectory());

    // Paths of nested entries stay relative to the top.
    PathUtil::listDirectory(top.c_str(), directories[0]->getPath(), &files, 0);
    ASSERT(files.size() == 3);
    ASSERT(::strcmp(files[2]->getPath(), "test_file3/inner") == 0);
}

int main(int argc, char *argv[])
{
    TESTUTIL_INIT_RAND;

    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_pathutil_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));
    ASSERT(PathUtil::isDirectory(top.c_str()));

    testPathComponents();
    testFileOperations(top);
    testListDirectory(top);

    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(!PathUtil::exists(top.c_str()));

    TESTUTIL_RETURN
}
