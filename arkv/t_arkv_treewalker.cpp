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

#include <arkv/arkv_treewalker.h>

#include <arkv/arkv_file.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>

#include <testutil/testutil_assert.h>

#include <set>
#include <string>
#include <vector>

#include <cstring>

#include <unistd.h>

using namespace arkv;

void createFile(const char *top, const char *name, const char *content)
{
    File f(PathUtil::join(top, name).c_str(), true);
    ASSERT(f.isValid());
    ASSERT(f.write(content, ::strlen(content)) == static_cast<int>(::strlen(content)));
}

std::set<std::string> getRemotePaths(const std::vector<Task> &tasks)
{
    std::set<std::string> paths;
    for (size_t i = 0; i < tasks.size(); ++i) {
        paths.insert(tasks[i].d_remotePath);
    }
    return paths;
}

void testSingleFile(const std::string &top)
{
    createFile(top.c_str(), "f", "x");

    std::vector<Task> tasks;
    ASSERT(!TreeWalker::enumerate(PathUtil::join(top.c_str(), "f").c_str(), "/r", &tasks));
    ASSERT(tasks.size() == 1);
    ASSERT(tasks[0].d_remotePath == "/r/f");
    ASSERT(tasks[0].d_relativePath == "f");
    ASSERT(PathUtil::isRegularFile(tasks[0].d_localPath.c_str()));
}

void testDirectory(const std::string &top)
{
    std::string d = PathUtil::join(top.c_str(), "d");
    ASSERT(PathUtil::createDirectory(d.c_str()));
    ASSERT(PathUtil::createDirectory(PathUtil::join(d.c_str(), "sub").c_str()));
    ASSERT(PathUtil::createDirectory(PathUtil::join(d.c_str(), "empty").c_str()));
    createFile(d.c_str(), "b", "bb");
    createFile(d.c_str(), "a", "aaa");
    createFile(d.c_str(), "sub/c", "c");

    // Symbolic links are never followed or uploaded.
    ASSERT(::symlink(PathUtil::join(d.c_str(), "a").c_str(), PathUtil::join(d.c_str(), "link").c_str()) == 0);
    ASSERT(::symlink(PathUtil::join(d.c_str(), "sub").c_str(), PathUtil::join(d.c_str(), "dirlink").c_str()) == 0);

    std::vector<Task> tasks;
    ASSERT(TreeWalker::enumerate(d.c_str(), "/r", &tasks));
    ASSERT(tasks.size() == 3);

    std::set<std::string> paths = getRemotePaths(tasks);
    ASSERT(paths.count("/r/d/a"));
    ASSERT(paths.count("/r/d/b"));
    ASSERT(paths.count("/r/d/sub/c"));

    // Files within a directory are listed in order of names.
    ASSERT(tasks[0].d_relativePath == "a");
    ASSERT(tasks[1].d_relativePath == "b");
    ASSERT(tasks[2].d_relativePath == "sub/c");
    ASSERT(tasks[2].d_localPath == PathUtil::join(PathUtil::getAbsolutePath(d.c_str()).c_str(), "sub/c"));

    // The same tree always gives the same set of tasks.
    std::vector<Task> again;
    ASSERT(TreeWalker::enumerate((d + "/").c_str(), "/r", &again));
    ASSERT(getRemotePaths(again) == paths);

    // A relative remote base stays relative.
    std::vector<Task> relative;
    TreeWalker::enumerate(d.c_str(), "uploads", &relative);
    ASSERT(getRemotePaths(relative).count("uploads/d/sub/c"));
}

void testMissingRoot(const std::string &top)
{
    std::vector<Task> tasks;
    bool thrown = false;
    try {
        TreeWalker::enumerate(PathUtil::join(top.c_str(), "no_such_dir").c_str(), "/r", &tasks);
    } catch (Exception &e) {
        thrown = true;
        ASSERT(e.getError() == Error::Path);
    }
    ASSERT(thrown);
    ASSERT(tasks.empty());
}

int main(int argc, char *argv[])
{
    std::string top = PathUtil::join(PathUtil::getCurrentDirectory().c_str(), "t_arkv_treewalker_dir");
    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    testSingleFile(top);
    testDirectory(top);
    testMissingRoot(top);

    PathUtil::removeDirectoryRecursively(top.c_str());

    TESTUTIL_RETURN
}
