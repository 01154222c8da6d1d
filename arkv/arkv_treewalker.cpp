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

#include <arkv/arkv_entry.h>
#include <arkv/arkv_log.h>
#include <arkv/arkv_pathutil.h>
#include <arkv/arkv_util.h>

namespace arkv
{

bool TreeWalker::enumerate(const char *root, const char *remoteBase, std::vector<Task> *tasks)
{
    std::string top = PathUtil::getAbsolutePath(root);
    if (top.empty() || !PathUtil::exists(top.c_str())) {
        LOG_FAIL(PATH_NOT_FOUND, Path) << "Path does not exist: " << root << LOG_END
    }

    // Use the name the root was given by, unless it is a relative reference like '.' or '..'.
    std::string base = PathUtil::getBase(root);
    if (base.empty() || base == "." || base == "..") {
        base = PathUtil::getBase(top.c_str());
    }

    if (!PathUtil::isDirectory(top.c_str())) {
        Task task;
        task.d_localPath = top;
        task.d_relativePath = base;
        task.d_remotePath = PathUtil::join(remoteBase, base.c_str());
        tasks->push_back(task);
        return false;
    }

    // The root directory keeps its own name one level down on the remote side.
    std::string remoteTop = PathUtil::join(remoteBase, base.c_str());

    std::vector<Entry*> files, directories, visited;
    Util::EntryListReleaser filesReleaser(&files);
    Util::EntryListReleaser directoriesReleaser(&directories);
    Util::EntryListReleaser visitedReleaser(&visited);

    PathUtil::listDirectory(top.c_str(), "", &files, &directories);

    while (directories.size()) {
        Entry *entry = directories.back();
        directories.pop_back();
        visited.push_back(entry);
        PathUtil::listDirectory(top.c_str(), entry->getPath(), &files, &directories);
    }

    for (size_t i = 0; i < files.size(); ++i) {
        if (!files[i]->isRegular()) {
            LOG_DEBUG(TREEWALKER_SKIP) << "Skip '" << files[i]->getPath() << "' as it is "
                                       << (files[i]->isLink() ? "a symbolic link" : "not a regular file") << LOG_END
            continue;
        }
        Task task;
        task.d_relativePath = files[i]->getPath();
        task.d_localPath = PathUtil::join(top.c_str(), task.d_relativePath.c_str());
        task.d_remotePath = PathUtil::join(remoteTop.c_str(), task.d_relativePath.c_str());
        tasks->push_back(task);
    }
    return true;
}

} // namespace arkv
