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
#include <arkv/arkv_log.h>
#include <arkv/arkv_util.h>

#include <algorithm>

#include <cstdlib>
#include <cstring>

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <limits.h>
#include <unistd.h>
#include <errno.h>

namespace arkv
{

std::string PathUtil::join(const char *top, const char *path)
{
    std::string fullPath = top;
    size_t length = fullPath.size();
    if (length && fullPath[length - 1] != '/') {
        fullPath += "/";
    }
    fullPath += path;
    return fullPath;
}

std::string PathUtil::getDirectory(const char *fullPath)
{
    const char *pos = strrchr(fullPath, '/');
    if (pos == fullPath) {
        // The parent of '/x' is the root itself.
        return std::string("/");
    } else if (pos) {
        return std::string(fullPath, pos - fullPath);
    } else {
        return std::string("");
    }
}

std::string PathUtil::getBase(const char *fullPath)
{
    const char *pos = strrchr(fullPath, '/');
    if (pos) {
        if (*(pos + 1) == 0) {
            const char *end = pos;
            --pos;
            if (pos < fullPath) {
                return std::string();
            }
            while (pos > fullPath && *pos != '/') {
                --pos;
            }
            if (*pos == '/') {
                return std::string(pos + 1, end - pos - 1);
            } else {
                return std::string(pos, end - pos);
            }
            
        }
        return std::string(pos + 1);
    } else {
        return std::string(fullPath);
    }
}

int64_t PathUtil::getSize(const char *fullPath)
{
    struct stat buf;
    if (stat(fullPath, &buf) == 0) {
        return buf.st_size;
    } else {
        return 0;
    }
}

bool PathUtil::exists(const char *fullPath)
{
    struct stat buf;
    return stat(fullPath, &buf) == 0;
}

bool PathUtil::isDirectory(const char *fullPath)
{
    struct stat buf;
    if (stat(fullPath, &buf) != 0){
        return false;
    }
    return S_ISDIR(buf.st_mode);
}

bool PathUtil::isRegularFile(const char *fullPath)
{
    struct stat buf;
    if (stat(fullPath, &buf) != 0){
        return false;
    }
    return S_ISREG(buf.st_mode);
}

bool PathUtil::createDirectory(const char *fullPath)
{
    return mkdir(fullPath, 0755) == 0;
}

bool PathUtil::remove(const char *fullPath)
{
    return ::remove(fullPath) == 0;
}

std::string PathUtil::getAbsolutePath(const char *path)
{
    char buffer[PATH_MAX];
    if (::realpath(path, buffer) == 0) {
        return std::string();
    }
    return buffer;
}

void PathUtil::listDirectory(const char *top, const char *path, std::vector<Entry*> *fileList,
                             std::vector<Entry*> *directoryList)
{
    DIR *dir;
    struct dirent *dirEntry;
    struct stat buf;

    size_t topLength = ::strlen(top);
    std::string currentPath(top);
    if (topLength == 0 || top[topLength - 1] != '/') {
        currentPath += "/";
        ++topLength;
    }
    if (*path != 0 && ::strcmp(path, "./") != 0) {
        currentPath += path;
    }
 
    std::vector<Entry*> currentList;

    if ((dir = opendir(currentPath.c_str())) == NULL) {
        LOG_WARNING(PATH_LISTDIR) << "Failed to list '" << currentPath << "': " << Util::getLastError() << LOG_END
        return;
    }

    while ((dirEntry = readdir(dir)) != NULL) {
        if (dirEntry->d_name[0] == '.') {
            if (dirEntry->d_name[1] == 0 || (dirEntry->d_name[1] == '.' && dirEntry->d_name[2] == 0)) {
                continue;
            }
        }

        std::string file = currentPath + dirEntry->d_name;

        if (lstat(file.c_str(), &buf) != 0) {
            LOG_WARNING(PATH_LSTAT) << "Skip '" << file << "': " << Util::getLastError() << LOG_END
            continue;
        }

        Entry *entry = new Entry(file.c_str() + topLength, S_ISDIR(buf.st_mode), buf.st_size, buf.st_mode);
        entry->normalizePath();
        currentList.push_back(entry);
    }

    closedir(dir);

    std::sort(currentList.begin(), currentList.end(), Entry::compareLocally);

    for (size_t i = 0; i < currentList.size(); ++i) {
        if (!currentList[i]->isDirectory()) {
            fileList->push_back(currentList[i]);
        } else if (directoryList) {
            directoryList->push_back(currentList[i]);
        } else {
            delete currentList[i];
        }
    }
}

std::string PathUtil::getCurrentDirectory()
{
    char buffer[PATH_MAX];
    if (getcwd(buffer, sizeof(buffer)) == buffer) {
        return buffer;
    } else {
        return "";
    }
}

void PathUtil::removeDirectoryRecursively(const char *fullPath)
{
    std::vector<Entry*> files;
    std::vector<Entry*> directories;
    Util::EntryListReleaser filesReleaser(&files);
    Util::EntryListReleaser directoriesReleaser(&directories);

    if (!isDirectory(fullPath)) {
        return;
    }

    listDirectory(fullPath, "", &files, &directories);
    for (size_t i = 0; i < files.size(); ++i) {
        remove(join(fullPath, files[i]->getPath()).c_str());
    }

    for (size_t i = 0; i < directories.size(); ++i) {
        std::string path = join(fullPath, directories[i]->getPath());
        removeDirectoryRecursively(path.substr(0, path.size() - 1).c_str());
    }

    ::rmdir(fullPath);
}

} // close namespace arkv
