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

#ifndef INCLUDED_ARKV_PATHUTIL_H
#define INCLUDED_ARKV_PATHUTIL_H

#include <stdint.h>

#include <string>
#include <vector>

namespace arkv
{

class Entry;

struct PathUtil
{
    // Return the file size
    static int64_t getSize(const char *fullPath);

    // Common file/dir operations.  These follow symbolic links.
    static bool exists(const char *fullPath);
    static bool isDirectory(const char *fullPath);
    static bool isRegularFile(const char *fullPath);
    static bool createDirectory(const char *fullPath);
    static bool remove(const char *fullPath);

    // Return the absolute, canonical form of 'path', or an empty string if it can't be resolved.
    static std::string getAbsolutePath(const char *path);

    // Concatenate two paths.
    static std::string join(const char *top, const char *path);

    // Return the directory part of the path
    static std::string getDirectory(const char *fullPath);

    // Return the last component.
    static std::string getBase(const char *fullPath);

    // List the directory joined by 'top' and 'path'; add file entries (including symbolic links and special files)
    // to 'fileList', and directory entries to 'directoryList'.  Entry paths are relative to 'top'; directory
    // entries end with '/'.  Files come in ascending order of names.
    static void listDirectory(const char *top, const char *path, std::vector<Entry*> *fileList,
                              std::vector<Entry*> *directoryList);

    // Return current working directory
    static std::string getCurrentDirectory();

    // Remove a directory and all its contents, recursively
    static void removeDirectoryRecursively(const char *fullPath);
};

} // close namespace arkv

#endif // INCLUDED_ARKV_PATHUTIL_H
