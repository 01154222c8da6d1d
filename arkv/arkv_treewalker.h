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

#ifndef INCLUDED_ARKV_TREEWALKER_H
#define INCLUDED_ARKV_TREEWALKER_H

#include <string>
#include <vector>

namespace arkv
{

// One file to upload.
struct Task
{
    std::string d_localPath;       // absolute local path
    std::string d_relativePath;    // path relative to the upload root; the file name for a single-file upload
    std::string d_remotePath;      // absolute remote path of the copy
};

struct TreeWalker
{
    // List the files to upload from 'root' into 'tasks'.  If 'root' is a file, the only task uploads it to
    // 'remoteBase/<file name>'.  If 'root' is a directory, every regular file under it is uploaded to
    // 'remoteBase/<root name>/<relative path>'; symbolic links and special files are skipped.  Files within a
    // directory are listed in order of names.  Return true if 'root' is a directory.  Throws a 'Path' error if
    // 'root' doesn't exist.
    static bool enumerate(const char *root, const char *remoteBase, std::vector<Task> *tasks);
};

} // namespace arkv

#endif // INCLUDED_ARKV_TREEWALKER_H
