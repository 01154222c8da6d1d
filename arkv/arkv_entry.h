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

#ifndef INCLUDED_ARKV_ENTRY_H
#define INCLUDED_ARKV_ENTRY_H

#include <string>

#include <stdint.h>

#include <sys/stat.h>

namespace arkv
{

// One item found while listing a local directory.
class Entry
{
public:

    // Constants for file mode
    enum {
        IS_FILE = 0100000,       /* S_IFREG */
        IS_DIR = 0040000,        /* S_IFDIR */
        IS_LINK = 0020000,       /* S_IFLNK when combined with IS_FILE */
        TYPE_MASK = 0170000      /* S_IFMT */
    };

    // Compare two entries according to their paths, assuming that they are under the same directory.
    static bool compareLocally(const Entry*, const Entry*);

    // If the entry is a directory, make sure it has the trailing '/'.
    void normalizePath();

    // Create a new entry
    Entry(const char *path, bool isDirectory, int64_t size, uint32_t mode)
        : d_path(path)
        , d_size(size)
        , d_mode(mode)
    {
        if (isDirectory) {
            d_size = 0;
            d_mode = (d_mode & ~TYPE_MASK) | IS_DIR;
        }
    }

    const char *getPath() const
    {
        return d_path.c_str();
    }

    bool isDirectory() const
    {
        return (d_mode & TYPE_MASK) == IS_DIR;
    }

    bool isLink() const
    {
        return (d_mode & TYPE_MASK) == (IS_LINK | IS_FILE);
    }

    bool isRegular() const
    {
        return (d_mode & TYPE_MASK) == IS_FILE;
    }

    int64_t getSize() const
    {
        return d_size;
    }

private:
    // NOT IMPLEMENTED
    Entry(const Entry&);
    Entry& operator=(const Entry&);

    std::string d_path;                  // path of the entry relative to the top directory
    int64_t d_size;                      // file size; 0 for a directory
    uint32_t d_mode;                     // file mode as returned by lstat()
};

} // namespace arkv
#endif //INCLUDED_ARKV_ENTRY_H
