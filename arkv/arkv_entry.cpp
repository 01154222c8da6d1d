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

#include <arkv/arkv_entry.h>

namespace arkv
{

bool Entry::compareLocally(const Entry* lhs, const Entry* rhs)
{
    // Directories are always arranged before files.  If both are of the same kind, compare them
    // as strings.
    if (lhs->isDirectory()) {
        if (rhs->isDirectory()) {
            return lhs->d_path < rhs->d_path;
        } else {
            return true;
        }
    } else {
        if (rhs->isDirectory()) {
            return false;
        } else {
            return lhs->d_path < rhs->d_path;
        }
    }
}

void Entry::normalizePath()
{
    if (isDirectory() && (d_path.empty() || d_path[d_path.size() - 1] != '/')) {
        d_path += "/";
    }
}

} // namespace arkv
