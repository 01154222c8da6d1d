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

#ifndef INCLUDED_ARKV_UTIL_H
#define INCLUDED_ARKV_UTIL_H

#include <arkv/arkv_entry.h>

#include <string>
#include <vector>

namespace arkv
{

struct Util
{
    // A helpfer class for deleting entries in an entry list.
    class EntryListReleaser
    {
    public:
        EntryListReleaser(std::vector<Entry*> *entryList):
            d_entryList(entryList)
        {
        }

        ~EntryListReleaser()
        {
            for (unsigned int i = 0; i < d_entryList->size(); ++i) {
                delete (*d_entryList)[i];
            }
        }
    private:
        // NOT IMPLEMENTED
        EntryListReleaser(const EntryListReleaser&);
        EntryListReleaser& operator=(const EntryListReleaser&);

        std::vector<Entry*> *d_entryList;
    };

    // For proper intialization and shutdown of dependency libraries.  'startup()' must be called from the main
    // thread before any transfer thread is started.
    static bool startup();
    static void cleanup();

    // Return the last error in a readable format.
    static std::string getLastError();
};

}

#endif //INCLUDED_ARKV_UTIL_H
