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

#ifndef INCLUDED_ARKV_TIMEUTIL_H
#define INCLUDED_ARKV_TIMEUTIL_H

namespace arkv
{

struct TimeUtil
{
    // Return the time in seconds elapsed since an arbitrary fixed point.  Never goes backwards, so the difference of
    // two values measures a duration even if the wall clock is adjusted in between.
    static double getMonotonicTime();
};

} // namespace arkv
#endif //INCLUDED_ARKV_TIMEUTIL_H
