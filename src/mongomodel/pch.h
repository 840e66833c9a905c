// pch.h : include file for standard system include files,
// or project specific include files that are used frequently, but
// are changed infrequently

/*    Copyright 2009 10gen Inc.
 *
 *    Licensed under the Apache License, Version 2.0 (the "License");
 *    you may not use this file except in compliance with the License.
 *    You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 *    Unless required by applicable law or agreed to in writing, software
 *    distributed under the License is distributed on an "AS IS" BASIS,
 *    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *    See the License for the specific language governing permissions and
 *    limitations under the License.
 */

#ifndef MONGOMODEL_PCH_H
#define MONGOMODEL_PCH_H

#include <ctime>
#include <sstream>
#include <string>
#include <memory>
#include <iostream>
#include <fstream>
#include <map>
#include <vector>
#include <set>
#include <list>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <limits.h>
#include <errno.h>

#include <boost/shared_ptr.hpp>
#include <boost/smart_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/function.hpp>
#include <boost/bind.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

namespace mongomodel {

    using namespace std;
    using boost::shared_ptr;

#if defined(_DEBUG)
    const bool debug=true;
#else
    const bool debug=false;
#endif

    enum ExitCode {
        EXIT_CLEAN = 0 ,
        EXIT_BADOPTIONS = 2 ,
        EXIT_CONNECT_ERROR = 3 ,
        EXIT_SYNC_FAILED = 4 ,
        EXIT_UNCAUGHT = 100 , // top level exception that wasn't caught
        EXIT_TEST = 101
    };

    typedef boost::mutex mutex;
    typedef boost::mutex::scoped_lock scoped_lock;

    /** milliseconds since the epoch */
    typedef long long Date_t;

} // namespace mongomodel

#include "mongomodel/util/log.h"
#include "mongomodel/util/assert_util.h"

#endif // MONGOMODEL_PCH_H
