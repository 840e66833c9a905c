// @file time_support.h

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

#pragma once

#include <ctime>
#include <sys/time.h>

namespace mongomodel {

    /** utc timestamp for log lines, ISO 8601 without the trailing Z */
    inline string terseCurrentTime() {
        time_t now = time(0);
        struct tm t;
        gmtime_r( &now , &t );
        char buf[32];
        if ( strftime( buf , sizeof(buf) , "%Y-%m-%dT%H:%M:%S" , &t ) == 0 )
            return "";
        return buf;
    }

    inline unsigned long long curTimeMicros64() {
        timeval tv;
        gettimeofday(&tv, NULL);
        return (((unsigned long long) tv.tv_sec) * 1000*1000) + tv.tv_usec;
    }

    /** current time in milliseconds since the epoch, the unit of Date values */
    inline Date_t jsTime() {
        return (Date_t) (curTimeMicros64() / 1000);
    }

} // namespace mongomodel
