// @file timer.h

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

#include "mongomodel/util/time_support.h"

namespace mongomodel {

    /** wall clock elapsed since construction, used to time logged store calls */
    class Timer {
    public:
        Timer() : _start( curTimeMicros64() ) { }
        int millis() const { return (int)( ( curTimeMicros64() - _start ) / 1000 ); }
    private:
        unsigned long long _start;
    };

}  // namespace mongomodel
