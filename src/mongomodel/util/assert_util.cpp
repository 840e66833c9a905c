// assert_util.cpp

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

#include "mongomodel/pch.h"

#include <cxxabi.h>

namespace mongomodel {

    void asserted(const char *msg, const char *file, unsigned line) {
        problem() << "Assertion failure " << msg << ' ' << file << ' ' << dec << line << endl;
        stringstream temp;
        temp << "assertion " << file << ":" << line;
        throw AssertionException(temp.str(),0);
    }

    void logUserAssertion( int code , const char *msg ) {
        LOG(1) << "User Assertion: " << code << ":" << msg << endl;
    }

    void uasserted(int msgid, const char *msg) {
        logUserAssertion( msgid , msg );
        throw UserException(msgid, msg);
    }

    void msgasserted(int msgid, const char *msg) {
        log() << "Assertion: " << msgid << ":" << msg << endl;
        throw MsgAssertionException(msgid, msg);
    }

    string demangleName( const type_info& typeinfo ) {
        int status;

        char * niceName = abi::__cxa_demangle(typeinfo.name(), 0, 0, &status);
        if ( ! niceName )
            return typeinfo.name();

        string s = niceName;
        free(niceName);
        return s;
    }

} // namespace mongomodel
