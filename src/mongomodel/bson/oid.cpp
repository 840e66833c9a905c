// @file oid.cpp

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
#include "mongomodel/bson/oid.h"

#include <unistd.h>

#include "mongomodel/util/time_support.h"

namespace mongomodel {

    namespace {

        mongomodel::mutex oidMutex;

        /* machine (3 bytes) and pid (2 bytes), fixed for the life of the process */
        struct MachineAndPid {
            unsigned char bytes[5];

            MachineAndPid() {
                unsigned long long seed = curTimeMicros64() ^ ( (unsigned long long) getpid() << 16 );
                srand( (unsigned) seed );
                bytes[0] = (unsigned char) rand();
                bytes[1] = (unsigned char) rand();
                bytes[2] = (unsigned char) rand();
                unsigned short pid = (unsigned short) getpid();
                bytes[3] = (unsigned char) ( pid >> 8 );
                bytes[4] = (unsigned char) pid;
            }
        };

        const MachineAndPid& ourMachineAndPid() {
            static MachineAndPid x;
            return x;
        }

        unsigned nextInc() {
            static unsigned inc = (unsigned) ( curTimeMicros64() & 0xffffff );
            scoped_lock lk( oidMutex );
            return inc++;
        }
    }

    bool OID::isValid( const string& s ) {
        if ( s.size() != 24 )
            return false;
        for ( unsigned i = 0; i < s.size(); i++ ) {
            if ( ! isHexDigit( s[i] ) )
                return false;
        }
        return true;
    }

    void OID::init() {
        unsigned t = (unsigned) time(0);
        // big endian order because we use memcmp() to compare OID's
        data[0] = (unsigned char) ( t >> 24 );
        data[1] = (unsigned char) ( t >> 16 );
        data[2] = (unsigned char) ( t >> 8 );
        data[3] = (unsigned char) t;

        memcpy( data + 4 , ourMachineAndPid().bytes , 5 );

        unsigned inc = nextInc();
        data[9] = (unsigned char) ( inc >> 16 );
        data[10] = (unsigned char) ( inc >> 8 );
        data[11] = (unsigned char) inc;
    }

    void OID::init( const string& s ) {
        massert( 16020 , string( "invalid object id: " ) + s , isValid( s ) );
        const char *p = s.c_str();
        for( int i = 0; i < 12; i++ ) {
            data[i] = (unsigned char) fromHex(p);
            p += 2;
        }
    }

}
