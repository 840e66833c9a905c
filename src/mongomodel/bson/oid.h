// oid.h

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

#include "mongomodel/util/hex.h"

namespace mongomodel {

    /** Object ID type.
        Documents typically have an _id field for the object id.  This is a 12 byte id which
        is likely to be unique to the system: 4 bytes of time, 3 bytes of machine, 2 bytes
        of process id and a 3 byte counter, most significant byte first so that memcmp()
        orders ids by creation time.
    */
    class OID {
        unsigned char data[12];
    public:
        OID() { clear(); }

        /** @param s 24 hex digits, see isValid() */
        explicit OID( const string& s ) { init( s ); }

        /** initialize to 'null' */
        void clear() { memset( data , 0 , 12 ); }


        bool operator==(const OID& r) const {
            return compare( r ) == 0;
        }
        bool operator!=(const OID& r) const {
            return compare( r ) != 0;
        }

        /** The object ID output as 24 hex digits. */
        string str() const {
            return toHexLower(data, 12);
        }

        string toString() const { return str(); }

        /** the 12 raw bytes, as stored on the wire */
        const unsigned char *getData() const { return data; }

        static OID gen() { OID o; o.init(); return o; }

        /** @return true if s is 24 hex digits, the only string form an OID may take */
        static bool isValid( const string& s );

        /** sets the contents to a new oid / randomized value */
        void init();

        /** Set to the hex string value specified.  massert()s if ! isValid( s ) */
        void init( const string& s );

        bool isSet() const {
            for ( int i = 0; i < 12; i++ )
                if ( data[i] )
                    return true;
            return false;
        }

        int compare( const OID& other ) const { return memcmp( data , other.data , 12 ); }

        bool operator<( const OID& other ) const { return compare( other ) < 0; }
    };

    inline ostream& operator<<( ostream &s, const OID &o ) {
        s << o.str();
        return s;
    }

}
