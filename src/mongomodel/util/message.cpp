// message.cpp


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
#include "mongomodel/util/message.h"

#include "mongomodel/bson/bson_codec.h"

namespace mongomodel {

    namespace {
        const unsigned checksumPresent = 1 << 0;
        const unsigned moreToCome = 1 << 1;

        void putInt( char *p , int x ) {
            unsigned u = (unsigned) x;
            for ( int i = 0; i < 4; i++ )
                p[i] = (char)( ( u >> ( 8 * i ) ) & 0xff );
        }

        int getInt( const char *p ) {
            unsigned u = 0;
            for ( int i = 0; i < 4; i++ )
                u |= ( (unsigned)(unsigned char) p[i] ) << ( 8 * i );
            return (int) u;
        }

        mongomodel::mutex idMutex;
        int lastId = 0;
    }

    int nextMessageId() {
        scoped_lock lk( idMutex );
        if ( ++lastId <= 0 )
            lastId = 1;
        return lastId;
    }

    int sayOpMsg( Socket& s , const Document& body , int responseTo ) {
        string bson = toBSON( body );

        MsgHeader h;
        h.len = 16 + 4 + 1 + (int) bson.size();
        h.id = nextMessageId();
        h.responseTo = responseTo;
        h.opCode = opMsg;
        uassert( 16226 , "message too large" , h.len <= MaxMessageSizeBytes );

        string buf( 21 , '\0' );
        putInt( &buf[0] , h.len );
        putInt( &buf[4] , h.id );
        putInt( &buf[8] , h.responseTo );
        putInt( &buf[12] , h.opCode );
        putInt( &buf[16] , 0 ); // flagBits
        buf[20] = 0; // section kind 0
        buf += bson;

        s.send( buf.data() , (int) buf.size() , "say" );
        return h.id;
    }

    Document recvOpMsg( Socket& s , MsgHeader* header ) {
        char head[16];
        s.recv( head , 16 );

        MsgHeader h;
        h.len = getInt( head );
        h.id = getInt( head + 4 );
        h.responseTo = getInt( head + 8 );
        h.opCode = getInt( head + 12 );

        uassert( 16227 , "bad message length" , h.len >= 16 + 4 + 1 && h.len <= MaxMessageSizeBytes );
        uassert( 16228 , "message is not an OP_MSG" , h.opCode == opMsg );
        if ( header )
            *header = h;

        string body( h.len - 16 , '\0' );
        s.recv( &body[0] , (int) body.size() );

        unsigned flags = (unsigned) getInt( body.data() );
        uassert( 16230 , "exhaust replies are not supported" , ! ( flags & moreToCome ) );

        int end = (int) body.size();
        if ( flags & checksumPresent )
            end -= 4;

        Document reply;
        bool found = false;
        int pos = 4;
        while ( pos < end ) {
            char kind = body[pos++];
            if ( kind == 0 ) {
                int used = 0;
                reply = fromBSON( body.data() + pos , end - pos , &used );
                pos += used;
                found = true;
            }
            else {
                uassert( 16231 , "unknown OP_MSG section kind" , kind == 1 );
                uassert( 16218 , "truncated BSON" , end - pos >= 4 );
                int size = getInt( body.data() + pos );
                uassert( 16232 , "bad OP_MSG section size" , size >= 4 && size <= end - pos );
                pos += size;
            }
        }
        uassert( 16233 , "OP_MSG without a body" , found );
        return reply;
    }

}
