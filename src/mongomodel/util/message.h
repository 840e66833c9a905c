// message.h


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

#include "mongomodel/bson/document.h"
#include "mongomodel/util/sock.h"

namespace mongomodel {

    /* we use this for message framing in the wire protocol */
    enum Operations {
        opMsg = 2013     /* command and reply, body in a kind 0 section */
    };

    const int MaxMessageSizeBytes = 48 * 1000 * 1000;

    /** the fixed 16 bytes in front of every message, little endian on the wire */
    struct MsgHeader {
        MsgHeader() : len( 0 ) , id( 0 ) , responseTo( 0 ) , opCode( 0 ) { }
        int len; /* len of the msg, including this field */
        int id; /* request/reply id's match... */
        int responseTo; /* id of the message we are responding to */
        int opCode;
    };

    /** a fresh, process wide request id */
    int nextMessageId();

    /**
       OP_MSG with body as its one kind 0 section.
       @param responseTo the request answered, 0 for a request
       @return the id of the message sent
     */
    int sayOpMsg( Socket& s , const Document& body , int responseTo = 0 );

    /**
       reads one OP_MSG.
       @param header if not null, gets the header read
       @return its kind 0 section; other sections and the checksum are skipped
       uasserts on anything that isn't a well formed OP_MSG
     */
    Document recvOpMsg( Socket& s , MsgHeader* header = 0 );

}
