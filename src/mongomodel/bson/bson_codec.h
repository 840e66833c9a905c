// bson_codec.h


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

namespace mongomodel {

    /** documents nested deeper than this are refused in both directions */
    const int BSONMaxDepth = 100;

    /**
       the wire form of d, little endian as bsonspec.org describes it.
       arrays are written as documents keyed "0", "1", ...
       massert()s on a live model reference, those must be serialized first.
     */
    string toBSON( const Document& d );

    /**
       parses one document from data.
       timestamps come back as NumberLong, symbols and code as String, undefined as null.
       uasserts on truncated or malformed input and on types with no Value form
       ( decimal128, min / max key, db pointers ).
       @param len bytes available at data, the document may be shorter
       @param consumed if not null, set to the length of the document read
     */
    Document fromBSON( const char *data , int len , int *consumed = 0 );

}
