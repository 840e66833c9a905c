// bsontypes.h

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

namespace mongomodel {

    /**
        the complete list of valid value types.
        the numeric values follow the BSON spec so that a wire codec can map them directly.
    */
    enum BSONType {
        /** end of object, also used for "no such field" */
        EOO=0,
        /** double precision floating point value */
        NumberDouble=1,
        /** character string, stored in utf8 */
        String=2,
        /** an embedded object */
        Object=3,
        /** an embedded array */
        Array=4,
        /** binary data */
        BinData=5,
        /** ObjectId */
        jstOID=7,
        /** boolean type */
        Bool=8,
        /** date type, milliseconds since the epoch */
        Date=9,
        /** null type */
        jstNULL=10,
        /** regular expression, a pattern and an options string */
        RegEx=11,
        /** 32 bit signed integer */
        NumberInt = 16,
        /** 64 bit integer */
        NumberLong = 18,
        /** a reference to a live model instance.  never stored, the serializer must replace it. */
        ModelRef = 100
    };

    const char * typeName( BSONType type );

    /** @return position of the type in the cross-type sort order. */
    inline int canonicalizeBSONType(BSONType type) {
        switch (type) {
        case EOO:
            return -1;
        case jstNULL:
            return 5;
        case NumberDouble:
        case NumberInt:
        case NumberLong:
            return 10;
        case String:
            return 15;
        case Object:
            return 20;
        case Array:
            return 25;
        case BinData:
            return 30;
        case jstOID:
            return 35;
        case Bool:
            return 40;
        case Date:
            return 45;
        case RegEx:
            return 50;
        case ModelRef:
            return 60;
        default:
            verify(0);
            return -1;
        }
    }

}
