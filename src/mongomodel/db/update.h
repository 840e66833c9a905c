// update.h

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

    /* Used for modifiers such as $inc, $set, ... */
    struct Mod {
        enum Op { INC, SET, UNSET } op;

        static const char* modNames[];
        static unsigned modNamesNum;

        static Op opFromStr( const string& s );

        string fieldName;
        Value elt; // x:5 note: this is the actual value from the update object

        void apply( Document& doc ) const;
    };

    /**
       the parsed modifier part of an update, e.g. { $set : { a : 1 } , $inc : { n : 2 } }
     */
    class ModSet {
    public:
        ModSet( const Document& updateDoc );

        /** @return a copy of in with every mod applied in declaration order */
        Document apply( const Document& in ) const;

        /**
           the document an upsert inserts: the plain equality fields of the query
           with the mods applied on top.
         */
        Document createNewFromQuery( const Document& query ) const;

        /** true if this mod touches fieldName or something below / above it */
        bool haveModForField( const string& fieldName ) const;

        unsigned size() const { return _mods.size(); }

        string toString() const;

    private:
        vector<Mod> _mods;
    };

    /** @return true if the update document is made of $modifiers, false for a replacement */
    bool isModifierUpdate( const Document& update );

    /** sets a dotted path, creating intermediate embedded documents as needed */
    void setDotted( Document& doc , const string& path , const Value& v );

    /** @return true if something was removed */
    bool unsetDotted( Document& doc , const string& path );

}
