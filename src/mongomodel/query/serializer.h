// serializer.h

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

#include "mongomodel/model/lazy_reference.h"
#include "mongomodel/query/query_translator.h"

namespace mongomodel {

    /**
       ModelInstance <-> stored document.

       model instances nested in list, dict and raw values are stored as
         { _type : "ref" , _model : <name> , pk : <id> }
       when automatic referencing is on, and refused otherwise.  on the way back
       such documents become LazyModelInstances.
     */
    class Serializer {
    public:
        Serializer( const ModelDescriptor& d , bool automaticReferencing , const string& alias = "default" );

        /**
           every field except GridFS fields, the primary key as _id when there
           is one.  null values are left out.
         */
        Document toStore( ModelInstance& inst ) const;

        Value toStoreValue( const Value& v ) const;

        /** fields missing from doc stay unset */
        void fromStore( const Document& doc , ModelInstance& inst ) const;

        Value fromStoreValue( const Value& v ) const;

        static bool isReference( const Value& v );

    private:
        Value _reference( const ModelDescriptor& model , const Value& pk ) const;

        const ModelDescriptor& _d;
        QueryTranslator _translator;
        bool _automaticReferencing;
        string _alias;
    };

}
