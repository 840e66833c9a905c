// model_instance.h

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

#include "mongomodel/model/gridfs_field.h"

namespace mongomodel {

    /**
       one record of a model.  field values are kept by field name, the primary
       key as its 24 character hex string.

       a GridFS field reads as a ModelRef Value wrapping its Payload (null when
       empty), a GridFSStringField as its text ("" when empty).  setting a string
       on either makes a BytesPayload.
     */
    class ModelInstance : public Referent {
    public:
        ModelInstance( const shared_ptr<const ModelDescriptor>& d , const string& alias = "default" );

        const ModelDescriptor& descriptor() const { return *_d; }
        const shared_ptr<const ModelDescriptor>& descriptorPtr() const { return _d; }
        const string& alias() const { return _alias; }

        /** the value, the field default or null.  uasserts on an unknown field. */
        Value get( const string& field );

        void set( const string& field , const Value& v );

        /** true if set() was called for field, or it was loaded */
        bool has( const string& field ) const;

        PayloadPtr payload( const string& field );
        void setPayload( const string& field , const PayloadPtr& p );

        /** "" for an empty field */
        string text( const string& field );

        GridFSFieldState& gridfs( const string& field );

        /** hex string, EOO if there is none yet */
        Value pk() const;
        void setPk( const Value& pk );
        bool isSaved() const;

        /** same model and same primary key.  unsaved instances only equal themselves. */
        bool operator==( const ModelInstance& other ) const;
        bool operator!=( const ModelInstance& other ) const { return ! ( *this == other ); }

        virtual string toString() const;

    private:
        const FieldDescriptor& _field( const string& name ) const;
        shared_ptr<GridFS> _fetchGridFS();

        shared_ptr<const ModelDescriptor> _d;
        string _alias;
        map<string,Value> _values;
        map<string,GridFSFieldState> _gridfs;
    };

    typedef shared_ptr<ModelInstance> ModelInstancePtr;

    /** the ModelInstance a ModelRef Value wraps, null if it wraps something else */
    ModelInstancePtr modelInstanceOf( const Value& v );

}
