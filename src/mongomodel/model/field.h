// field.h

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

#include "mongomodel/bson/value.h"

namespace mongomodel {

    enum FieldType {
        AutoField ,          // primary key, stored as _id
        CharField ,
        IntegerField ,
        FloatField ,
        BooleanField ,
        DateField ,
        DateTimeField ,
        ForeignKey ,         // stored as <name>_id
        ListField ,
        DictField ,
        RawField ,           // any value
        GridFSField ,        // payload stored in GridFS
        GridFSStringField    // text payload stored in GridFS
    };

    const char * fieldTypeName( FieldType t );

    /** @return false if name is not a FieldType */
    bool fieldTypeFromName( const string& name , FieldType& t );

    /**
       one declared field of a model.  setters return *this:

         FieldDescriptor( "author" , ForeignKey ).to( "User" ).dbIndex()
     */
    class FieldDescriptor {
    public:
        FieldDescriptor( const string& name , FieldType type );

        FieldDescriptor& dbColumn( const string& column ) { _dbColumn = column; return *this; }
        FieldDescriptor& dbIndex( bool on = true ) { _dbIndex = on; return *this; }
        FieldDescriptor& unique( bool on = true ) { _unique = on; return *this; }
        FieldDescriptor& sparse( bool on = true ) { _sparse = on; return *this; }
        FieldDescriptor& primaryKey( bool on = true ) { _primaryKey = on; return *this; }
        /** the model a ForeignKey points to */
        FieldDescriptor& to( const string& model ) { _related = model; return *this; }
        /** GridFS fields: keep the old payload when a new one is saved.  default off. */
        FieldDescriptor& versioning( bool on = true ) { _versioning = on; return *this; }
        /** GridFS fields: remove the payload with its record.  default on. */
        FieldDescriptor& autodelete( bool on = true ) { _autodelete = on; return *this; }
        FieldDescriptor& defaultValue( const Value& v ) { _default = v; return *this; }

        const string& name() const { return _name; }
        FieldType type() const { return _type; }

        /** the storage name: db_column if set, _id for the primary key, <name>_id for a ForeignKey */
        string column() const;

        bool hasDbIndex() const { return _dbIndex; }
        bool isUnique() const { return _unique; }
        bool isSparse() const { return _sparse; }
        bool isPrimaryKey() const { return _primaryKey; }
        const string& relatedModel() const { return _related; }
        bool isVersioned() const { return _versioning; }
        bool isAutodelete() const { return _autodelete; }
        const Value& getDefault() const { return _default; }

        bool isGridFS() const { return _type == GridFSField || _type == GridFSStringField; }

        /** AutoField and ForeignKey values are object ids in the store */
        bool holdsObjectId() const { return _type == AutoField || _type == ForeignKey; }

        string toString() const;

    private:
        string _name;
        FieldType _type;
        string _dbColumn;
        bool _dbIndex;
        bool _unique;
        bool _sparse;
        bool _primaryKey;
        string _related;
        bool _versioning;
        bool _autodelete;
        Value _default;
    };

}
