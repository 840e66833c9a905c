// field.cpp

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
#include "mongomodel/model/field.h"

namespace mongomodel {

    namespace {
        const char * fieldTypeNames[] = {
            "AutoField" , "CharField" , "IntegerField" , "FloatField" , "BooleanField" ,
            "DateField" , "DateTimeField" , "ForeignKey" , "ListField" , "DictField" ,
            "RawField" , "GridFSField" , "GridFSStringField"
        };
        const unsigned nFieldTypes = sizeof( fieldTypeNames ) / sizeof( char* );
    }

    const char * fieldTypeName( FieldType t ) {
        verify( (unsigned) t < nFieldTypes );
        return fieldTypeNames[t];
    }

    bool fieldTypeFromName( const string& name , FieldType& t ) {
        for ( unsigned i = 0; i < nFieldTypes; i++ ) {
            if ( name == fieldTypeNames[i] ) {
                t = (FieldType) i;
                return true;
            }
        }
        return false;
    }

    FieldDescriptor::FieldDescriptor( const string& name , FieldType type )
        : _name( name ) , _type( type ) , _dbIndex( false ) , _unique( false ) , _sparse( false ) ,
          _primaryKey( type == AutoField ) , _versioning( false ) , _autodelete( true ) {
    }

    string FieldDescriptor::column() const {
        if ( ! _dbColumn.empty() )
            return _dbColumn;
        if ( _primaryKey )
            return "_id";
        if ( _type == ForeignKey )
            return _name + "_id";
        return _name;
    }

    string FieldDescriptor::toString() const {
        stringstream ss;
        ss << _name << " " << fieldTypeName( _type ) << " -> " << column();
        if ( _dbIndex ) ss << " db_index";
        if ( _unique ) ss << " unique";
        if ( _sparse ) ss << " sparse";
        if ( ! _related.empty() ) ss << " to " << _related;
        return ss.str();
    }

}
