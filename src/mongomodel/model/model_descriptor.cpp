// model_descriptor.cpp

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
#include "mongomodel/model/model_descriptor.h"

#include <algorithm>
#include <cctype>

namespace mongomodel {

    const FieldDescriptor* ModelDescriptor::field( const string& name ) const {
        if ( name == "pk" )
            return &pk();
        for ( unsigned i = 0; i < _fields.size(); i++ ) {
            if ( _fields[i].name() == name )
                return &_fields[i];
        }
        return 0;
    }

    const FieldDescriptor* ModelDescriptor::fieldByColumn( const string& column ) const {
        for ( unsigned i = 0; i < _fields.size(); i++ ) {
            if ( _fields[i].column() == column )
                return &_fields[i];
        }
        return 0;
    }

    bool ModelDescriptor::isDescending( const string& field ) const {
        return find( _descendingIndexes.begin() , _descendingIndexes.end() , field ) != _descendingIndexes.end();
    }

    bool ModelDescriptor::hasGridFSFields() const {
        for ( unsigned i = 0; i < _fields.size(); i++ ) {
            if ( _fields[i].isGridFS() )
                return true;
        }
        return false;
    }

    string ModelDescriptor::toString() const {
        stringstream ss;
        ss << _name << " (" << _collection << ")";
        for ( unsigned i = 0; i < _fields.size(); i++ )
            ss << "\n  " << _fields[i].toString();
        for ( unsigned i = 0; i < _indexes.size(); i++ ) {
            ss << "\n  index";
            const vector< pair<string,int> >& f = _indexes[i].fields();
            for ( unsigned j = 0; j < f.size(); j++ )
                ss << " " << f[j].first << ":" << f[j].second;
        }
        return ss.str();
    }

    ModelDescriptorBuilder::ModelDescriptorBuilder( const string& name ) : _d( new ModelDescriptor() ) {
        uassert( 16110 , "model name can't be empty" , ! name.empty() );
        _d->_name = name;
    }

    ModelDescriptorBuilder& ModelDescriptorBuilder::collection( const string& name ) {
        _d->_collection = name;
        return *this;
    }

    ModelDescriptorBuilder& ModelDescriptorBuilder::field( const FieldDescriptor& f ) {
        _d->_fields.push_back( f );
        return *this;
    }

    ModelDescriptorBuilder& ModelDescriptorBuilder::index( const IndexSpec& spec ) {
        _d->_indexes.push_back( spec );
        return *this;
    }

    ModelDescriptorBuilder& ModelDescriptorBuilder::descendingIndex( const string& field ) {
        _d->_descendingIndexes.push_back( field );
        return *this;
    }

    ModelDescriptorBuilder& ModelDescriptorBuilder::idHint( const string& setting ) {
        _d->_idHint = setting;
        return *this;
    }

    shared_ptr<const ModelDescriptor> ModelDescriptorBuilder::done() {
        uassert( 16111 , "ModelDescriptorBuilder::done() called twice" , _d );
        ModelDescriptor& d = *_d;

        if ( d._collection.empty() ) {
            d._collection = d._name;
            transform( d._collection.begin() , d._collection.end() , d._collection.begin() , ::tolower );
        }

        int pk = -1;
        set<string> names;
        set<string> columns;
        for ( unsigned i = 0; i < d._fields.size(); i++ ) {
            const FieldDescriptor& f = d._fields[i];
            uassert( 16112 , d._name + ": duplicate field " + f.name() , names.insert( f.name() ).second );
            uassert( 16113 , d._name + ": duplicate column " + f.column() , columns.insert( f.column() ).second );
            uassert( 16114 , d._name + "." + f.name() + ": ForeignKey needs a related model" ,
                     f.type() != ForeignKey || ! f.relatedModel().empty() );
            if ( f.isPrimaryKey() ) {
                uassert( 16115 , d._name + ": more than one primary key" , pk < 0 );
                pk = i;
            }
        }

        if ( pk < 0 ) {
            uassert( 16116 , d._name + ": field 'id' is taken but there is no primary key" , ! names.count( "id" ) );
            d._fields.insert( d._fields.begin() , FieldDescriptor( "id" , AutoField ) );
            pk = 0;
        }
        d._pk = pk;

        for ( unsigned i = 0; i < d._descendingIndexes.size(); i++ ) {
            uassert( 16117 , d._name + ": descending index on unknown field " + d._descendingIndexes[i] ,
                     d.field( d._descendingIndexes[i] ) );
        }

        for ( unsigned i = 0; i < d._indexes.size(); i++ ) {
            uassert( 16118 , d._name + ": empty compound index" , ! d._indexes[i].fields().empty() );
            const vector< pair<string,int> >& f = d._indexes[i].fields();
            for ( unsigned j = 0; j < f.size(); j++ )
                uassert( 16119 , d._name + ": index direction must be 1 or -1" , f[j].second == 1 || f[j].second == -1 );
        }

        shared_ptr<const ModelDescriptor> result = _d;
        _d.reset();
        return result;
    }

    Schema& Schema::global() {
        static Schema s;
        return s;
    }

    shared_ptr<const ModelDescriptor> Schema::registerModel( const shared_ptr<const ModelDescriptor>& d ) {
        uassert( 16120 , "registerModel needs a descriptor" , d );
        scoped_lock lk( _m );
        for ( unsigned i = 0; i < _models.size(); i++ ) {
            if ( _models[i]->name() == d->name() ) {
                _models[i] = d;
                return d;
            }
        }
        _models.push_back( d );
        return d;
    }

    shared_ptr<const ModelDescriptor> Schema::get( const string& name ) {
        scoped_lock lk( _m );
        for ( unsigned i = 0; i < _models.size(); i++ ) {
            if ( _models[i]->name() == name )
                return _models[i];
        }
        uasserted( 16121 , string( "unknown model: " ) + name );
        return shared_ptr<const ModelDescriptor>();
    }

    bool Schema::has( const string& name ) {
        scoped_lock lk( _m );
        for ( unsigned i = 0; i < _models.size(); i++ ) {
            if ( _models[i]->name() == name )
                return true;
        }
        return false;
    }

    vector< shared_ptr<const ModelDescriptor> > Schema::all() {
        scoped_lock lk( _m );
        return _models;
    }

    void Schema::clear() {
        scoped_lock lk( _m );
        _models.clear();
    }

}
