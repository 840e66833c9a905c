// model_instance.cpp

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
#include "mongomodel/model/model_instance.h"

#include <boost/bind.hpp>

#include "mongomodel/client/connection_registry.h"

namespace mongomodel {

    ModelInstance::ModelInstance( const shared_ptr<const ModelDescriptor>& d , const string& alias )
        : _d( d ) , _alias( alias ) {
        uassert( 16140 , "ModelInstance needs a descriptor" , _d );
    }

    const FieldDescriptor& ModelInstance::_field( const string& name ) const {
        const FieldDescriptor* f = _d->field( name );
        uassert( 16141 , _d->name() + " has no field named " + name , f );
        return *f;
    }

    shared_ptr<GridFS> ModelInstance::_fetchGridFS() {
        return openGridFS( *_d , *ConnectionHandler::global().get( _alias ) );
    }

    Value ModelInstance::get( const string& field ) {
        const FieldDescriptor& f = _field( field );
        if ( f.type() == GridFSStringField )
            return Value( text( f.name() ) );
        if ( f.type() == GridFSField ) {
            PayloadPtr p = payload( f.name() );
            if ( ! p )
                return Value::getNull();
            return Value::createReference( p );
        }

        map<string,Value>::const_iterator i = _values.find( f.name() );
        if ( i != _values.end() )
            return i->second;
        if ( ! f.getDefault().eoo() )
            return f.getDefault();
        return Value::getNull();
    }

    void ModelInstance::set( const string& field , const Value& v ) {
        const FieldDescriptor& f = _field( field );
        if ( ! f.isGridFS() ) {
            _values[f.name()] = v;
            return;
        }

        if ( v.isNull() || v.eoo() ) {
            setPayload( f.name() , PayloadPtr() );
        }
        else if ( v.type() == String ) {
            setPayload( f.name() , PayloadPtr( new BytesPayload( v.str() ) ) );
        }
        else if ( v.type() == BinData ) {
            setPayload( f.name() , PayloadPtr( new BytesPayload( v.binData() ) ) );
        }
        else {
            PayloadPtr p;
            if ( v.type() == ModelRef )
                p = boost::dynamic_pointer_cast<Payload>( v.referent() );
            uassert( 16142 , string( "can't set a " ) + typeName( v.type() ) + " on GridFS field " + f.name() , p );
            setPayload( f.name() , p );
        }
    }

    bool ModelInstance::has( const string& field ) const {
        const FieldDescriptor& f = _field( field );
        if ( f.isGridFS() ) {
            map<string,GridFSFieldState>::const_iterator i = _gridfs.find( f.name() );
            return i != _gridfs.end() && ( i->second.isCached() || i->second.isStored() );
        }
        return _values.count( f.name() ) > 0;
    }

    PayloadPtr ModelInstance::payload( const string& field ) {
        return gridfs( field ).get( boost::bind( &ModelInstance::_fetchGridFS , this ) );
    }

    void ModelInstance::setPayload( const string& field , const PayloadPtr& p ) {
        gridfs( field ).set( p );
    }

    string ModelInstance::text( const string& field ) {
        PayloadPtr p = payload( field );
        if ( ! p )
            return "";
        return p->read();
    }

    GridFSFieldState& ModelInstance::gridfs( const string& field ) {
        const FieldDescriptor& f = _field( field );
        uassert( 16143 , _d->name() + "." + f.name() + " is not a GridFS field" , f.isGridFS() );
        return _gridfs[f.name()];
    }

    Value ModelInstance::pk() const {
        map<string,Value>::const_iterator i = _values.find( _d->pk().name() );
        if ( i == _values.end() || i->second.isNull() )
            return Value();
        return i->second;
    }

    void ModelInstance::setPk( const Value& pk ) {
        _values[_d->pk().name()] = pk;
    }

    bool ModelInstance::isSaved() const {
        return ! pk().eoo();
    }

    bool ModelInstance::operator==( const ModelInstance& other ) const {
        if ( this == &other )
            return true;
        if ( _d->name() != other._d->name() )
            return false;
        Value a = pk();
        Value b = other.pk();
        return ! a.eoo() && ! b.eoo() && a == b;
    }

    string ModelInstance::toString() const {
        stringstream ss;
        ss << _d->name() << "(";
        Value p = pk();
        if ( p.eoo() )
            ss << "unsaved";
        else
            ss << p.toString();
        ss << ")";
        return ss.str();
    }

    ModelInstancePtr modelInstanceOf( const Value& v ) {
        if ( v.type() != ModelRef )
            return ModelInstancePtr();
        return boost::dynamic_pointer_cast<ModelInstance>( v.referent() );
    }

}
