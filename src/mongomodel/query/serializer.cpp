// serializer.cpp

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
#include "mongomodel/query/serializer.h"

#include "mongomodel/db/errors.h"
#include "mongomodel/model/model_manager.h"

namespace mongomodel {

    Serializer::Serializer( const ModelDescriptor& d , bool automaticReferencing , const string& alias )
        : _d( d ) , _translator( d ) , _automaticReferencing( automaticReferencing ) , _alias( alias ) {
    }

    bool Serializer::isReference( const Value& v ) {
        if ( ! v.isDocument() )
            return false;
        const Document& d = v.embeddedObject();
        Value type = d["_type"];
        return type.type() == String && type.str() == "ref" && d.hasField( "_model" ) && d.hasField( "pk" );
    }

    Value Serializer::_reference( const ModelDescriptor& model , const Value& pk ) const {
        Document d;
        d.append( "_type" , "ref" );
        d.append( "_model" , model.name() );
        d.append( "pk" , QueryTranslator( model ).convertPk( pk ) );
        return Value( d );
    }

    Value Serializer::toStoreValue( const Value& v ) const {
        switch ( v.type() ) {
        case ModelRef: {
            if ( ! _automaticReferencing ) {
                raiseError( UnserializableReferenceError( "cannot encode object: " + v.referent()->toString() +
                                                          ", enable automatic referencing to store model instances" ) );
            }

            ModelInstancePtr inst = modelInstanceOf( v );
            if ( inst ) {
                if ( ! inst->isSaved() ) {
                    LOG(1) << "saving referenced " << inst->toString() << endl;
                    ModelManager( inst->descriptorPtr() , inst->alias() ).save( *inst );
                }
                return _reference( inst->descriptor() , inst->pk() );
            }

            LazyModelInstancePtr lazy = lazyInstanceOf( v );
            if ( lazy )
                return _reference( lazy->descriptor() , lazy->pk() );

            raiseError( UnserializableReferenceError( "cannot encode object: " + v.referent()->toString() ) );
            return Value();
        }
        case Array: {
            const vector<Value>& values = v.array();
            vector<Value> out;
            for ( unsigned i = 0; i < values.size(); i++ )
                out.push_back( toStoreValue( values[i] ) );
            return Value::createArray( out );
        }
        case Object: {
            const Document& d = v.embeddedObject();
            Document out;
            for ( Document::const_iterator i = d.begin(); i != d.end(); ++i )
                out.append( i->name , toStoreValue( i->value ) );
            return Value( out );
        }
        default:
            return v;
        }
    }

    Document Serializer::toStore( ModelInstance& inst ) const {
        Document doc;

        Value pk = inst.pk();
        if ( ! pk.eoo() )
            doc.append( "_id" , _translator.convertPk( pk ) );

        const vector<FieldDescriptor>& fields = _d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( f.isPrimaryKey() || f.isGridFS() )
                continue;

            Value v = inst.get( f.name() );
            if ( v.isNull() || v.eoo() )
                continue;

            if ( f.holdsObjectId() )
                doc.append( f.column() , _translator.convertValue( f , v ) );
            else
                doc.append( f.column() , toStoreValue( v ) );
        }
        return doc;
    }

    Value Serializer::fromStoreValue( const Value& v ) const {
        switch ( v.type() ) {
        case jstOID:
            return Value( v.oid().str() );
        case Array: {
            const vector<Value>& values = v.array();
            vector<Value> out;
            for ( unsigned i = 0; i < values.size(); i++ )
                out.push_back( fromStoreValue( values[i] ) );
            return Value::createArray( out );
        }
        case Object: {
            const Document& d = v.embeddedObject();
            if ( _automaticReferencing && isReference( v ) ) {
                shared_ptr<const ModelDescriptor> model = Schema::global().get( d["_model"].str() );
                return Value::createReference( shared_ptr<Referent>(
                    new LazyModelInstance( model , fromStoreValue( d["pk"] ) , _alias ) ) );
            }
            Document out;
            for ( Document::const_iterator i = d.begin(); i != d.end(); ++i )
                out.append( i->name , fromStoreValue( i->value ) );
            return Value( out );
        }
        default:
            return v;
        }
    }

    void Serializer::fromStore( const Document& doc , ModelInstance& inst ) const {
        const vector<FieldDescriptor>& fields = _d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( f.isGridFS() )
                continue;

            Value v = doc[f.column()];
            if ( v.eoo() )
                continue;

            if ( f.type() == ForeignKey && v.type() == jstOID && Schema::global().has( f.relatedModel() ) ) {
                shared_ptr<const ModelDescriptor> related = Schema::global().get( f.relatedModel() );
                inst.set( f.name() , Value::createReference( shared_ptr<Referent>(
                    new LazyModelInstance( related , Value( v.oid().str() ) , _alias ) ) ) );
                continue;
            }

            if ( f.isPrimaryKey() )
                inst.setPk( fromStoreValue( v ) );
            else
                inst.set( f.name() , fromStoreValue( v ) );
        }
    }

}
