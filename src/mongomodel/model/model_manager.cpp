// model_manager.cpp

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
#include "mongomodel/model/model_manager.h"

#include "mongomodel/client/connection_registry.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/query/serializer.h"

namespace mongomodel {

    ModelManager::ModelManager( const shared_ptr<const ModelDescriptor>& d , const string& alias )
        : _d( d ) , _alias( alias ) {
        uassert( 16190 , "ModelManager needs a descriptor" , _d );
    }

    shared_ptr<DatabaseWrapper> ModelManager::wrapper() const {
        return ConnectionHandler::global().get( _alias );
    }

    shared_ptr<Collection> ModelManager::collection() const {
        return wrapper()->getCollection( _d->collection() );
    }

    ModelInstancePtr ModelManager::instance() const {
        return ModelInstancePtr( new ModelInstance( _d , _alias ) );
    }

    ModelInstancePtr ModelManager::create( const Document& values ) {
        ModelInstancePtr inst = instance();
        for ( Document::const_iterator i = values.begin(); i != values.end(); ++i )
            inst->set( i->name , i->value );
        save( *inst );
        return inst;
    }

    void ModelManager::save( ModelInstance& inst ) {
        uassert( 16191 , "can't save a " + inst.descriptor().name() + " as a " + _d->name() ,
                 inst.descriptor().name() == _d->name() );

        shared_ptr<DatabaseWrapper> db = wrapper();
        Serializer serializer( *_d , db->automaticReferencing() , _alias );
        Document body = serializer.toStore( inst );

        OID newId;
        Document doc;
        if ( body.hasField( "_id" ) ) {
            doc = body;
        }
        else {
            newId = OID::gen();
            doc.append( "_id" , newId );
            for ( Document::const_iterator i = body.begin(); i != body.end(); ++i )
                doc.append( i->name , i->value );
        }

        GridFSFieldManager payloads( *_d , *db );
        vector<OID> obsolete;
        if ( _d->hasGridFSFields() )
            payloads.beforeSave( inst , doc , obsolete );

        collection()->save( doc , db->flagsForCall( OP_SAVE ) );

        if ( newId.isSet() )
            inst.setPk( Value( newId.str() ) );

        payloads.afterSave( obsolete );
    }

    ModelInstancePtr ModelManager::get( const Filter& f ) {
        vector<ModelInstancePtr> found = filter( f , vector<string>() , 2 );
        if ( found.empty() )
            raiseError( DoesNotExist( _d->name() + " matching query does not exist: " + f.toString() ) );
        if ( found.size() > 1 )
            raiseError( MultipleObjectsReturned( "get() returned more than one " + _d->name() + ": " + f.toString() ) );
        return found[0];
    }

    ModelInstancePtr ModelManager::getByPk( const Value& pk ) {
        return get( Q( "pk" , pk ) );
    }

    vector<ModelInstancePtr> ModelManager::filter( const Filter& f , const vector<string>& orderBy ,
                                                   int limit , int skip ) {
        Command c = QueryTranslator( *_d ).translate( QUERY_READ , f , orderBy , limit , skip );

        Query q( c.query );
        if ( ! c.sort.isEmpty() )
            q.sort( c.sort );

        vector<ModelInstancePtr> result;
        auto_ptr<DBClientCursor> cursor = collection()->find( q , c.limit , c.skip );
        while ( cursor->more() )
            result.push_back( fromDocument( cursor->next() ) );
        return result;
    }

    unsigned long long ModelManager::count( const Filter& f ) {
        return collection()->count( QueryTranslator( *_d ).translateFilter( f ) );
    }

    void ModelManager::update( const Filter& f , const UpdateSpec& u ) {
        QueryTranslator translator( *_d );
        Command c = translator.translate( QUERY_UPDATE_MULTI , f );
        c.update = translator.translateUpdate( u );
        c.flags = wrapper()->flagsForCall( OP_UPDATE );
        LOG(1) << c.toString() << endl;
        collection()->update( c.query , c.update , c.flags );
    }

    void ModelManager::remove( ModelInstance& inst ) {
        uassert( 16192 , inst.toString() + " can't be deleted because it has not been saved" , inst.isSaved() );

        shared_ptr<DatabaseWrapper> db = wrapper();
        Document q;
        q.append( "_id" , QueryTranslator( *_d ).convertPk( inst.pk() ) );

        // what the stored record points to
        Document stored;
        const vector<FieldDescriptor>& fields = _d->fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            if ( fields[i].isGridFS() && inst.gridfs( fields[i].name() ).isStored() )
                stored.append( fields[i].column() , inst.gridfs( fields[i].name() ).oid() );
        }

        collection()->remove( q , db->flagsForCall( OP_REMOVE ) );

        if ( ! stored.isEmpty() )
            GridFSFieldManager( *_d , *db ).afterDelete( stored );
        inst.setPk( Value() );
    }

    void ModelManager::remove( const Filter& f ) {
        shared_ptr<DatabaseWrapper> db = wrapper();
        Command c = QueryTranslator( *_d ).translate( QUERY_DELETE , f );
        c.flags = db->flagsForCall( OP_REMOVE );

        vector<Document> stored;
        if ( _hasAutodeletePayloads() ) {
            auto_ptr<DBClientCursor> cursor = collection()->find( Query( c.query ) );
            while ( cursor->more() )
                stored.push_back( cursor->next() );
        }

        LOG(1) << c.toString() << endl;
        collection()->remove( c.query , c.flags );

        if ( ! stored.empty() ) {
            GridFSFieldManager payloads( *_d , *db );
            for ( unsigned i = 0; i < stored.size(); i++ )
                payloads.afterDelete( stored[i] );
        }
    }

    ModelInstancePtr ModelManager::fromDocument( const Document& doc ) {
        ModelInstancePtr inst = instance();
        shared_ptr<DatabaseWrapper> db = wrapper();
        Serializer( *_d , db->automaticReferencing() , _alias ).fromStore( doc , *inst );
        if ( _d->hasGridFSFields() )
            GridFSFieldManager( *_d , *db ).afterLoad( *inst , doc );
        return inst;
    }

    bool ModelManager::_hasAutodeletePayloads() const {
        const vector<FieldDescriptor>& fields = _d->fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            if ( fields[i].isGridFS() && fields[i].isAutodelete() )
                return true;
        }
        return false;
    }

}
