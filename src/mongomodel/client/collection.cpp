// collection.cpp

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
#include "mongomodel/client/collection.h"

#include "mongomodel/util/timer.h"

namespace mongomodel {

    DBCollection::DBCollection( const shared_ptr<DBClientBase>& client , const string& db , const string& name )
        : _client( client ) , _db( db ) , _name( name ) {
        uassert( 16070 , "DBCollection needs a client" , _client );
        uassert( 16071 , "invalid collection name" , ! _name.empty() && ! _db.empty() );
    }

    Value DBCollection::insert( const Document& doc , const Document& flags ) {
        if ( doc.hasField( "_id" ) ) {
            _client->insert( ns() , doc , flags );
            return doc.getField( "_id" );
        }

        Document withId;
        OID id = OID::gen();
        withId.append( "_id" , id );
        for ( Document::const_iterator i = doc.begin(); i != doc.end(); ++i )
            withId.append( i->name , i->value );
        _client->insert( ns() , withId , flags );
        return Value( id );
    }

    Value DBCollection::save( const Document& doc , const Document& flags ) {
        Value id = doc.getField( "_id" );
        if ( id.eoo() )
            return insert( doc , flags );
        _client->update( ns() , QUERY( "_id" << id ) , doc , true , false , flags );
        return id;
    }

    void DBCollection::update( const Document& spec , const Document& doc , const Document& flags ) {
        bool upsert = false;
        bool multi = false;
        Document writeConcern;
        for ( Document::const_iterator i = flags.begin(); i != flags.end(); ++i ) {
            if ( i->name == "upsert" )
                upsert = i->value.trueValue();
            else if ( i->name == "multi" )
                multi = i->value.trueValue();
            else
                writeConcern.append( i->name , i->value );
        }
        _client->update( ns() , Query( spec ) , doc , upsert , multi , writeConcern );
    }

    void DBCollection::remove( const Document& spec , const Document& flags ) {
        _client->remove( ns() , Query( spec ) , false , flags );
    }

    auto_ptr<DBClientCursor> DBCollection::find( const Query& query , int limit , int skip ) {
        return _client->query( ns() , query , limit , skip );
    }

    Document DBCollection::findOne( const Document& spec ) {
        return _client->findOne( ns() , Query( spec ) );
    }

    unsigned long long DBCollection::count( const Document& spec ) {
        return _client->count( ns() , spec );
    }

    string DBCollection::ensureIndex( const Document& keys , const Document& options ) {
        Value name = options.getField( "name" );
        string indexName = name.type() == String ? name.str() : DBClientBase::genIndexName( keys );
        if ( ! _client->ensureIndex( ns() , keys , options.getField( "unique" ).trueValue() , indexName ,
                                     options.getField( "sparse" ).trueValue() ) )
            return "";
        return indexName;
    }

    Document DBCollection::indexInformation() {
        Document info;
        auto_ptr<DBClientCursor> c = _client->getIndexes( ns() );
        while ( c->more() ) {
            Document idx = c->next();
            Document entry;
            entry.append( "key" , idx.getField( "key" ) );
            if ( idx.getField( "unique" ).trueValue() )
                entry.append( "unique" , true );
            if ( idx.getField( "sparse" ).trueValue() )
                entry.append( "sparse" , true );
            info.append( idx.getField( "name" ).str() , entry );
        }
        return info;
    }

    bool DBCollection::drop() {
        return _client->dropCollection( ns() );
    }

    shared_ptr<Collection> newDBCollection( const shared_ptr<DBClientBase>& client , const string& db , const string& name ) {
        return shared_ptr<Collection>( new DBCollection( client , db , name ) );
    }

    /* -- CollectionDebugWrapper ------------------------------------- */

    Value CollectionDebugWrapper::insert( const Document& doc , const Document& flags ) {
        Timer t;
        Value v = _collection->insert( doc , flags );
        log() << ns() << ".insert( " << doc.toString() << " , " << flags.toString() << " ) " << t.millis() << "ms" << endl;
        return v;
    }

    Value CollectionDebugWrapper::save( const Document& doc , const Document& flags ) {
        Timer t;
        Value v = _collection->save( doc , flags );
        log() << ns() << ".save( " << doc.toString() << " , " << flags.toString() << " ) " << t.millis() << "ms" << endl;
        return v;
    }

    void CollectionDebugWrapper::update( const Document& spec , const Document& doc , const Document& flags ) {
        Timer t;
        _collection->update( spec , doc , flags );
        log() << ns() << ".update( " << spec.toString() << " , " << doc.toString() << " , " << flags.toString()
              << " ) " << t.millis() << "ms" << endl;
    }

    void CollectionDebugWrapper::remove( const Document& spec , const Document& flags ) {
        Timer t;
        _collection->remove( spec , flags );
        log() << ns() << ".remove( " << spec.toString() << " , " << flags.toString() << " ) " << t.millis() << "ms" << endl;
    }

    auto_ptr<DBClientCursor> CollectionDebugWrapper::find( const Query& query , int limit , int skip ) {
        Timer t;
        auto_ptr<DBClientCursor> c = _collection->find( query , limit , skip );
        log() << ns() << ".find( " << query.toString() << " ) limit: " << limit << " skip: " << skip
              << " " << t.millis() << "ms" << endl;
        return c;
    }

    Document CollectionDebugWrapper::findOne( const Document& spec ) {
        Timer t;
        Document d = _collection->findOne( spec );
        log() << ns() << ".findOne( " << spec.toString() << " ) " << t.millis() << "ms" << endl;
        return d;
    }

    unsigned long long CollectionDebugWrapper::count( const Document& spec ) {
        Timer t;
        unsigned long long n = _collection->count( spec );
        log() << ns() << ".count( " << spec.toString() << " ) = " << n << " " << t.millis() << "ms" << endl;
        return n;
    }

    string CollectionDebugWrapper::ensureIndex( const Document& keys , const Document& options ) {
        Timer t;
        string name = _collection->ensureIndex( keys , options );
        log() << ns() << ".ensureIndex( " << keys.toString() << " , " << options.toString() << " ) "
              << t.millis() << "ms" << endl;
        return name;
    }

    Document CollectionDebugWrapper::indexInformation() {
        Timer t;
        Document info = _collection->indexInformation();
        log() << ns() << ".indexInformation() " << t.millis() << "ms" << endl;
        return info;
    }

    bool CollectionDebugWrapper::drop() {
        Timer t;
        bool existed = _collection->drop();
        log() << ns() << ".drop() " << t.millis() << "ms" << endl;
        return existed;
    }

}
