// memoryclienttests.cpp : the in memory driver.
//

/**
*    Copyright (C) 2008 10gen Inc.
*
*    This program is free software: you can redistribute it and/or  modify
*    it under the terms of the GNU Affero General Public License, version 3,
*    as published by the Free Software Foundation.
*
*    This program is distributed in the hope that it will be useful,
*    but WITHOUT ANY WARRANTY; without even the implied warranty of
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*    GNU Affero General Public License for more details.
*
*    You should have received a copy of the GNU Affero General Public License
*    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "mongomodel/pch.h"
#include "mongomodel/client/memory_client.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/dbtests/dbtests.h"

namespace MemoryClientTests {

    class Base {
    public:
        Base( string coll ) : _ns( string( "memtests." ) + coll ) {
            db.connect( "memtests" , 1 );
            db.dropCollection( _ns );
        }
        virtual ~Base() {
            db.dropCollection( _ns );
        }

        const char * ns() { return _ns.c_str(); }

        string _ns;
        DBClientMemory db;
    };

    class InsertAndQuery : public Base {
    public:
        InsertAndQuery() : Base( "insertandquery" ) {}
        void run() {
            db.insert( ns() , DOC( "a" << 1 ) );
            db.insert( ns() , DOC( "a" << 2 ) );
            db.insert( ns() , DOC( "a" << 3 ) );
            ASSERT_EQUALS( 3U , db.count( ns() ) );
            ASSERT_EQUALS( 2U , db.count( ns() , DOC( "a" << DOC( "$gt" << 1 ) ) ) );

            Document one = db.findOne( ns() , QUERY( "a" << 2 ) );
            ASSERT_EQUALS( 2 , one["a"].numberInt() );
            ASSERT_EQUALS( jstOID , one["_id"].type() );
            ASSERT_EQUALS( "_id" , one.begin()->name );

            ASSERT( db.findOne( ns() , QUERY( "a" << 5 ) ).isEmpty() );
        }
    };

    class SortSkipLimit : public Base {
    public:
        SortSkipLimit() : Base( "sortskiplimit" ) {}
        void run() {
            for ( int i = 0; i < 5; i++ )
                db.insert( ns() , DOC( "a" << ( i * 7 ) % 5 ) );

            auto_ptr<DBClientCursor> c = db.query( ns() , Query().sort( "a" , -1 ) , 2 , 1 );
            ASSERT( c->more() );
            ASSERT_EQUALS( 3 , c->next()["a"].numberInt() );
            ASSERT_EQUALS( 2 , c->next()["a"].numberInt() );
            ASSERT( ! c->more() );

            ASSERT_EQUALS( 0 , db.query( ns() , Query() , 0 , 10 )->itcount() );
            ASSERT_EQUALS( 5 , db.query( ns() , Query() )->itcount() );
        }
    };

    class SortMissingAsNull : public Base {
    public:
        SortMissingAsNull() : Base( "sortmissing" ) {}
        void run() {
            db.insert( ns() , DOC( "_id" << 1 << "a" << 1 ) );
            db.insert( ns() , DOC( "_id" << 2 ) );
            Document first = db.findOne( ns() , Query().sort( "a" ) );
            ASSERT_EQUALS( 2 , first["_id"].numberInt() );
        }
    };

    class UpdateModifiers : public Base {
    public:
        UpdateModifiers() : Base( "updatemods" ) {}
        void run() {
            db.insert( ns() , DOC( "_id" << 1 << "n" << 1 << "kind" << "x" ) );
            db.insert( ns() , DOC( "_id" << 2 << "n" << 1 << "kind" << "x" ) );

            db.update( ns() , QUERY( "kind" << "x" ) , DOC( "$inc" << DOC( "n" << 1 ) ) );
            ASSERT_EQUALS( 1U , db.count( ns() , DOC( "n" << 2 ) ) );

            db.update( ns() , QUERY( "kind" << "x" ) , DOC( "$inc" << DOC( "n" << 1 ) ) , false , true );
            ASSERT_EQUALS( 3 , db.findOne( ns() , QUERY( "_id" << 1 ) )["n"].numberInt() );
            ASSERT_EQUALS( 2 , db.findOne( ns() , QUERY( "_id" << 2 ) )["n"].numberInt() );

            ASSERT_THROWS( db.update( ns() , Query() , DOC( "n" << 5 ) , false , true ) , UserException );
        }
    };

    class ReplaceKeepsId : public Base {
    public:
        ReplaceKeepsId() : Base( "replace" ) {}
        void run() {
            db.insert( ns() , DOC( "_id" << 7 << "a" << 1 << "b" << 1 ) );
            db.update( ns() , QUERY( "_id" << 7 ) , DOC( "a" << 2 ) );
            ASSERT_EQUALS( DOC( "_id" << 7 << "a" << 2 ) , db.findOne( ns() , Query() ) );
        }
    };

    class Upsert : public Base {
    public:
        Upsert() : Base( "upsert" ) {}
        void run() {
            db.update( ns() , QUERY( "_id" << 3 ) , DOC( "a" << 1 ) , true );
            ASSERT_EQUALS( DOC( "_id" << 3 << "a" << 1 ) , db.findOne( ns() , Query() ) );

            db.update( ns() , QUERY( "name" << "x" ) , DOC( "$inc" << DOC( "hits" << 1 ) ) , true );
            Document created = db.findOne( ns() , QUERY( "name" << "x" ) );
            ASSERT_EQUALS( 1 , created["hits"].numberInt() );
            ASSERT_EQUALS( jstOID , created["_id"].type() );
            ASSERT_EQUALS( 2U , db.count( ns() ) );
        }
    };

    class Remove : public Base {
    public:
        Remove() : Base( "remove" ) {}
        void run() {
            for ( int i = 0; i < 4; i++ )
                db.insert( ns() , DOC( "a" << i % 2 ) );
            db.remove( ns() , QUERY( "a" << 1 ) , true );
            ASSERT_EQUALS( 3U , db.count( ns() ) );
            db.remove( ns() , QUERY( "a" << 0 ) );
            ASSERT_EQUALS( 1U , db.count( ns() ) );
            db.remove( ns() , Query() );
            ASSERT_EQUALS( 0U , db.count( ns() ) );
        }
    };

    class DuplicateId : public Base {
    public:
        DuplicateId() : Base( "dupid" ) {}
        void run() {
            db.insert( ns() , DOC( "_id" << 1 ) );
            ASSERT_THROWS( db.insert( ns() , DOC( "_id" << 1 ) ) , DuplicateKeyError );
            ASSERT_EQUALS( 1U , db.count( ns() ) );
        }
    };

    class UniqueIndex : public Base {
    public:
        UniqueIndex() : Base( "uniqueindex" ) {}
        void run() {
            ASSERT( db.ensureIndex( ns() , DOC( "email" << 1 ) , true ) );
            ASSERT( ! db.ensureIndex( ns() , DOC( "email" << 1 ) , true ) );

            db.insert( ns() , DOC( "email" << "a@example.com" ) );
            ASSERT_THROWS( db.insert( ns() , DOC( "email" << "a@example.com" ) ) , DuplicateKeyError );

            // missing keys count as null on a non sparse index
            db.insert( ns() , DOC( "other" << 1 ) );
            ASSERT_THROWS( db.insert( ns() , DOC( "other" << 2 ) ) , DuplicateKeyError );
        }
    };

    class SparseUniqueIndex : public Base {
    public:
        SparseUniqueIndex() : Base( "sparseunique" ) {}
        void run() {
            db.ensureIndex( ns() , DOC( "email" << 1 ) , true , "" , true );
            db.insert( ns() , DOC( "other" << 1 ) );
            db.insert( ns() , DOC( "other" << 2 ) );
            db.insert( ns() , DOC( "email" << "a@example.com" ) );
            ASSERT_THROWS( db.insert( ns() , DOC( "email" << "a@example.com" ) ) , DuplicateKeyError );
            ASSERT_EQUALS( 3U , db.count( ns() ) );
        }
    };

    class UniqueIndexOnExistingDuplicates : public Base {
    public:
        UniqueIndexOnExistingDuplicates() : Base( "uniqueexisting" ) {}
        void run() {
            db.insert( ns() , DOC( "a" << 1 ) );
            db.insert( ns() , DOC( "a" << 1 ) );
            ASSERT_THROWS( db.ensureIndex( ns() , DOC( "a" << 1 ) , true ) , DuplicateKeyError );
            ASSERT_EQUALS( 1 , db.getIndexes( ns() )->itcount() );
        }
    };

    class Indexes : public Base {
    public:
        Indexes() : Base( "indexes" ) {}
        void run() {
            db.insert( ns() , DOC( "x" << 2 ) );
            ASSERT_EQUALS( 1 , db.getIndexes( ns() )->itcount() );

            db.ensureIndex( ns() , DOC( "x" << 1 << "y" << -1 ) );
            auto_ptr<DBClientCursor> c = db.getIndexes( ns() );
            ASSERT_EQUALS( "_id_" , c->next()["name"].str() );
            Document idx = c->next();
            ASSERT_EQUALS( "x_1_y_-1" , idx["name"].str() );
            ASSERT_EQUALS( DOC( "x" << 1 << "y" << -1 ) , idx["key"].embeddedObject() );
            ASSERT( ! idx.hasField( "unique" ) );

            // same name, other key
            ASSERT_THROWS( db.createIndex( ns() , DOC( "key" << DOC( "z" << 1 ) << "name" << "x_1_y_-1" ) ) ,
                           UserException );
            // same name and key, other options
            ASSERT_THROWS( db.createIndex( ns() , DOC( "key" << DOC( "x" << 1 << "y" << -1 ) << "name" << "x_1_y_-1"
                                                       << "unique" << true ) ) ,
                           UserException );
            // identical spec is a no-op
            db.createIndex( ns() , DOC( "key" << DOC( "x" << 1 << "y" << -1 ) << "name" << "x_1_y_-1" ) );
            ASSERT_EQUALS( 2 , db.getIndexes( ns() )->itcount() );
        }
    };

    class CollectionNames : public Base {
    public:
        CollectionNames() : Base( "names" ) {}
        void run() {
            db.insert( ns() , DOC( "a" << 1 ) );
            db.insert( "othermemtests.names" , DOC( "a" << 1 ) );

            list<string> names = db.getCollectionNames( "memtests" );
            ASSERT_EQUALS( 1U , names.size() );
            ASSERT_EQUALS( _ns , names.front() );

            ASSERT( db.dropCollection( "othermemtests.names" ) );
            ASSERT( ! db.dropCollection( "othermemtests.names" ) );
        }
    };

    class SharedStore : public Base {
    public:
        SharedStore() : Base( "shared" ) {}
        void run() {
            db.insert( ns() , DOC( "a" << 1 ) );

            DBClientMemory other;
            other.connect( "memtests" , 1 );
            ASSERT_EQUALS( 1U , other.count( ns() ) );

            DBClientMemory elsewhere;
            elsewhere.connect( "memtests" , 2 );
            ASSERT_EQUALS( 0U , elsewhere.count( ns() ) );
        }
    };

    class RefusesLiveReferences : public Base {
    public:
        class Thing : public Referent {
        public:
            virtual string toString() const { return "Thing"; }
        };

        RefusesLiveReferences() : Base( "liverefs" ) {}
        void run() {
            Value ref = Value::createReference( boost::shared_ptr<Referent>( new Thing() ) );
            ASSERT_THROWS( db.insert( ns() , DOC( "a" << ref ) ) , MsgAssertionException );
            ASSERT_THROWS( db.insert( ns() , DOC( "a" << DOC_ARRAY( 1 << ref ) ) ) , MsgAssertionException );
            ASSERT_EQUALS( 0U , db.count( ns() ) );
        }
    };

    class NotConnected {
    public:
        void run() {
            DBClientMemory db;
            ASSERT( ! db.isConnected() );
            ASSERT_THROWS( db.insert( "memtests.x" , DOC( "a" << 1 ) ) , UserException );
            ASSERT_THROWS( db.connect( "" , 1 ) , ConnectException );

            db.connect( "memtests" , 1 );
            ASSERT( db.isConnected() );
            ASSERT_EQUALS( "memtests:1" , db.getServerAddress() );
            db.disconnect();
            ASSERT( ! db.isConnected() );
        }
    };

    class Auth {
    public:
        void run() {
            DBClientMemory db;
            db.connect( "memauth" , 1 );
            string errmsg;
            ASSERT( db.auth( "open" , "anyone" , "x" , errmsg ) );

            db.store()->addUser( "closed" , "joe" , "secret" );
            ASSERT( db.auth( "closed" , "joe" , "secret" , errmsg ) );
            ASSERT( ! db.auth( "closed" , "joe" , "wrong" , errmsg ) );
            ASSERT_EQUALS( "auth fails" , errmsg );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "memoryclient" ) {
        }

        void setupTests() {
            add< InsertAndQuery >();
            add< SortSkipLimit >();
            add< SortMissingAsNull >();
            add< UpdateModifiers >();
            add< ReplaceKeepsId >();
            add< Upsert >();
            add< Remove >();
            add< DuplicateId >();
            add< UniqueIndex >();
            add< SparseUniqueIndex >();
            add< UniqueIndexOnExistingDuplicates >();
            add< Indexes >();
            add< CollectionNames >();
            add< SharedStore >();
            add< RefusesLiveReferences >();
            add< NotConnected >();
            add< Auth >();
        }
    } all;

}
