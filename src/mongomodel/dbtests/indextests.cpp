// indextests.cpp : indexes declared by models.
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
#include "mongomodel/db/errors.h"
#include "mongomodel/dbtests/dbtests.h"
#include "mongomodel/index/index_synchronizer.h"

namespace IndexTests {

    const IndexDefinition* findIndex( const vector<IndexDefinition>& defs , const string& name ) {
        for ( unsigned i = 0; i < defs.size(); i++ )
            if ( defs[i].name == name )
                return &defs[i];
        return 0;
    }

    class Base : public dbtests::ClientBase {
    public:
        Base() : sync( ConnectionHandler::global().get( "default" ) ) {
        }

        Document indexes( const string& model ) {
            return ConnectionHandler::global().get( "default" )
                ->getCollection( dbtests::model( model )->collection() )->indexInformation();
        }

        IndexSynchronizer sync;
    };

    class TargetNames {
    public:
        void run() {
            vector<IndexDefinition> defs = IndexSynchronizer::targetIndexes( *dbtests::model( "IndexTestModel" ) );
            ASSERT_EQUALS( 10U , defs.size() );

            const char * names[] = { "regular_index_1" , "foo_1" , "spam_1" , "foreignkey_index_id_1" ,
                                     "sparse_index_1" , "sparse_index_unique_1" , "descending_index_-1" ,
                                     "bar_-1" , "regular_index_1_custom_column_1" ,
                                     "sparse_index_cmp_1_1_sparse_index_cmp_2_1" };
            for ( unsigned i = 0; i < 10; i++ ) {
                ASSERT_EQUALS( names[i] , defs[i].name );
                ASSERT_EQUALS( "indextestmodel" , defs[i].collection );
            }

            ASSERT_EQUALS( DOC( "bar" << -1 ) , defs[7].key );
            ASSERT_EQUALS( DOC( "regular_index" << 1 << "custom_column" << 1 ) , defs[8].key );
        }
    };

    class TargetOptions {
    public:
        void run() {
            vector<IndexDefinition> defs = IndexSynchronizer::targetIndexes( *dbtests::model( "IndexTestModel" ) );

            const IndexDefinition* regular = findIndex( defs , "regular_index_1" );
            ASSERT( regular );
            ASSERT( ! regular->unique );
            ASSERT( ! regular->sparse );

            const IndexDefinition* sparse = findIndex( defs , "sparse_index_1" );
            ASSERT( sparse );
            ASSERT( sparse->sparse );
            ASSERT( ! sparse->unique );

            const IndexDefinition* sparseUnique = findIndex( defs , "sparse_index_unique_1" );
            ASSERT( sparseUnique );
            ASSERT( sparseUnique->sparse );
            ASSERT( sparseUnique->unique );

            const IndexDefinition* compound = findIndex( defs , "sparse_index_cmp_1_1_sparse_index_cmp_2_1" );
            ASSERT( compound );
            ASSERT( compound->sparse );

            ASSERT( ! findIndex( defs , "sparse_index_cmp_1_1" ) );
            ASSERT( ! findIndex( defs , "_id_" ) );
        }
    };

    class TargetOthers {
    public:
        void run() {
            vector<IndexDefinition> desc = IndexSynchronizer::targetIndexes( *dbtests::model( "DescendingIndexModel" ) );
            ASSERT_EQUALS( 1U , desc.size() );
            ASSERT_EQUALS( "desc_-1" , desc[0].name );

            vector<IndexDefinition> two = IndexSynchronizer::targetIndexes( *dbtests::model( "IndexTestModel2" ) );
            ASSERT_EQUALS( 1U , two.size() );
            ASSERT_EQUALS( "a_1_b_-1" , two[0].name );
            ASSERT_EQUALS( DOC( "a" << 1 << "b" << -1 ) , two[0].key );

            ASSERT( IndexSynchronizer::targetIndexes( *dbtests::model( "RawModel" ) ).empty() );
        }
    };

    class Sync : public Base {
    public:
        void run() {
            vector<IndexDefinition> done = sync.sync( *dbtests::model( "IndexTestModel" ) );
            ASSERT_EQUALS( 10U , done.size() );
            for ( unsigned i = 0; i < done.size(); i++ )
                ASSERT( done[i].created );

            Document info = indexes( "IndexTestModel" );
            ASSERT( info.hasField( "_id_" ) );
            ASSERT_EQUALS( Value( DOC( "key" << DOC( "spam" << 1 ) ) ) , info["spam_1"] );
            ASSERT_EQUALS( Value( DOC( "key" << DOC( "sparse_index_unique" << 1 ) << "unique" << true << "sparse" << true ) ) ,
                           info["sparse_index_unique_1"] );
            ASSERT_EQUALS( Value( DOC( "key" << DOC( "descending_index" << -1 ) ) ) , info["descending_index_-1"] );
            ASSERT_EQUALS( 11 , (int)info.nFields() );
        }
    };

    class SyncTwice : public Base {
    public:
        void run() {
            sync.sync( *dbtests::model( "IndexTestModel2" ) );
            vector<IndexDefinition> again = sync.sync( *dbtests::model( "IndexTestModel2" ) );
            ASSERT_EQUALS( 1U , again.size() );
            ASSERT( ! again[0].created );
            ASSERT_EQUALS( 2 , (int)indexes( "IndexTestModel2" ).nFields() );
        }
    };

    class SyncAll : public Base {
    public:
        void run() {
            unsigned expected = 0;
            vector< boost::shared_ptr<const ModelDescriptor> > models = Schema::global().all();
            for ( unsigned i = 0; i < models.size(); i++ )
                expected += IndexSynchronizer::targetIndexes( *models[i] ).size();
            ASSERT( expected >= 12 );

            vector<IndexDefinition> done = sync.syncAll();
            ASSERT_EQUALS( expected , done.size() );
            ASSERT( findIndex( done , "desc_-1" ) );
            ASSERT( findIndex( done , "a_1_b_-1" ) );
            ASSERT( indexes( "DescendingIndexModel" ).hasField( "desc_-1" ) );

            done = sync.syncAll();
            for ( unsigned i = 0; i < done.size(); i++ )
                ASSERT( ! done[i].created );
        }
    };

    class UniqueEnforced : public Base {
    public:
        void run() {
            sync.sync( *dbtests::model( "IndexTestModel" ) );
            ModelManager m( dbtests::model( "IndexTestModel" ) );
            m.create( DOC( "sparse_index_unique" << 1 ) );
            ASSERT_THROWS( m.create( DOC( "sparse_index_unique" << 1 ) ) , DuplicateKeyError );

            // sparse: records without the field don't collide
            m.create( DOC( "regular_index" << 5 ) );
            m.create( DOC( "regular_index" << 6 ) );
            ASSERT_EQUALS( 3U , m.count() );
        }
    };

    /** another client dropped the collection: the indexes come back on the next sync */
    class SyncAfterDropElsewhere : public Base {
    public:
        void run() {
            sync.sync( *dbtests::model( "IndexTestModel2" ) );

            DatabaseWrapper other( dbtests::testSettings() );
            ASSERT( other.getCollection( "indextestmodel2" )->drop() );
            ASSERT( ! indexes( "IndexTestModel2" ).hasField( "a_1_b_-1" ) );

            vector<IndexDefinition> again = sync.sync( *dbtests::model( "IndexTestModel2" ) );
            ASSERT_EQUALS( 1U , again.size() );
            ASSERT( again[0].created );
            ASSERT_EQUALS( Value( DOC( "key" << DOC( "a" << 1 << "b" << -1 ) ) ) ,
                           indexes( "IndexTestModel2" )["a_1_b_-1"] );
            other.disconnect();
        }
    };

    class OptionsMismatch : public Base {
    public:
        void run() {
            boost::shared_ptr<Collection> c = ConnectionHandler::global().get( "default" )->getCollection( "indextestmodel" );
            c->ensureIndex( DOC( "sparse_index_unique" << 1 ) );

            try {
                sync.sync( *dbtests::model( "IndexTestModel" ) );
                FAIL( "sync accepted an index with different options" );
            }
            catch ( UserException& e ) {
                ASSERT_EQUALS( 16211 , e.getCode() );
                ASSERT( string( e.what() ).find( "sparse_index_unique_1" ) != string::npos );
            }

            Document live = indexes( "IndexTestModel" );
            ASSERT( ! live["sparse_index_unique_1"].embeddedObject()["unique"].trueValue() );
        }
    };

    /** a cached ensureIndex sends nothing and says so */
    class EnsureIndexOutcome : public Base {
    public:
        void run() {
            boost::shared_ptr<Collection> c = ConnectionHandler::global().get( "default" )->getCollection( "indextestmodel" );
            ASSERT_EQUALS( "x_1" , c->ensureIndex( DOC( "x" << 1 ) ) );
            ASSERT_EQUALS( "" , c->ensureIndex( DOC( "x" << 1 ) ) );

            vector<IndexDefinition> done = sync.sync( *dbtests::model( "IndexTestModel2" ) );
            ASSERT( done[0].created );
            ASSERT( indexes( "IndexTestModel2" ).hasField( "a_1_b_-1" ) );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "index" ) {
        }

        void setupTests() {
            add< TargetNames >();
            add< TargetOptions >();
            add< TargetOthers >();
            add< Sync >();
            add< SyncTwice >();
            add< SyncAll >();
            add< UniqueEnforced >();
            add< SyncAfterDropElsewhere >();
            add< OptionsMismatch >();
            add< EnsureIndexOutcome >();
        }
    } myall;

}
