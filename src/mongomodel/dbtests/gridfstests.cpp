// gridfstests.cpp : GridFS storage and GridFS model fields.
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
#include "mongomodel/client/gridfs.h"
#include "mongomodel/client/memory_client.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/dbtests/dbtests.h"
#include "mongomodel/model/gridfs_field.h"

namespace GridFSTests {

    class Base : public dbtests::ClientBase {
    public:
        Base() : db( ConnectionHandler::global().get( "default" ) ) ,
                 fs( db->connection() , db->database() , "testfs" ) {
        }

        unsigned long long files() {
            return db->connection()->count( fs.filesNS() );
        }
        unsigned long long chunks() {
            return db->connection()->count( fs.chunksNS() );
        }

        boost::shared_ptr<DatabaseWrapper> db;
        GridFS fs;
    };

    class StoreAndRead : public Base {
    public:
        void run() {
            string data = "hello gridfs";
            Document f = fs.storeFile( data.data() , data.size() , "hello.txt" , "text/plain" );
            ASSERT_EQUALS( jstOID , f["_id"].type() );
            ASSERT_EQUALS( 1U , files() );
            ASSERT_EQUALS( 1U , chunks() );

            GridFile file = fs.get( f["_id"].oid() );
            ASSERT( file.exists() );
            ASSERT_EQUALS( "hello.txt" , file.getFilename() );
            ASSERT_EQUALS( "text/plain" , file.getContentType() );
            ASSERT( file.getContentLength() == data.size() );
            ASSERT_EQUALS( 1 , file.getNumChunks() );
            ASSERT_EQUALS( data , file.read() );

            ASSERT( fs.findFile( "hello.txt" ).exists() );
            ASSERT( ! fs.findFile( "other.txt" ).exists() );
        }
    };

    class ManyChunks : public Base {
    public:
        void run() {
            string data( 600 * 1024 , 'x' );
            data[0] = 'a';
            data[data.size() - 1] = 'z';
            Document f = fs.storeFile( data.data() , data.size() );
            ASSERT_EQUALS( 3U , chunks() );

            GridFile file = fs.get( f["_id"].oid() );
            ASSERT_EQUALS( 3 , file.getNumChunks() );
            ASSERT_EQUALS( data , file.read() );

            stringstream out;
            ASSERT( file.write( out ) == data.size() );
            ASSERT_EQUALS( data , out.str() );
        }
    };

    class StoreStream : public Base {
    public:
        void run() {
            stringstream in( "skipped:kept" );
            in.seekg( 8 );
            Document f = fs.storeFile( in );
            ASSERT_EQUALS( "kept" , fs.get( f["_id"].oid() ).read() );
        }
    };

    class Remove : public Base {
    public:
        void run() {
            Document a = fs.storeFile( "a" , 1 , "a.txt" );
            Document b = fs.storeFile( "b" , 1 , "b.txt" );
            fs.remove( a["_id"].oid() );
            ASSERT( ! fs.exists( a["_id"].oid() ) );
            ASSERT( fs.exists( b["_id"].oid() ) );
            ASSERT_EQUALS( 1U , chunks() );

            fs.removeFile( "b.txt" );
            ASSERT_EQUALS( 0U , files() );
            ASSERT_EQUALS( 0U , chunks() );

            // removing twice is fine
            fs.remove( a["_id"].oid() );
        }
    };

    class Missing : public Base {
    public:
        void run() {
            ASSERT( ! fs.findFile( OID::gen() ).exists() );
            ASSERT_THROWS( fs.get( OID::gen() ) , MissingPayloadError );
        }
    };

    class WriteConcernPassed : public Base {
    public:
        void run() {
            DBClientMemory* mem = dynamic_cast<DBClientMemory*>( db->connection().get() );
            ASSERT( mem );

            GridFS safe( db->connection() , db->database() , "testfs" , DOC( "w" << 2 ) );
            Document f = safe.storeFile( "abc" , 3 , "abc.txt" );
            ASSERT_EQUALS( DOC( "w" << 2 ) , mem->lastWriteConcern() );

            fs.storeFile( "d" , 1 , "d.txt" );
            ASSERT( mem->lastWriteConcern().isEmpty() );

            safe.remove( f["_id"].oid() );
            ASSERT_EQUALS( DOC( "w" << 2 ) , mem->lastWriteConcern() );
        }
    };

    /** payloads of a model are written with the save flags of its connection */
    class FieldGridFSUsesSaveFlags : public Base {
    public:
        void run() {
            ConnectionSettings s = dbtests::testSettings();
            s.options = DOC( "OPERATIONS" << DOC( "save" << DOC( "safe" << true << "w" << 2 ) ) );
            DatabaseWrapper w( s );

            boost::shared_ptr<GridFS> g = openGridFS( *dbtests::model( "GridFSFieldTestModel" ) , w );
            g->storeFile( "payload" , 7 , "payload.txt" );

            DBClientMemory* mem = dynamic_cast<DBClientMemory*>( w.connection().get() );
            ASSERT( mem );
            ASSERT_EQUALS( DOC( "safe" << true << "w" << 2 ) , mem->lastWriteConcern() );
            w.disconnect();
        }
    };

    class FieldBase : public Base {
    public:
        FieldBase() : m( dbtests::model( "GridFSFieldTestModel" ) ) ,
                      modelfs( openGridFS( m.descriptor() , *db ) ) {
        }

        unsigned long long modelFiles() {
            return db->connection()->count( modelfs->filesNS() );
        }

        Document stored( const ModelInstance& inst ) {
            return m.collection()->findOne( DOC( "_id" << OID( inst.pk().str() ) ) );
        }

        ModelManager m;
        boost::shared_ptr<GridFS> modelfs;
    };

    class FieldStores : public FieldBase {
    public:
        void run() {
            ASSERT_EQUALS( m.descriptor().collection() + ".files" ,
                           modelfs->filesNS().substr( db->database().size() + 1 ) );

            ModelInstancePtr inst = m.instance();
            inst->set( "gridfile" , "some data" );
            ASSERT( inst->has( "gridfile" ) );
            m.save( *inst );

            Document doc = stored( *inst );
            ASSERT_EQUALS( jstOID , doc["gridfile"].type() );
            ASSERT( ! doc.hasField( "gridfile_versioned" ) );
            ASSERT_EQUALS( 1U , modelFiles() );
            ASSERT_EQUALS( "some data" , modelfs->get( doc["gridfile"].oid() ).read() );
        }
    };

    class FieldLoads : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "loaded" << "gridstring" << "text" ) );

            ModelInstancePtr back = m.getByPk( inst->pk() );
            ASSERT( back->has( "gridfile" ) );
            ASSERT( ! back->gridfs( "gridfile" ).isCached() );
            ASSERT_EQUALS( "loaded" , back->payload( "gridfile" )->read() );
            ASSERT( back->gridfs( "gridfile" ).isCached() );

            ASSERT_EQUALS( String , back->get( "gridstring" ).type() );
            ASSERT_EQUALS( "text" , back->get( "gridstring" ).str() );
            ASSERT_EQUALS( "text" , back->text( "gridstring" ) );

            ASSERT( ! back->has( "gridfile_nodelete" ) );
            ASSERT( back->get( "gridfile_nodelete" ).isNull() );
        }
    };

    class SameObjectBack : public FieldBase {
    public:
        void run() {
            PayloadPtr p( new BytesPayload( "bytes" ) );
            ModelInstancePtr inst = m.instance();
            inst->set( "gridfile" , Value::createReference( p ) );
            ASSERT( inst->get( "gridfile" ).referent() == p );
            m.save( *inst );
            ASSERT( inst->payload( "gridfile" ) == p );
        }
    };

    class ReplaceRemovesOld : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "one" ) );
            OID first = stored( *inst )["gridfile"].oid();

            inst->set( "gridfile" , "two" );
            m.save( *inst );
            OID second = stored( *inst )["gridfile"].oid();

            ASSERT( first != second );
            ASSERT( ! modelfs->exists( first ) );
            ASSERT_EQUALS( "two" , modelfs->get( second ).read() );
            ASSERT_EQUALS( 1U , modelFiles() );
        }
    };

    class VersioningKeepsOld : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile_versioned" << "one" ) );
            OID first = stored( *inst )["gridfile_versioned"].oid();

            inst->set( "gridfile_versioned" , "two" );
            m.save( *inst );
            ASSERT( modelfs->exists( first ) );
            ASSERT_EQUALS( 2U , modelFiles() );
            ASSERT_EQUALS( "two" , m.getByPk( inst->pk() )->text( "gridfile_versioned" ) );
        }
    };

    class ClearRemoves : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "one" ) );
            inst->set( "gridfile" , Value::getNull() );
            m.save( *inst );
            ASSERT( ! stored( *inst ).hasField( "gridfile" ) );
            ASSERT_EQUALS( 0U , modelFiles() );
        }
    };

    class UnchangedNotRewritten : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "one" ) );
            OID first = stored( *inst )["gridfile"].oid();

            ModelInstancePtr back = m.getByPk( inst->pk() );
            m.save( *back );
            ASSERT( first == stored( *inst )["gridfile"].oid() );
            ASSERT_EQUALS( 1U , modelFiles() );
        }
    };

    class CachedReadsSkipStore : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "cached" ) );
            ModelInstancePtr back = m.getByPk( inst->pk() );

            boost::shared_ptr<MemoryStore> store =
                MemoryStore::get( ConnectionHandler::global().get()->connection()->getServerAddress() );
            long long before = store->counters().queries;
            PayloadPtr first = back->payload( "gridfile" );
            long long afterFirst = store->counters().queries;
            ASSERT( afterFirst > before );

            PayloadPtr second = back->payload( "gridfile" );
            ASSERT( first == second );
            ASSERT_EQUALS( afterFirst , store->counters().queries );
        }
    };

    class DeleteRemovesFiles : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "a" << "gridfile_nodelete" << "b" ) );
            OID kept = stored( *inst )["gridfile_nodelete"].oid();
            ASSERT_EQUALS( 2U , modelFiles() );

            m.remove( *inst );
            ASSERT_EQUALS( 1U , modelFiles() );
            ASSERT( modelfs->exists( kept ) );
        }
    };

    class BulkDeleteRemovesFiles : public FieldBase {
    public:
        void run() {
            m.create( DOC( "gridfile" << "a" ) );
            m.create( DOC( "gridfile" << "b" << "gridfile_nodelete" << "c" ) );
            ASSERT_EQUALS( 3U , modelFiles() );

            m.remove( Filter() );
            ASSERT_EQUALS( 0U , m.count() );
            ASSERT_EQUALS( 1U , modelFiles() );
        }
    };

    class EmptyString : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.create( DOC( "gridfile" << "x" ) );
            ASSERT_EQUALS( "" , inst->get( "gridstring" ).str() );
            ASSERT_EQUALS( "" , m.getByPk( inst->pk() )->text( "gridstring" ) );
        }
    };

    class StreamKeepsPosition : public FieldBase {
    public:
        void run() {
            boost::shared_ptr<istream> in( new stringstream( "header|body" ) );
            in->seekg( 7 );
            PayloadPtr p( new StreamPayload( in ) );

            ModelInstancePtr inst = m.instance();
            inst->setPayload( "gridfile" , p );
            ASSERT_EQUALS( "body" , p->read() );
            m.save( *inst );

            ASSERT( in->tellg() == istream::pos_type( 7 ) );
            ASSERT_EQUALS( "body" , m.getByPk( inst->pk() )->payload( "gridfile" )->read() );
        }
    };

    class BadValues : public FieldBase {
    public:
        void run() {
            ModelInstancePtr inst = m.instance();
            ASSERT_THROWS( inst->set( "gridfile" , 5 ) , UserException );
            ASSERT_THROWS( inst->set( "gridfile" , DOC( "a" << 1 ) ) , UserException );
            ASSERT_THROWS( inst->gridfs( "nosuch" ) , UserException );

            ModelManager raws( dbtests::model( "RawModel" ) );
            ASSERT_THROWS( raws.instance()->gridfs( "raw" ) , UserException );
        }
    };

    class UpdatesRestricted : public FieldBase {
    public:
        void run() {
            m.create( DOC( "gridfile" << "x" ) );
            ASSERT_THROWS( m.update( Filter() , UpdateSpec().set( "gridfile" , "y" ) ) , RestrictedOperationError );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "gridfs" ) {
        }

        void setupTests() {
            add< StoreAndRead >();
            add< ManyChunks >();
            add< StoreStream >();
            add< Remove >();
            add< Missing >();
            add< WriteConcernPassed >();
            add< FieldGridFSUsesSaveFlags >();
            add< FieldStores >();
            add< FieldLoads >();
            add< SameObjectBack >();
            add< ReplaceRemovesOld >();
            add< VersioningKeepsOld >();
            add< ClearRemoves >();
            add< UnchangedNotRewritten >();
            add< CachedReadsSkipStore >();
            add< DeleteRemovesFiles >();
            add< BulkDeleteRemovesFiles >();
            add< EmptyString >();
            add< StreamKeepsPosition >();
            add< BadValues >();
            add< UpdatesRestricted >();
        }
    } myall;

}
