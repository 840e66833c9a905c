// connectiontests.cpp : settings, write concern and the connection registry.
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
#include "mongomodel/dbtests/dbtests.h"

#include <algorithm>

#include <boost/bind.hpp>

#include "mongomodel/client/memory_client.h"

namespace ConnectionTests {

    struct Call {
        Call( const string& o , const Document& s , const Document& f ) : op( o ) , spec( s ) , flags( f ) { }
        string op;
        Document spec;
        Document flags;
    };

    /** a DBCollection that remembers its write calls */
    class RecordingCollection : public DBCollection {
    public:
        RecordingCollection( vector<Call>* calls , const boost::shared_ptr<DBClientBase>& client ,
                             const string& db , const string& name )
            : DBCollection( client , db , name ) , _calls( calls ) {
        }

        virtual Value save( const Document& doc , const Document& flags ) {
            _calls->push_back( Call( "save" , doc , flags ) );
            return DBCollection::save( doc , flags );
        }

        virtual void update( const Document& spec , const Document& doc , const Document& flags ) {
            _calls->push_back( Call( "update" , spec , flags ) );
            DBCollection::update( spec , doc , flags );
        }

        virtual void remove( const Document& spec , const Document& flags ) {
            _calls->push_back( Call( "remove" , spec , flags ) );
            DBCollection::remove( spec , flags );
        }

    private:
        vector<Call>* _calls;
    };

    boost::shared_ptr<Collection> newRecordingCollection( vector<Call>* calls , const boost::shared_ptr<DBClientBase>& client ,
                                                   const string& db , const string& name ) {
        return boost::shared_ptr<Collection>( new RecordingCollection( calls , client , db , name ) );
    }

    /** "default" points at a recording wrapper built from options */
    class RecordingBase : public dbtests::ClientBase {
    public:
        RecordingBase( const Document& options , bool debug = false ) {
            ConnectionSettings s = dbtests::testSettings();
            s.options = options;
            s.debug = debug;
            _conn.reset( new ScopedConnection( boost::shared_ptr<DatabaseWrapper>(
                new DatabaseWrapper( s , boost::bind( newRecordingCollection , &_calls , _1 , _2 , _3 ) ) ) ) );
        }

        /** one save, one update, one remove through the model layer */
        void saveUpdateRemove() {
            ModelManager entries( dbtests::model( "Entry" ) );
            ModelInstancePtr e = entries.create( DOC( "title" << "hello" ) );
            entries.update( Q( "title" , "hello" ) , UpdateSpec().inc( "views" ) );
            entries.remove( *e );
        }

        const Call& call( const string& op ) {
            const Call* found = 0;
            for ( unsigned i = 0; i < _calls.size(); i++ ) {
                if ( _calls[i].op != op )
                    continue;
                ASSERT( ! found );
                found = &_calls[i];
            }
            ASSERT( found );
            return *found;
        }

        vector<Call> _calls;
        auto_ptr<ScopedConnection> _conn;
    };

    class FlatOperations {
    public:
        void run() {
            OperationFlags f = OperationFlags::resolve( DOC( "OPERATIONS" << DOC( "safe" << true ) ) );
            ASSERT_EQUALS( DOC( "safe" << true ) , f.get( OP_SAVE ) );
            ASSERT_EQUALS( DOC( "safe" << true ) , f.get( OP_UPDATE ) );
            ASSERT_EQUALS( DOC( "safe" << true ) , f.get( OP_REMOVE ) );
            ASSERT_EQUALS( DOC( "safe" << true << "multi" << true ) , f.forCall( OP_UPDATE ) );
        }
    };

    class PerKindOperations {
    public:
        void run() {
            OperationFlags f = OperationFlags::resolve( DOC( "OPERATIONS" <<
                                                             DOC( "save" << DOC( "safe" << true )
                                                                  << "delete" << DOC( "w" << 2 ) ) ) );
            ASSERT_EQUALS( DOC( "safe" << true ) , f.get( OP_SAVE ) );
            ASSERT( f.get( OP_UPDATE ).isEmpty() );
            ASSERT_EQUALS( DOC( "w" << 2 ) , f.get( OP_REMOVE ) );
            ASSERT_EQUALS( DOC( "multi" << true ) , f.forCall( OP_UPDATE ) );
        }
    };

    class NoOperations {
    public:
        void run() {
            OperationFlags f = OperationFlags::resolve( Document() );
            ASSERT( f.get( OP_SAVE ).isEmpty() );
            ASSERT( f.get( OP_UPDATE ).isEmpty() );
            ASSERT( f.get( OP_REMOVE ).isEmpty() );
            ASSERT( f.forCall( OP_REMOVE ).isEmpty() );
        }
    };

    class LegacyFlags {
    public:
        void run() {
            OperationFlags f = OperationFlags::resolve( DOC( "SAFE_INSERTS" << true << "WAIT_FOR_SLAVES" << 3 ) );
            ASSERT_EQUALS( DOC( "safe" << true << "w" << 3 ) , f.get( OP_SAVE ) );
            ASSERT( f.get( OP_UPDATE ).isEmpty() );
            ASSERT( f.get( OP_REMOVE ).isEmpty() );
        }
    };

    class LegacyFlagsYieldToOperations {
    public:
        void run() {
            OperationFlags f = OperationFlags::resolve( DOC( "SAFE_INSERTS" << true
                                                             << "OPERATIONS" << DOC( "save" << DOC( "safe" << false ) ) ) );
            ASSERT_EQUALS( DOC( "safe" << false ) , f.get( OP_SAVE ) );
        }
    };

    class InvalidOperations {
    public:
        void run() {
            ASSERT_THROWS( OperationFlags::resolve( DOC( "OPERATIONS" << 5 ) ) , UserException );
            ASSERT_THROWS( OperationFlags::resolve( DOC( "OPERATIONS" << DOC( "save" << true ) ) ) , UserException );
        }
    };

    class ClientOptionsFromSettings {
    public:
        void run() {
            ClientOptions o = clientOptionsFromSettings( DOC( "SLAVE_OKAY" << true << "NETWORK_TIMEOUT" << 2.5
                                                              << "TZ_AWARE" << true << "DOCUMENT_CLASS" << "SON"
                                                              << "OPERATIONS" << DOC( "safe" << true ) ) );
            ASSERT( o.slaveOk );
            ASSERT_EQUALS( 2.5 , o.networkTimeout );
            ASSERT( o.tzAware );
            ASSERT_EQUALS( "SON" , o.documentClass );

            ASSERT_THROWS( clientOptionsFromSettings( DOC( "NETWORK_TIMEOUT" << "soon" ) ) , UserException );
        }
    };

    class DriverSeesOptions {
    public:
        void run() {
            ConnectionSettings s = dbtests::testSettings();
            s.options = DOC( "SLAVE_OKAY" << true << "NETWORK_TIMEOUT" << 10 );
            DatabaseWrapper w( s );
            ASSERT( ! w.isConnected() );
            boost::shared_ptr<DBClientBase> c = w.connection();
            ASSERT( w.isConnected() );
            ASSERT( c->options().slaveOk );
            ASSERT_EQUALS( 10.0 , c->options().networkTimeout );
            ASSERT( ! c->options().tzAware );
            w.disconnect();
            ASSERT( ! w.isConnected() );
        }
    };

    class SaveFlags : public RecordingBase {
    public:
        SaveFlags() : RecordingBase( DOC( "OPERATIONS" << DOC( "save" << DOC( "safe" << true ) ) ) ) {}
        void run() {
            saveUpdateRemove();
            ASSERT_EQUALS( 3U , _calls.size() );
            ASSERT_EQUALS( DOC( "safe" << true ) , call( "save" ).flags );
            ASSERT_EQUALS( DOC( "multi" << true ) , call( "update" ).flags );
            ASSERT( call( "remove" ).flags.isEmpty() );
        }
    };

    class FlatFlags : public RecordingBase {
    public:
        FlatFlags() : RecordingBase( DOC( "OPERATIONS" << DOC( "w" << 2 << "fsync" << true ) ) ) {}
        void run() {
            saveUpdateRemove();
            ASSERT_EQUALS( DOC( "w" << 2 << "fsync" << true ) , call( "save" ).flags );
            ASSERT_EQUALS( DOC( "w" << 2 << "fsync" << true << "multi" << true ) , call( "update" ).flags );
            ASSERT_EQUALS( DOC( "w" << 2 << "fsync" << true ) , call( "remove" ).flags );
        }
    };

    class PerKindFlags : public RecordingBase {
    public:
        PerKindFlags() : RecordingBase( DOC( "OPERATIONS" << DOC( "update" << DOC( "safe" << true )
                                                                  << "delete" << DOC( "w" << 3 ) ) ) ) {}
        void run() {
            saveUpdateRemove();
            ASSERT( call( "save" ).flags.isEmpty() );
            ASSERT_EQUALS( DOC( "safe" << true << "multi" << true ) , call( "update" ).flags );
            ASSERT_EQUALS( DOC( "w" << 3 ) , call( "remove" ).flags );
        }
    };

    class LegacySaveFlags : public RecordingBase {
    public:
        LegacySaveFlags() : RecordingBase( DOC( "SAFE_INSERTS" << true << "WAIT_FOR_SLAVES" << 2 ) ) {}
        void run() {
            saveUpdateRemove();
            ASSERT_EQUALS( DOC( "safe" << true << "w" << 2 ) , call( "save" ).flags );
            ASSERT_EQUALS( DOC( "multi" << true ) , call( "update" ).flags );
            ASSERT( call( "remove" ).flags.isEmpty() );
        }
    };

    class WriteConcernReachesDriver : public RecordingBase {
    public:
        WriteConcernReachesDriver() : RecordingBase( DOC( "OPERATIONS" << DOC( "update" << DOC( "w" << 2 ) ) ) ) {}
        void run() {
            ModelManager entries( dbtests::model( "Entry" ) );
            entries.create( DOC( "title" << "a" ) );
            entries.update( Q( "title" , "a" ) , UpdateSpec().set( "title" , "b" ) );

            DBClientMemory* driver = dynamic_cast<DBClientMemory*>( (*_conn)->connection().get() );
            ASSERT( driver );
            ASSERT_EQUALS( DOC( "w" << 2 ) , driver->lastWriteConcern() );
        }
    };

    class DebugWrapper : public RecordingBase {
    public:
        DebugWrapper() : RecordingBase( Document() , true ) {}
        void run() {
            boost::shared_ptr<Collection> c = (*_conn)->getCollection( "entry" );
            CollectionDebugWrapper* debug = dynamic_cast<CollectionDebugWrapper*>( c.get() );
            ASSERT( debug );
            ASSERT( dynamic_cast<RecordingCollection*>( debug->wrapped().get() ) );
            ASSERT_EQUALS( "test_mongomodel.entry" , c->ns() );

            dbtests::LogCapture capture;
            c->save( DOC( "a" << 1 ) );
            ASSERT_EQUALS( 1U , _calls.size() );
            ASSERT_EQUALS( 1U , c->count() );

            ASSERT_EQUALS( 1 , capture.count( "test_mongomodel.entry.save( { a: 1 }" ) );
            ASSERT_EQUALS( 1 , capture.count( "test_mongomodel.entry.count( {} ) = 1" ) );
        }
    };

    class NoDebugWrapper {
    public:
        void run() {
            DatabaseWrapper w( dbtests::testSettings() );
            boost::shared_ptr<Collection> c = w.getCollection( "entry" );
            ASSERT( ! dynamic_cast<CollectionDebugWrapper*>( c.get() ) );
            ASSERT( dynamic_cast<DBCollection*>( c.get() ) );

            dbtests::LogCapture capture;
            w.connect();
            c->count();
            ASSERT_EQUALS( 0 , capture.count( ".count(" ) );
            w.disconnect();
        }
    };

    class UnknownDriver {
    public:
        void run() {
            ConnectionSettings s = dbtests::testSettings();
            s.driver = "nosuchdriver";
            DatabaseWrapper w( s );
            ASSERT_THROWS( w.connect() , UserException );
            ASSERT( ! w.isConnected() );
            ASSERT( DBClientFactory::global().hasDriver( "memory" ) );
            ASSERT( DBClientFactory::global().hasDriver( "mongodb" ) );
            ASSERT( ! DBClientFactory::global().hasDriver( "nosuchdriver" ) );
        }
    };

    int countingCreated = 0;

    DBClientBase* newCountingClient( const ClientOptions& options ) {
        countingCreated++;
        return new DBClientMemory( options );
    }

    class RegisteredDriver {
    public:
        void run() {
            DBClientFactory::global().registerDriver( "counting" , newCountingClient );
            ASSERT( DBClientFactory::global().hasDriver( "counting" ) );

            ConnectionSettings s = dbtests::testSettings();
            s.driver = "counting";
            int before = countingCreated;
            DatabaseWrapper w( s );
            w.connect();
            w.connect();
            ASSERT_EQUALS( before + 1 , countingCreated );
            ASSERT_EQUALS( "localhost:27017" , w.connection()->getServerAddress() );
            w.disconnect();
        }
    };

    class NoDatabaseName {
    public:
        void run() {
            ConnectionSettings s = dbtests::testSettings();
            s.name = "";
            DatabaseWrapper w( s );
            ASSERT_THROWS( w.connect() , UserException );
        }
    };

    class Authentication {
    public:
        void run() {
            MemoryStore::get( "authhost:27017" )->addUser( "secured" , "joe" , "secret" );

            ConnectionSettings s = dbtests::testSettings();
            s.host = "authhost";
            s.name = "secured";
            s.user = "joe";
            s.password = "wrong";
            DatabaseWrapper bad( s );
            ASSERT_THROWS( bad.connect() , UserException );
            ASSERT( ! bad.isConnected() );

            s.password = "secret";
            DatabaseWrapper good( s );
            good.connect();
            ASSERT( good.isConnected() );
        }
    };

    class Registry {
    public:
        void run() {
            ConnectionHandler& h = ConnectionHandler::global();
            ASSERT( ! h.has( "registrytest" ) );
            ASSERT_THROWS( h.get( "registrytest" ) , UserException );

            boost::shared_ptr<DatabaseWrapper> first = h.configure( "registrytest" , dbtests::testSettings() );
            ASSERT( h.has( "registrytest" ) );
            ASSERT( h.get( "registrytest" ) == first );
            vector<string> aliases = h.aliases();
            ASSERT( find( aliases.begin() , aliases.end() , "registrytest" ) != aliases.end() );

            first->connect();
            boost::shared_ptr<DatabaseWrapper> second = h.configure( "registrytest" , dbtests::testSettings() );
            ASSERT( ! first->isConnected() );
            ASSERT( h.get( "registrytest" ) == second );

            h.swap( "registrytest" , boost::shared_ptr<DatabaseWrapper>() );
            ASSERT( ! h.has( "registrytest" ) );
        }
    };

    class ScopedRestores {
    public:
        void run() {
            boost::shared_ptr<DatabaseWrapper> before = ConnectionHandler::global().get();
            boost::shared_ptr<DatabaseWrapper> scoped( new DatabaseWrapper( dbtests::testSettings() ) );
            {
                ScopedConnection c( scoped );
                ASSERT( ConnectionHandler::global().get() == scoped );
                ASSERT( scoped->isConnected() );
            }
            ASSERT( ! scoped->isConnected() );
            ASSERT( ConnectionHandler::global().get() == before );

            try {
                ScopedConnection c( scoped );
                uasserted( 16999 , "leaving through an exception" );
            }
            catch ( UserException& e ) {
                ASSERT_EQUALS( 16999 , e.getCode() );
            }
            ASSERT( ConnectionHandler::global().get() == before );
        }
    };

    class ScopedFailedConnect {
    public:
        void run() {
            boost::shared_ptr<DatabaseWrapper> before = ConnectionHandler::global().get();
            ConnectionSettings s = dbtests::testSettings();
            s.driver = "nosuchdriver";
            ASSERT_THROWS( ScopedConnection c( boost::shared_ptr<DatabaseWrapper>( new DatabaseWrapper( s ) ) ) , UserException );
            ASSERT( ConnectionHandler::global().get() == before );
        }
    };

    class AutomaticReferencingSetting {
    public:
        void run() {
            ConnectionSettings s = dbtests::testSettings();
            DatabaseWrapper off( s );
            ASSERT( ! off.automaticReferencing() );
            s.automaticReferencing = true;
            DatabaseWrapper on( s );
            ASSERT( on.automaticReferencing() );
            on.setAutomaticReferencing( false );
            ASSERT( ! on.automaticReferencing() );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "connection" ) {
        }

        void setupTests() {
            add< FlatOperations >();
            add< PerKindOperations >();
            add< NoOperations >();
            add< LegacyFlags >();
            add< LegacyFlagsYieldToOperations >();
            add< InvalidOperations >();
            add< ClientOptionsFromSettings >();
            add< DriverSeesOptions >();
            add< SaveFlags >();
            add< FlatFlags >();
            add< PerKindFlags >();
            add< LegacySaveFlags >();
            add< WriteConcernReachesDriver >();
            add< DebugWrapper >();
            add< NoDebugWrapper >();
            add< UnknownDriver >();
            add< RegisteredDriver >();
            add< NoDatabaseName >();
            add< Authentication >();
            add< Registry >();
            add< ScopedRestores >();
            add< ScopedFailedConnect >();
            add< AutomaticReferencingSetting >();
        }
    } myall;

}
