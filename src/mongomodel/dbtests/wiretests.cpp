// wiretests.cpp : BSON encoding, SCRAM and the mongodb driver against a local OP_MSG server.
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

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <boost/thread/thread.hpp>

#include "mongomodel/bson/bson_codec.h"
#include "mongomodel/client/dbclient_connection.h"
#include "mongomodel/client/memory_client.h"
#include "mongomodel/client/sasl_scram.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/index/index_synchronizer.h"
#include "mongomodel/util/message.h"
#include "mongomodel/util/sock.h"

namespace WireTests {

    namespace Codec {

        class KnownBytes {
        public:
            void run() {
                const char a[] = { 0x0c , 0 , 0 , 0 , 0x10 , 'a' , 0 , 1 , 0 , 0 , 0 , 0 };
                ASSERT_EQUALS( string( a , sizeof( a ) ) , toBSON( DOC( "a" << 1 ) ) );

                const char s[] = { 0x0f , 0 , 0 , 0 , 0x02 , 's' , 0 , 3 , 0 , 0 , 0 , 'h' , 'i' , 0 , 0 };
                ASSERT_EQUALS( string( s , sizeof( s ) ) , toBSON( DOC( "s" << "hi" ) ) );

                ASSERT_EQUALS( string( "\x05\x00\x00\x00\x00" , 5 ) , toBSON( Document() ) );
            }
        };

        class RoundTrip {
        public:
            void run() {
                vector<Value> tags;
                tags.push_back( Value( "x" ) );
                tags.push_back( Value( 2.5 ) );
                OID id = OID::gen();
                Document d = DOC( "_id" << id
                                  << "n" << 7
                                  << "big" << ( 1LL << 40 )
                                  << "ok" << true
                                  << "when" << Value::createDate( 1300000000000LL )
                                  << "tags" << Value::createArray( tags )
                                  << "sub" << DOC( "re" << Value::createRegex( "^a" , "i" ) << "none" << Value::getNull() )
                                  << "bin" << Value::createBinData( string( "\x00\x01\x02" , 3 ) ) );

                string bytes = toBSON( d );
                int consumed = 0;
                Document back = fromBSON( bytes.data() , (int) bytes.size() , &consumed );
                ASSERT_EQUALS( (int) bytes.size() , consumed );
                ASSERT_EQUALS( d , back );
                ASSERT_EQUALS( id , back["_id"].oid() );
                ASSERT_EQUALS( NumberLong , back["big"].type() );
            }
        };

        class TimestampReadsAsLong {
        public:
            void run() {
                const char t[] = { 0x10 , 0 , 0 , 0 , 0x11 , 't' , 0 , 1 , 0 , 0 , 0 , 2 , 0 , 0 , 0 , 0 };
                Document d = fromBSON( t , sizeof( t ) );
                ASSERT_EQUALS( NumberLong , d["t"].type() );
                ASSERT_EQUALS( 8589934593LL , d["t"].numberLong() );
            }
        };

        class Malformed {
        public:
            void run() {
                string good = toBSON( DOC( "s" << "hi" ) );
                ASSERT_THROWS( fromBSON( good.data() , (int) good.size() - 3 ) , UserException );

                string unterminated = good;
                unterminated[ unterminated.size() - 1 ] = 1;
                ASSERT_THROWS( fromBSON( unterminated.data() , (int) unterminated.size() ) , UserException );

                // decimal128 is not understood
                char dec[ 4 + 1 + 2 + 16 + 1 ];
                memset( dec , 0 , sizeof( dec ) );
                dec[0] = sizeof( dec );
                dec[4] = 0x13;
                dec[5] = 'd';
                ASSERT_THROWS( fromBSON( dec , sizeof( dec ) ) , UserException );
            }
        };

        class LiveReferenceRefused {
            class Thing : public Referent {
            public:
                virtual string toString() const { return "Thing"; }
            };
        public:
            void run() {
                boost::shared_ptr<Referent> r( new Thing() );
                ASSERT_THROWS( toBSON( DOC( "owner" << Value::createReference( r ) ) ) , MsgAssertionException );
            }
        };

    }

    namespace Scram {

        const char *rfcNonce = "fyko+d2lbbFgONRv9qkxdawL";
        const char *rfcServerFirst = "r=fyko+d2lbbFgONRv9qkxdawL3rfcNHYJY1ZVvWVs7j,s=QSXCR+Q6sek8bf92,i=4096";

        /** the exchange from RFC 5802 section 5 */
        class RfcExchange {
        public:
            void run() {
                ScramSHA1ClientConversation c( "user" , "pencil" , rfcNonce );
                ASSERT_EQUALS( string( "n,,n=user,r=fyko+d2lbbFgONRv9qkxdawL" ) , c.firstMessage() );
                ASSERT_EQUALS( string( "c=biws,r=fyko+d2lbbFgONRv9qkxdawL3rfcNHYJY1ZVvWVs7j,p=v0X8v3Bz2T0CJGbJQyF0X+HI4Ts=" ) ,
                               c.finalMessage( rfcServerFirst ) );
                c.verifyServerFinal( "v=rmF9pqV8S7suAoZWja4dJRkFsKQ=" );
            }
        };

        class BadServerSignature {
        public:
            void run() {
                ScramSHA1ClientConversation c( "user" , "pencil" , rfcNonce );
                c.firstMessage();
                c.finalMessage( rfcServerFirst );
                ASSERT_THROWS( c.verifyServerFinal( "v=AAAAAAAAAAAAAAAAAAAAAAAAAAA=" ) , UserException );
            }
        };

        class ForeignNonce {
        public:
            void run() {
                ScramSHA1ClientConversation c( "user" , "pencil" , rfcNonce );
                c.firstMessage();
                ASSERT_THROWS( c.finalMessage( "r=somebodyelse,s=QSXCR+Q6sek8bf92,i=4096" ) , UserException );
            }
        };

        class ServerError {
        public:
            void run() {
                ScramSHA1ClientConversation c( "user" , "pencil" , rfcNonce );
                c.firstMessage();
                c.finalMessage( rfcServerFirst );
                try {
                    c.verifyServerFinal( "e=invalid-proof" );
                    FAIL( "no exception" );
                }
                catch ( UserException& e ) {
                    ASSERT_EQUALS( 18 , e.getCode() );
                }
            }
        };

        class Helpers {
        public:
            void run() {
                ASSERT_EQUALS( string( "d8a52a85662d5f525026b525e992b8e2" ) ,
                               ScramSHA1ClientConversation::hashPassword( "joe" , "pw" ) );
                ASSERT_EQUALS( string( "a=3D=2Cb=2Cc" ) , ScramSHA1ClientConversation::encodeUsername( "a=,b,c" ) );
                ASSERT_EQUALS( string( "cGVuY2ls" ) , base64Encode( "pencil" ) );
                ASSERT_EQUALS( string( "pencil" ) , base64Decode( "cGVuY2ls" ) );

                ScramSHA1ClientConversation c( "joe" , "x" );
                string first = c.firstMessage();
                ASSERT_EQUALS( 0U , first.find( "n,,n=joe,r=" ) );
                ASSERT( first.size() > string( "n,,n=joe,r=" ).size() );
            }
        };

    }

    class WriteConcernTranslation {
    public:
        void run() {
            ASSERT_EQUALS( Document() , DBClientConnection::translateWriteConcern( Document() ) );
            ASSERT_EQUALS( Document() , DBClientConnection::translateWriteConcern( DOC( "safe" << true ) ) );
            ASSERT_EQUALS( DOC( "w" << 0 ) , DBClientConnection::translateWriteConcern( DOC( "safe" << false ) ) );
            ASSERT_EQUALS( DOC( "w" << 2 << "wtimeout" << 100 ) ,
                           DBClientConnection::translateWriteConcern( DOC( "safe" << true << "w" << 2 << "wtimeout" << 100 ) ) );
            ASSERT_EQUALS( DOC( "j" << true ) , DBClientConnection::translateWriteConcern( DOC( "fsync" << true ) ) );
            ASSERT_EQUALS( Document() , DBClientConnection::translateWriteConcern( DOC( "fsync" << false << "bogus" << 1 ) ) );
        }
    };

    /**
       answers OP_MSG commands on 127.0.0.1 out of a memory store.
       one connection at a time, every command received is kept.
     */
    class WireServer : boost::noncopyable {
    public:
        WireServer( int maxWireVersion = 17 )
            : _maxWireVersion( maxWireVersion ) , _listen( -1 ) , _conn( -1 ) , _port( 0 ) , _stop( false ) {
            _listen = ::socket( AF_INET , SOCK_STREAM , 0 );
            verify( _listen >= 0 );
            int one = 1;
            ::setsockopt( _listen , SOL_SOCKET , SO_REUSEADDR , &one , sizeof( one ) );

            sockaddr_in a;
            memset( &a , 0 , sizeof( a ) );
            a.sin_family = AF_INET;
            a.sin_addr.s_addr = htonl( INADDR_LOOPBACK );
            a.sin_port = 0;
            verify( ::bind( _listen , (sockaddr*) &a , sizeof( a ) ) == 0 );
            verify( ::listen( _listen , 5 ) == 0 );
            socklen_t len = sizeof( a );
            verify( ::getsockname( _listen , (sockaddr*) &a , &len ) == 0 );
            _port = ntohs( a.sin_port );

            static int stores = 0;
            stringstream host;
            host << "wire" << ++stores;
            _backend.connect( host.str() , _port );

            _thread.reset( new boost::thread( boost::bind( &WireServer::serve , this ) ) );
        }

        ~WireServer() {
            {
                mongomodel::scoped_lock lk( _m );
                _stop = true;
                if ( _conn >= 0 )
                    ::shutdown( _conn , SHUT_RDWR );
            }
            ::shutdown( _listen , SHUT_RDWR );
            _thread->join();
            ::close( _listen );
        }

        int port() const { return _port; }

        /** the last command called name, empty if there was none */
        Document lastCommand( const string& name ) {
            mongomodel::scoped_lock lk( _m );
            for ( vector<Document>::reverse_iterator i = _commands.rbegin(); i != _commands.rend(); ++i )
                if ( i->begin()->name == name )
                    return *i;
            return Document();
        }

        bool saw( const string& name ) { return ! lastCommand( name ).isEmpty(); }

    private:
        void serve() {
            while ( true ) {
                int fd = ::accept( _listen , 0 , 0 );
                if ( fd < 0 ) {
                    if ( errno == EINTR )
                        continue;
                    return;
                }
                {
                    mongomodel::scoped_lock lk( _m );
                    if ( _stop ) {
                        ::close( fd );
                        return;
                    }
                    _conn = fd;
                }

                auto_ptr<Socket> s( new Socket( fd , SockAddr() ) );
                try {
                    while ( true ) {
                        MsgHeader h;
                        Document cmd = recvOpMsg( *s , &h );
                        sayOpMsg( *s , reply( cmd ) , h.id );
                    }
                }
                catch ( SocketException& e ) {
                    LOG(1) << "wire server connection ended: " << e.toString() << endl;
                }
                catch ( DBException& e ) {
                    log() << "wire server dropped a connection: " << e.toString() << endl;
                }

                {
                    mongomodel::scoped_lock lk( _m );
                    _conn = -1;
                }
                s.reset();
            }
        }

        static Document failure( int code , const string& errmsg ) {
            return DOC( "ok" << 0.0 << "errmsg" << errmsg << "code" << code );
        }

        static Document cursorReply( const string& batchName , const vector<Document>& docs ,
                                     long long id , const string& ns ) {
            vector<Value> batch;
            for ( unsigned i = 0; i < docs.size(); i++ )
                batch.push_back( Value( docs[i] ) );
            return DOC( "cursor" << DOC( batchName << Value::createArray( batch ) << "id" << id << "ns" << ns )
                        << "ok" << 1.0 );
        }

        static int intField( const Document& d , const string& name ) {
            return d[name].isNumber() ? d[name].numberInt() : 0;
        }

        static vector<Document> drain( auto_ptr<DBClientCursor> c ) {
            vector<Document> docs;
            while ( c->more() )
                docs.push_back( c->next() );
            return docs;
        }

        Document reply( const Document& cmd ) {
            {
                mongomodel::scoped_lock lk( _m );
                _commands.push_back( cmd );
            }
            try {
                return run( cmd );
            }
            catch ( DBException& e ) {
                return failure( e.getCode() , e.what() );
            }
        }

        Document run( const Document& cmd ) {
            string name = cmd.begin()->name;
            string db = cmd["$db"].str();
            string ns = db + "." + ( cmd.begin()->value.type() == String ? cmd.begin()->value.str() : "" );

            if ( name == "isMaster" || name == "ismaster" )
                return DOC( "ismaster" << true << "maxWireVersion" << _maxWireVersion << "minWireVersion" << 0 << "ok" << 1.0 );

            if ( name == "find" ) {
                Query q( cmd["filter"].isDocument() ? cmd["filter"].embeddedObject() : Document() );
                if ( cmd["sort"].isDocument() )
                    q.sort( cmd["sort"].embeddedObject() );
                vector<Document> docs = drain( _backend.query( ns , q , intField( cmd , "limit" ) , intField( cmd , "skip" ) ) );

                // two per batch so that getMore gets used
                vector<Document> first;
                _pending.clear();
                for ( unsigned i = 0; i < docs.size(); i++ )
                    ( i < 2 ? first : _pending ).push_back( docs[i] );
                return cursorReply( "firstBatch" , first , _pending.empty() ? 0 : 77 , ns );
            }

            if ( name == "getMore" ) {
                if ( cmd["getMore"].numberLong() != 77 )
                    return failure( 43 , "cursor not found" );
                vector<Document> rest = _pending;
                _pending.clear();
                return cursorReply( "nextBatch" , rest , 0 , db + "." + cmd["collection"].str() );
            }

            if ( name == "insert" ) {
                vector<Value> docs = cmd["documents"].array();
                for ( unsigned i = 0; i < docs.size(); i++ ) {
                    try {
                        _backend.insert( ns , docs[i].embeddedObject() );
                    }
                    catch ( DuplicateKeyError& e ) {
                        vector<Value> errors;
                        errors.push_back( Value( DOC( "index" << (int) i << "code" << 11000 << "errmsg" << e.what() ) ) );
                        return DOC( "n" << (int) i << "writeErrors" << Value::createArray( errors ) << "ok" << 1.0 );
                    }
                }
                return DOC( "n" << (int) docs.size() << "ok" << 1.0 );
            }

            if ( name == "update" ) {
                Document u = cmd["updates"].array()[0].embeddedObject();
                _backend.update( ns , Query( u["q"].embeddedObject() ) , u["u"].embeddedObject() ,
                                 u["upsert"].trueValue() , u["multi"].trueValue() );
                return DOC( "n" << 1 << "nModified" << 1 << "ok" << 1.0 );
            }

            if ( name == "delete" ) {
                Document d = cmd["deletes"].array()[0].embeddedObject();
                _backend.remove( ns , Query( d["q"].embeddedObject() ) , intField( d , "limit" ) == 1 );
                return DOC( "n" << 1 << "ok" << 1.0 );
            }

            if ( name == "count" ) {
                Document query = cmd["query"].isDocument() ? cmd["query"].embeddedObject() : Document();
                long long n = _backend.count( ns , query , intField( cmd , "limit" ) , intField( cmd , "skip" ) );
                return DOC( "n" << n << "ok" << 1.0 );
            }

            if ( name == "listIndexes" ) {
                if ( ! exists( db , ns ) )
                    return failure( 26 , "ns does not exist: " + ns );
                vector<Document> indexes = drain( _backend.getIndexes( ns ) );
                for ( unsigned i = 0; i < indexes.size(); i++ )
                    indexes[i].remove( "ns" );
                return cursorReply( "firstBatch" , indexes , 0 , ns );
            }

            if ( name == "createIndexes" ) {
                vector<Value> indexes = cmd["indexes"].array();
                for ( unsigned i = 0; i < indexes.size(); i++ )
                    _backend.createIndex( ns , indexes[i].embeddedObject() );
                return DOC( "ok" << 1.0 );
            }

            if ( name == "drop" ) {
                if ( ! _backend.dropCollection( ns ) )
                    return failure( 26 , "ns not found" );
                return DOC( "ok" << 1.0 );
            }

            if ( name == "listCollections" ) {
                vector<Document> colls;
                colls.push_back( DOC( "name" << "system.profile" ) );
                list<string> names = _backend.getCollectionNames( db );
                for ( list<string>::iterator i = names.begin(); i != names.end(); ++i )
                    colls.push_back( DOC( "name" << i->substr( db.size() + 1 ) ) );
                return cursorReply( "firstBatch" , colls , 0 , db + ".$cmd.listCollections" );
            }

            if ( name == "saslStart" )
                return failure( 18 , "Authentication failed." );

            return failure( 59 , "no such command: '" + name + "'" );
        }

        bool exists( const string& db , const string& ns ) {
            list<string> names = _backend.getCollectionNames( db );
            return find( names.begin() , names.end() , ns ) != names.end();
        }

        int _maxWireVersion;
        int _listen;
        int _conn;
        int _port;
        bool _stop;
        mongomodel::mutex _m;
        vector<Document> _commands;
        vector<Document> _pending;
        DBClientMemory _backend;
        boost::scoped_ptr<boost::thread> _thread;
    };

    ClientOptions testOptions() {
        ClientOptions o;
        o.networkTimeout = 10;
        return o;
    }

    const char *ns = "wiretest.things";

    class Handshake {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );
            ASSERT( c.isConnected() );
            ASSERT_EQUALS( 17 , c.serverInfo()["maxWireVersion"].numberInt() );
            ASSERT_EQUALS( string( "admin" ) , server.lastCommand( "isMaster" )["$db"].str() );
            c.disconnect();
            ASSERT( ! c.isConnected() );
        }
    };

    class OldServerRefused {
    public:
        void run() {
            WireServer server( 5 );
            DBClientConnection c( testOptions() );
            ASSERT_THROWS( c.connect( "127.0.0.1" , server.port() ) , ConnectException );
            ASSERT( ! c.isConnected() );
        }
    };

    class NothingListening {
    public:
        void run() {
            int port;
            {
                WireServer gone;
                port = gone.port();
            }
            DBClientConnection c( testOptions() );
            ASSERT_THROWS( c.connect( "127.0.0.1" , port ) , ConnectException );
            ASSERT_THROWS( c.insert( ns , DOC( "a" << 1 ) ) , UserException );
        }
    };

    class Crud {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );

            for ( int i = 0; i < 5; i++ )
                c.insert( ns , DOC( "_id" << i << "x" << i * 10 ) );

            auto_ptr<DBClientCursor> cursor = c.query( ns , Query( DOC( "x" << DOC( "$gte" << 10 ) ) ).sort( "x" , -1 ) );
            ASSERT( cursor->more() );
            ASSERT_EQUALS( 40 , cursor->next()["x"].numberInt() );
            ASSERT_EQUALS( 3 , cursor->itcount() );
            ASSERT( server.saw( "getMore" ) );
            ASSERT_EQUALS( DOC( "x" << -1 ) , server.lastCommand( "find" )["sort"].embeddedObject() );

            ASSERT_EQUALS( 30 , c.findOne( ns , QUERY( "_id" << 3 ) )["x"].numberInt() );
            ASSERT( c.findOne( ns , QUERY( "_id" << 99 ) ).isEmpty() );

            ASSERT_EQUALS( 5ULL , c.count( ns ) );
            ASSERT_EQUALS( 2ULL , c.count( ns , DOC( "x" << DOC( "$lt" << 20 ) ) ) );

            c.update( ns , QUERY( "_id" << 3 ) , DOC( "$set" << DOC( "x" << 31 ) ) );
            ASSERT_EQUALS( 31 , c.findOne( ns , QUERY( "_id" << 3 ) )["x"].numberInt() );

            c.remove( ns , QUERY( "x" << DOC( "$lt" << 20 ) ) );
            ASSERT_EQUALS( 3ULL , c.count( ns ) );
            ASSERT_EQUALS( 0 , server.lastCommand( "delete" )["deletes"].array()[0].embeddedObject()["limit"].numberInt() );

            ASSERT_THROWS( c.insert( ns , DOC( "_id" << 3 ) ) , DuplicateKeyError );
            ASSERT( c.isConnected() );
        }
    };

    class Indexes {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );

            // a missing collection has no indexes rather than an error
            ASSERT_EQUALS( 0 , c.getIndexes( ns )->itcount() );

            c.insert( ns , DOC( "a" << 1 ) );
            ASSERT( c.ensureIndex( ns , DOC( "a" << 1 ) , true ) );
            Document sent = server.lastCommand( "createIndexes" )["indexes"].array()[0].embeddedObject();
            ASSERT( ! sent.hasField( "ns" ) );
            ASSERT_EQUALS( string( "a_1" ) , sent["name"].str() );

            auto_ptr<DBClientCursor> indexes = c.getIndexes( ns );
            int n = 0;
            while ( indexes->more() ) {
                Document i = indexes->next();
                ASSERT_EQUALS( string( ns ) , i["ns"].str() );
                if ( i["name"].str() == "a_1" )
                    ASSERT( i["unique"].trueValue() );
                n++;
            }
            ASSERT_EQUALS( 2 , n );

            ASSERT_THROWS( c.insert( ns , DOC( "a" << 1 ) ) , DuplicateKeyError );

            list<string> names = c.getCollectionNames( "wiretest" );
            ASSERT_EQUALS( 1U , names.size() );
            ASSERT_EQUALS( string( ns ) , names.front() );

            ASSERT( c.dropCollection( ns ) );
            ASSERT( ! c.dropCollection( ns ) );
            ASSERT( c.getCollectionNames( "wiretest" ).empty() );
        }
    };

    class WriteConcernSent {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );

            c.insert( ns , DOC( "a" << 1 ) , DOC( "safe" << true << "w" << 2 << "fsync" << true ) );
            ASSERT_EQUALS( DOC( "w" << 2 << "j" << true ) , server.lastCommand( "insert" )["writeConcern"].embeddedObject() );

            c.remove( ns , QUERY( "a" << 1 ) , true , DOC( "safe" << false ) );
            ASSERT_EQUALS( DOC( "w" << 0 ) , server.lastCommand( "delete" )["writeConcern"].embeddedObject() );

            c.insert( ns , DOC( "a" << 2 ) );
            ASSERT( ! server.lastCommand( "insert" ).hasField( "writeConcern" ) );
        }
    };

    class SlaveOkReads {
    public:
        void run() {
            WireServer server;
            ClientOptions o = testOptions();
            o.slaveOk = true;
            DBClientConnection c( o );
            c.connect( "127.0.0.1" , server.port() );

            c.insert( ns , DOC( "a" << 1 ) );
            ASSERT_EQUALS( 1 , c.query( ns , Query() )->itcount() );
            ASSERT_EQUALS( DOC( "mode" << "secondaryPreferred" ) ,
                           server.lastCommand( "find" )["$readPreference"].embeddedObject() );
            ASSERT( ! server.lastCommand( "insert" ).hasField( "$readPreference" ) );
        }
    };

    class CommandFailure {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );
            try {
                c.runCommand( "wiretest" , DOC( "frobnicate" << 1 ) );
                FAIL( "no exception" );
            }
            catch ( UserException& e ) {
                ASSERT_EQUALS( 59 , e.getCode() );
                ASSERT( string( e.what() ).find( "frobnicate" ) != string::npos );
            }
            // a failed command leaves the connection usable
            ASSERT_EQUALS( 0ULL , c.count( ns ) );
        }
    };

    class AuthRefused {
    public:
        void run() {
            WireServer server;
            DBClientConnection c( testOptions() );
            c.connect( "127.0.0.1" , server.port() );

            string errmsg;
            ASSERT( ! c.auth( "wiretest" , "joe" , "pw" , errmsg ) );
            ASSERT( errmsg.find( "Authentication failed" ) != string::npos );

            Document start = server.lastCommand( "saslStart" );
            ASSERT_EQUALS( string( "SCRAM-SHA-1" ) , start["mechanism"].str() );
            ASSERT_EQUALS( 0U , start["payload"].binData().find( "n,,n=joe,r=" ) );
            ASSERT( c.isConnected() );
        }
    };

    /** the default driver of a DatabaseWrapper talks to the server */
    class ThroughDatabaseWrapper {
    public:
        void run() {
            WireServer server;
            ConnectionSettings s;
            s.host = "127.0.0.1";
            s.port = server.port();
            s.name = "wiretest";
            ASSERT_EQUALS( string( "mongodb" ) , s.driver );

            boost::shared_ptr<DatabaseWrapper> db( new DatabaseWrapper( s ) );
            IndexSynchronizer sync( db );
            vector<IndexDefinition> done = sync.sync( *dbtests::model( "IndexTestModel2" ) );
            ASSERT_EQUALS( 1U , done.size() );
            ASSERT( done[0].created );
            ASSERT( server.saw( "createIndexes" ) );

            vector<IndexDefinition> again = sync.sync( *dbtests::model( "IndexTestModel2" ) );
            ASSERT( ! again[0].created );
            db->disconnect();
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "wire" ) {
        }

        void setupTests() {
            add< Codec::KnownBytes >();
            add< Codec::RoundTrip >();
            add< Codec::TimestampReadsAsLong >();
            add< Codec::Malformed >();
            add< Codec::LiveReferenceRefused >();
            add< Scram::RfcExchange >();
            add< Scram::BadServerSignature >();
            add< Scram::ForeignNonce >();
            add< Scram::ServerError >();
            add< Scram::Helpers >();
            add< WriteConcernTranslation >();
            add< Handshake >();
            add< OldServerRefused >();
            add< NothingListening >();
            add< Crud >();
            add< Indexes >();
            add< WriteConcernSent >();
            add< SlaveOkReads >();
            add< CommandFailure >();
            add< AuthRefused >();
            add< ThroughDatabaseWrapper >();
        }
    } myall;

}
