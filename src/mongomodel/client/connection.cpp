// connection.cpp

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
#include "mongomodel/client/connection.h"

#include "mongomodel/client/dbclient_connection.h"
#include "mongomodel/client/memory_client.h"

namespace mongomodel {

    const char * operationKindName( OperationKind kind ) {
        switch ( kind ) {
        case OP_SAVE: return "save";
        case OP_UPDATE: return "update";
        case OP_REMOVE: return "remove";
        }
        return "unknown";
    }

    string ConnectionSettings::toString() const {
        stringstream ss;
        ss << driver << "://";
        if ( ! user.empty() )
            ss << user << "@";
        ss << host << ":" << port << "/" << name;
        if ( debug )
            ss << " (debug)";
        return ss.str();
    }

    /* -- OperationFlags --------------------------------------------- */

    namespace {
        void mergeInto( Document& target , const Document& from ) {
            for ( Document::const_iterator i = from.begin(); i != from.end(); ++i )
                target.set( i->name , i->value );
        }

        bool isKindKey( const string& name ) {
            return name == "save" || name == "update" || name == "delete" || name == "remove";
        }
    }

    OperationFlags OperationFlags::resolve( const Document& options ) {
        OperationFlags f;

        Value ops = options.getField( "OPERATIONS" );
        uassert( 16080 , "OPERATIONS must be an object" , ops.eoo() || ops.isDocument() );
        Document operations = ops.isDocument() ? ops.embeddedObject() : Document();

        bool perKind = false;
        for ( Document::const_iterator i = operations.begin(); i != operations.end(); ++i ) {
            if ( isKindKey( i->name ) )
                perKind = true;
        }

        if ( ! perKind ) {
            for ( int k = 0; k < 3; k++ )
                f._flags[k] = operations;
        }
        else {
            for ( Document::const_iterator i = operations.begin(); i != operations.end(); ++i ) {
                int kind;
                if ( i->name == "save" )
                    kind = OP_SAVE;
                else if ( i->name == "update" )
                    kind = OP_UPDATE;
                else if ( i->name == "delete" || i->name == "remove" )
                    kind = OP_REMOVE;
                else {
                    warning() << "ignoring unknown operation in OPERATIONS: " << i->name << endl;
                    continue;
                }
                uassert( 16081 , string( "OPERATIONS." ) + i->name + " must be an object" , i->value.isDocument() );
                mergeInto( f._flags[kind] , i->value.embeddedObject() );
            }
        }

        Document& save = f._flags[OP_SAVE];
        Value safeInserts = options.getField( "SAFE_INSERTS" );
        if ( ! safeInserts.eoo() && ! save.hasField( "safe" ) )
            save.append( "safe" , safeInserts );
        Value waitForSlaves = options.getField( "WAIT_FOR_SLAVES" );
        if ( ! waitForSlaves.eoo() && ! save.hasField( "w" ) )
            save.append( "w" , waitForSlaves );

        return f;
    }

    Document OperationFlags::forCall( OperationKind kind ) const {
        Document d = _flags[kind];
        if ( kind == OP_UPDATE )
            d.set( "multi" , true );
        return d;
    }

    string OperationFlags::toString() const {
        stringstream ss;
        for ( int k = 0; k < 3; k++ ) {
            if ( k )
                ss << " ";
            ss << operationKindName( (OperationKind) k ) << ": " << _flags[k].toString();
        }
        return ss.str();
    }

    ClientOptions clientOptionsFromSettings( const Document& options ) {
        ClientOptions o;
        for ( Document::const_iterator i = options.begin(); i != options.end(); ++i ) {
            const string& name = i->name;
            const Value& v = i->value;
            if ( name == "SLAVE_OKAY" )
                o.slaveOk = v.trueValue();
            else if ( name == "NETWORK_TIMEOUT" ) {
                uassert( 16082 , "NETWORK_TIMEOUT must be a number" , v.isNumber() );
                o.networkTimeout = v.number();
            }
            else if ( name == "TZ_AWARE" )
                o.tzAware = v.trueValue();
            else if ( name == "DOCUMENT_CLASS" ) {
                uassert( 16083 , "DOCUMENT_CLASS must be a string" , v.type() == String );
                o.documentClass = v.str();
            }
            else if ( name == "OPERATIONS" || name == "SAFE_INSERTS" || name == "WAIT_FOR_SLAVES" ) {
                // write concern, see OperationFlags
            }
            else {
                warning() << "ignoring unknown connection option: " << name << endl;
            }
        }
        return o;
    }

    /* -- DBClientFactory -------------------------------------------- */

    namespace {
        DBClientBase* newMemoryClient( const ClientOptions& options ) {
            return new DBClientMemory( options );
        }

        DBClientBase* newConnectionClient( const ClientOptions& options ) {
            return new DBClientConnection( options );
        }
    }

    DBClientFactory::DBClientFactory() {
        _creators["memory"] = newMemoryClient;
        _creators["mongodb"] = newConnectionClient;
    }

    DBClientFactory& DBClientFactory::global() {
        static DBClientFactory f;
        return f;
    }

    void DBClientFactory::registerDriver( const string& name , const Creator& creator ) {
        scoped_lock lk( _m );
        _creators[name] = creator;
    }

    bool DBClientFactory::hasDriver( const string& name ) {
        scoped_lock lk( _m );
        return _creators.count( name ) > 0;
    }

    DBClientBase* DBClientFactory::create( const string& name , const ClientOptions& options ) {
        Creator c;
        {
            scoped_lock lk( _m );
            map< string , Creator >::iterator i = _creators.find( name );
            uassert( 16084 , string( "unknown driver: " ) + name , i != _creators.end() );
            c = i->second;
        }
        return c( options );
    }

    /* -- DatabaseWrapper -------------------------------------------- */

    DatabaseWrapper::DatabaseWrapper( const ConnectionSettings& settings , const CollectionFactory& collectionFactory )
        : _settings( settings ) ,
          _collectionFactory( collectionFactory ) ,
          _automaticReferencing( settings.automaticReferencing ) {
        if ( ! _collectionFactory )
            _collectionFactory = newDBCollection;
    }

    DatabaseWrapper::~DatabaseWrapper() {
        DESTRUCTOR_GUARD( disconnect() );
    }

    void DatabaseWrapper::connect() {
        if ( isConnected() )
            return;

        uassert( 16085 , "no database name configured" , ! _settings.name.empty() );

        OperationFlags flags = OperationFlags::resolve( _settings.options );
        shared_ptr<DBClientBase> client( DBClientFactory::global().create( _settings.driver ,
                                                                           clientOptionsFromSettings( _settings.options ) ) );
        client->connect( _settings.host , _settings.port );

        if ( ! _settings.user.empty() ) {
            string errmsg;
            if ( ! client->auth( _settings.name , _settings.user , _settings.password , errmsg ) ) {
                client->disconnect();
                uasserted( 16086 , string( "authentication failed for " ) + _settings.user + ": " + errmsg );
            }
        }

        _client = client;
        _flags = flags;
        log() << "connected to " << _settings.toString() << endl;
        LOG(1) << "operation flags: " << _flags.toString() << endl;
    }

    void DatabaseWrapper::disconnect() {
        if ( ! _client )
            return;
        shared_ptr<DBClientBase> c = _client;
        _client.reset();
        c->disconnect();
        LOG(1) << "disconnected from " << _settings.toString() << endl;
    }

    shared_ptr<DBClientBase> DatabaseWrapper::connection() {
        connect();
        return _client;
    }

    shared_ptr<Collection> DatabaseWrapper::getCollection( const string& name ) {
        shared_ptr<Collection> c = _collectionFactory( connection() , _settings.name , name );
        uassert( 16087 , "collection factory returned nothing" , c );
        if ( _settings.debug )
            return shared_ptr<Collection>( new CollectionDebugWrapper( c ) );
        return c;
    }

    const Document& DatabaseWrapper::operationFlags( OperationKind kind ) {
        connect();
        return _flags.get( kind );
    }

    Document DatabaseWrapper::flagsForCall( OperationKind kind ) {
        connect();
        return _flags.forCall( kind );
    }

}
