/** @file connection.h

    DatabaseWrapper owns the driver connection of one configured database and
    resolves the write concern every save / update / remove is sent with.
*/

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

#pragma once

#include "mongomodel/client/collection.h"

namespace mongomodel {

    enum OperationKind { OP_SAVE = 0 , OP_UPDATE = 1 , OP_REMOVE = 2 };

    const char * operationKindName( OperationKind kind );

    /**
       what a database is configured with.

       options:
         SLAVE_OKAY       bool    reads may go to secondaries
         NETWORK_TIMEOUT  number  socket timeout in seconds
         TZ_AWARE         bool    dates are returned timezone aware
         DOCUMENT_CLASS   string  name of the result document type
         OPERATIONS       object  write concern, flat or per operation kind
         SAFE_INSERTS     bool    legacy, becomes OPERATIONS.save.safe
         WAIT_FOR_SLAVES  number  legacy, becomes OPERATIONS.save.w
     */
    struct ConnectionSettings {
        ConnectionSettings()
            : host( "localhost" ) , port( 27017 ) , driver( "mongodb" ) ,
              debug( false ) , automaticReferencing( false ) { }

        string host;
        int port;
        /** the database */
        string name;
        string user;
        string password;
        /** registered DBClientFactory name */
        string driver;
        /** log every collection call, see CollectionDebugWrapper */
        bool debug;
        /** store model instances found in data as references instead of failing */
        bool automaticReferencing;
        Document options;

        string toString() const;
    };

    /** the write concern of each operation kind */
    class OperationFlags {
    public:
        /**
           OPERATIONS with none of save / update / delete / remove is one flag set for
           every kind.  otherwise each kind takes its own entry, "delete" and "remove"
           both name OP_REMOVE and other keys are ignored with a warning.
           SAFE_INSERTS and WAIT_FOR_SLAVES fill save.safe and save.w when not set.
         */
        static OperationFlags resolve( const Document& options );

        const Document& get( OperationKind kind ) const { return _flags[kind]; }

        /** the flags a collection call gets: update also carries multi: true */
        Document forCall( OperationKind kind ) const;

        string toString() const;

    private:
        Document _flags[3];
    };

    /** the driver visible subset of options */
    ClientOptions clientOptionsFromSettings( const Document& options );

    /** named constructors for drivers.  "mongodb" and "memory" are always registered. */
    class DBClientFactory : boost::noncopyable {
    public:
        typedef boost::function< DBClientBase* ( const ClientOptions& options ) > Creator;

        static DBClientFactory& global();

        void registerDriver( const string& name , const Creator& creator );
        bool hasDriver( const string& name );

        /** uasserts if name is not registered.  caller owns the result. */
        DBClientBase* create( const string& name , const ClientOptions& options );

    private:
        DBClientFactory();

        mongomodel::mutex _m;
        map< string , Creator > _creators;
    };

    class DatabaseWrapper : boost::noncopyable {
    public:
        /** @param collectionFactory how collection handles are made, newDBCollection if empty */
        DatabaseWrapper( const ConnectionSettings& settings ,
                         const CollectionFactory& collectionFactory = CollectionFactory() );
        ~DatabaseWrapper();

        /** create the driver client, connect and authenticate.  no-op when connected. */
        void connect();

        /** safe to call when not connected */
        void disconnect();

        bool isConnected() const { return _client && _client->isConnected(); }

        /** the driver client, connecting first if needed */
        shared_ptr<DBClientBase> connection();

        /** the database name */
        const string& database() const { return _settings.name; }

        /** a handle on database().name, a CollectionDebugWrapper when settings.debug is set */
        shared_ptr<Collection> getCollection( const string& name );

        /** resolved on connect */
        const Document& operationFlags( OperationKind kind );

        /** operationFlags() plus per call flags, see OperationFlags::forCall() */
        Document flagsForCall( OperationKind kind );

        bool automaticReferencing() const { return _automaticReferencing; }
        void setAutomaticReferencing( bool on ) { _automaticReferencing = on; }

        const ConnectionSettings& settings() const { return _settings; }

    private:
        ConnectionSettings _settings;
        CollectionFactory _collectionFactory;
        shared_ptr<DBClientBase> _client;
        OperationFlags _flags;
        bool _automaticReferencing;
    };

}
