// dbclient_connection.h


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

#include "mongomodel/client/dbclient.h"
#include "mongomodel/util/sock.h"

namespace mongomodel {

    /**
       a connection to a mongod or mongos, speaking OP_MSG commands.

       queries fetch the whole result, getMore included, before the cursor is
       handed out.  the server's duplicate key errors become DuplicateKeyError,
       other command failures UserExceptions carrying the server's code.
       not thread safe.
     */
    class DBClientConnection : public DBClientBase {
    public:
        DBClientConnection( const ClientOptions& options = ClientOptions() );
        virtual ~DBClientConnection();

        /** connects and handshakes.  throws ConnectException on failure. */
        virtual void connect( const string& host , int port );

        /** SCRAM-SHA-1 against dbname */
        virtual bool auth( const string& dbname , const string& username , const string& pwd , string& errmsg );

        virtual void disconnect();
        virtual bool isConnected() const { return _port.get() && _port->isOpen(); }
        virtual string getServerAddress() const { return _serverAddress; }

        virtual auto_ptr<DBClientCursor> query( const string& ns , Query query , int nToReturn = 0 , int nToSkip = 0 );
        virtual void insert( const string& ns , const Document& obj , const Document& writeConcern = Document() );
        virtual void update( const string& ns , Query query , const Document& obj , bool upsert = false ,
                             bool multi = false , const Document& writeConcern = Document() );
        virtual void remove( const string& ns , Query query , bool justOne = false ,
                             const Document& writeConcern = Document() );
        virtual auto_ptr<DBClientCursor> getIndexes( const string& ns );
        virtual void createIndex( const string& ns , const Document& spec );
        virtual bool dropCollection( const string& ns );
        virtual list<string> getCollectionNames( const string& db );
        virtual unsigned long long count( const string& ns , const Document& query = Document() , int limit = 0 , int skip = 0 );
        virtual string toString() { return "mongodb:" + _serverAddress; }

        /**
           runs cmd against dbname and checks ok.
           @throws DuplicateKeyError for code 11000, UserException otherwise
         */
        Document runCommand( const string& dbname , const Document& cmd );

        /** { safe , w , wtimeout , fsync , j } flags as a server writeConcern, empty for the server default */
        static Document translateWriteConcern( const Document& flags );

        /** the server's handshake reply */
        const Document& serverInfo() const { return _serverInfo; }

    private:
        /** sends cmd with $db set, no ok check */
        Document _call( const string& dbname , const Document& cmd );
        /** _call() with the read preference of the options */
        Document _read( const string& dbname , const Document& cmd );
        void _checkOk( const Document& cmd , const Document& reply );
        void _checkWriteReply( const Document& reply );
        Document _writeCommand( const string& ns , const string& command , const string& listName ,
                                const Document& entry , const Document& writeConcern );
        /** firstBatch plus every getMore */
        vector<Document> _drainCursor( const string& dbname , const Document& reply );

        auto_ptr<Socket> _port;
        string _serverAddress;
        Document _serverInfo;
    };

}
