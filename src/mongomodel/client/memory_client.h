// memory_client.h

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

namespace mongomodel {

    /** per store operation counters, never reset */
    struct OpCounters {
        OpCounters() : queries( 0 ) , inserts( 0 ) , updates( 0 ) , removes( 0 ) { }
        long long queries;
        long long inserts;
        long long updates;
        long long removes;
    };

    /**
       The data behind one "host:port" of the in-memory driver.  Every client
       connected to the same address sees the same collections.
     */
    class MemoryStore : boost::noncopyable {
    public:
        struct IndexEntry {
            string name;
            Document key;
            bool unique;
            bool sparse;
            Document toDocument( const string& ns ) const;
        };

        struct CollectionData {
            vector<Document> docs;
            vector<IndexEntry> indexes; // _id_ is always first
        };

        /** @return the store for address, created on first use */
        static shared_ptr<MemoryStore> get( const string& address );

        void addUser( const string& db , const string& user , const string& pwd );

        OpCounters counters() {
            scoped_lock lk( _m );
            return _counters;
        }

    private:
        friend class DBClientMemory;

        CollectionData& _getOrCreate( const string& ns );

        mongomodel::mutex _m;
        map< string , CollectionData > _collections;
        map< string , map< string , string > > _users;
        OpCounters _counters;
    };

    /**
       a driver that keeps everything in process memory.  implements the query
       language of db/matcher.h, the modifiers of db/update.h, unique and sparse
       indexes.  documents carrying live model references are refused.
     */
    class DBClientMemory : public DBClientBase {
    public:
        DBClientMemory( const ClientOptions& options = ClientOptions() )
            : DBClientBase( options ) , _port( 0 ) , _connected( false ) { }

        virtual void connect( const string& host , int port );
        virtual bool auth( const string& dbname , const string& username , const string& pwd , string& errmsg );
        virtual void disconnect();
        virtual bool isConnected() const { return _connected; }
        virtual string getServerAddress() const;

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
        virtual string toString() { return "memory:" + getServerAddress(); }

        /** the write concern the last insert/update/remove was sent with */
        const Document& lastWriteConcern() const { return _lastWriteConcern; }

        shared_ptr<MemoryStore> store() const { return _store; }

    private:
        void _checkConnected() const;
        void _checkUnique( const MemoryStore::CollectionData& coll , const Document& doc , int self ) const;
        void _insert( const string& ns , MemoryStore::CollectionData& coll , const Document& obj );

        string _host;
        int _port;
        bool _connected;
        shared_ptr<MemoryStore> _store;
        Document _lastWriteConcern;
    };

}
