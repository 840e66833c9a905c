// collection.h

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

    /**
       A handle on one collection of a database.

       Write calls take a flags document: the write concern ({ safe, w, fsync, j,
       wtimeout, ... }) plus, for update(), "upsert" and "multi".  Flags are passed
       to the driver as given.
     */
    class Collection : boost::noncopyable {
    public:
        virtual ~Collection() { }

        /** short name, e.g. "blog_post" */
        virtual string name() const = 0;

        /** full namespace, e.g. "test.blog_post" */
        virtual string ns() const = 0;

        /** @return the _id of the inserted document, generated if doc has none */
        virtual Value insert( const Document& doc , const Document& flags = Document() ) = 0;

        /** insert, or replace the document with the same _id.  @return the _id */
        virtual Value save( const Document& doc , const Document& flags = Document() ) = 0;

        virtual void update( const Document& spec , const Document& doc , const Document& flags = Document() ) = 0;

        virtual void remove( const Document& spec , const Document& flags = Document() ) = 0;

        virtual auto_ptr<DBClientCursor> find( const Query& query = Query() , int limit = 0 , int skip = 0 ) = 0;

        /** @return the first match, or an empty document */
        virtual Document findOne( const Document& spec = Document() ) = 0;

        virtual unsigned long long count( const Document& spec = Document() ) = 0;

        /**
           @param options { unique: bool, sparse: bool, name: string }, all optional
           @return the index name, empty when this client already ensured it and sent nothing
         */
        virtual string ensureIndex( const Document& keys , const Document& options = Document() ) = 0;

        /** { <index name> : { key : { field : direction , ... } [, unique : true] [, sparse : true] } , ... } */
        virtual Document indexInformation() = 0;

        /** @return true if the collection existed */
        virtual bool drop() = 0;
    };

    /** the plain implementation, straight on top of a driver */
    class DBCollection : public Collection {
    public:
        DBCollection( const shared_ptr<DBClientBase>& client , const string& db , const string& name );

        virtual string name() const { return _name; }
        virtual string ns() const { return _db + "." + _name; }

        virtual Value insert( const Document& doc , const Document& flags = Document() );
        virtual Value save( const Document& doc , const Document& flags = Document() );
        virtual void update( const Document& spec , const Document& doc , const Document& flags = Document() );
        virtual void remove( const Document& spec , const Document& flags = Document() );
        virtual auto_ptr<DBClientCursor> find( const Query& query = Query() , int limit = 0 , int skip = 0 );
        virtual Document findOne( const Document& spec = Document() );
        virtual unsigned long long count( const Document& spec = Document() );
        virtual string ensureIndex( const Document& keys , const Document& options = Document() );
        virtual Document indexInformation();
        virtual bool drop();

        shared_ptr<DBClientBase> client() const { return _client; }

    private:
        shared_ptr<DBClientBase> _client;
        string _db;
        string _name;
    };

    /**
       wraps another collection and logs every call with its duration.
       results and exceptions pass through untouched.
     */
    class CollectionDebugWrapper : public Collection {
    public:
        CollectionDebugWrapper( const shared_ptr<Collection>& collection ) : _collection( collection ) { }

        virtual string name() const { return _collection->name(); }
        virtual string ns() const { return _collection->ns(); }

        virtual Value insert( const Document& doc , const Document& flags = Document() );
        virtual Value save( const Document& doc , const Document& flags = Document() );
        virtual void update( const Document& spec , const Document& doc , const Document& flags = Document() );
        virtual void remove( const Document& spec , const Document& flags = Document() );
        virtual auto_ptr<DBClientCursor> find( const Query& query = Query() , int limit = 0 , int skip = 0 );
        virtual Document findOne( const Document& spec = Document() );
        virtual unsigned long long count( const Document& spec = Document() );
        virtual string ensureIndex( const Document& keys , const Document& options = Document() );
        virtual Document indexInformation();
        virtual bool drop();

        shared_ptr<Collection> wrapped() const { return _collection; }

    private:
        shared_ptr<Collection> _collection;
    };

    /** builds the collection handles of a DatabaseWrapper */
    typedef boost::function< shared_ptr<Collection> ( const shared_ptr<DBClientBase>& client ,
                                                      const string& db ,
                                                      const string& name ) > CollectionFactory;

    shared_ptr<Collection> newDBCollection( const shared_ptr<DBClientBase>& client , const string& db , const string& name );

}
