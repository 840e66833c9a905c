/** @file dbclient.h

    Core client interface to a document store.  A driver implements DBClientBase,
    everything above it (collections, the model layer, GridFS) only talks to this
    interface.
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

#include "mongomodel/bson/document.h"

namespace mongomodel {

    /** Represents a query expression: a filter plus an optional sort.
        Examples:
           QUERY( "age" << 33 << "school" << "UCLA" ).sort("name")
           QUERY( "age" << DOC( "$gt" << 30 << "$lt" << 50 ) )
    */
    class Query {
    public:
        Query() { }
        Query( const Document& filter ) : _filter( filter ) { }

        /** Add a sort (ORDER BY) criteria to the query expression.
            @param sortPattern the sort order template, e.g. { name : 1, ts : -1 }
        */
        Query& sort( const Document& sortPattern ) {
            _sort = sortPattern;
            return *this;
        }

        /** single field version.  @param asc 1 for ascending order, -1 for descending */
        Query& sort( const string& field , int asc = 1 ) {
            return sort( DOC( field << asc ) );
        }

        const Document& getFilter() const { return _filter; }
        const Document& getSort() const { return _sort; }

        string toString() const;
        operator string() const { return toString(); }

    private:
        Document _filter;
        Document _sort;
    };

/** Typically one uses the QUERY(...) macro to construct a Query object.
    Example: QUERY( "age" << 33 << "school" << "UCLA" )
*/
#define QUERY(x) mongomodel::Query( DOC(x) )

    /** Queries return a cursor object.  Drivers may fetch lazily, the in-memory
        driver hands over its whole result at once.
    */
    class DBClientCursor : boost::noncopyable {
    public:
        DBClientCursor( const string& ns , const vector<Document>& batch )
            : _ns( ns ) , _batch( batch ) , _pos( 0 ) { }
        virtual ~DBClientCursor() { }

        /** If true, safe to call next(). */
        virtual bool more() { return _pos < _batch.size(); }

        /** next document.  massert()s if there is none. */
        virtual Document next() {
            massert( 13422 , "DBClientCursor next() called but more() is false" , more() );
            return _batch[_pos++];
        }

        /** iterate the rest of the cursor and return the number if items */
        int itcount() {
            int c = 0;
            while ( more() ) {
                next();
                c++;
            }
            return c;
        }

    private:
        string _ns;
        vector<Document> _batch;
        unsigned _pos;
    };

    /** connection options a driver is created with */
    struct ClientOptions {
        ClientOptions() : slaveOk( false ) , networkTimeout( 0 ) , tzAware( false ) { }

        /** reads may go to secondaries */
        bool slaveOk;
        /** socket timeout in seconds, 0 for none */
        double networkTimeout;
        /** dates come back timezone aware */
        bool tzAware;
        /** name of the result document type, empty for the default */
        string documentClass;

        string toString() const;
    };

    class ConnectException : public UserException {
    public:
        ConnectException(string msg) : UserException(9000,msg) { }
    };

    /**
       abstract class that implements the core db operations.
       implementations must be usable from one thread at a time.
     */
    class DBClientBase : boost::noncopyable {
    public:
        DBClientBase( const ClientOptions& options = ClientOptions() ) : _options( options ) { }
        virtual ~DBClientBase() { }

        /** connect to host:port.  throws ConnectException on failure. */
        virtual void connect( const string& host , int port ) = 0;

        /** @return false and sets errmsg when the credentials are refused */
        virtual bool auth( const string& dbname , const string& username , const string& pwd , string& errmsg ) = 0;

        virtual void disconnect() = 0;
        virtual bool isConnected() const = 0;
        virtual string getServerAddress() const = 0;

        /** send a query to the database.
            @param nToReturn n to return (i.e., limit).  0 = unlimited
            @param nToSkip start with the nth item
         */
        virtual auto_ptr<DBClientCursor> query( const string& ns , Query query , int nToReturn = 0 , int nToSkip = 0 ) = 0;

        /** insert an object into the database.  writeConcern is { safe: .. , w: .. , fsync: .. } etc */
        virtual void insert( const string& ns , const Document& obj , const Document& writeConcern = Document() ) = 0;

        /** updates objects matching query */
        virtual void update( const string& ns , Query query , const Document& obj , bool upsert = false ,
                             bool multi = false , const Document& writeConcern = Document() ) = 0;

        /** remove matching objects from the database
            @param justOne if this true, then once a single match is found will stop
         */
        virtual void remove( const string& ns , Query query , bool justOne = false ,
                             const Document& writeConcern = Document() ) = 0;

        /** one document per index: { ns, key, name [, unique] [, sparse] } */
        virtual auto_ptr<DBClientCursor> getIndexes( const string& ns ) = 0;

        /** create the index described by spec, see ensureIndex() */
        virtual void createIndex( const string& ns , const Document& spec ) = 0;

        /** @return true if the collection existed */
        virtual bool dropCollection( const string& ns ) = 0;

        virtual list<string> getCollectionNames( const string& db ) = 0;

        virtual string toString() = 0;

        /** @return a single object that matches the query.  if none do, then the object is empty.
            @throws AssertionException
        */
        virtual Document findOne( const string& ns , const Query& query );

        /** count number of objects in collection ns that match the query criteria specified */
        virtual unsigned long long count( const string& ns , const Document& query = Document() , int limit = 0 , int skip = 0 );

        /** Create an index if it does not already exist.
            ensureIndex calls are remembered so it is safe/fast to call this function many
            times in your code.
           @param ns collection to be indexed
           @param keys the "key pattern" for the index.  e.g., { name : 1 }
           @param unique if true, indicates that key uniqueness should be enforced for this index
           @param name if not specified, it will be created from the keys automatically (which is recommended)
           @param sparse if true, documents without the key are left out of the index
           @return whether or not sent message to db.
             should be true on first call, false on subsequent unless resetIndexCache was called
         */
        virtual bool ensureIndex( const string& ns , const Document& keys , bool unique = false ,
                                  const string& name = "" , bool sparse = false );

        /**
           clears the index cache, so the subsequent call to ensureIndex for any index will go to the server
         */
        virtual void resetIndexCache();

        /** { a : 1 , b : -1 } -> "a_1_b_-1" */
        static string genIndexName( const Document& keys );

        const ClientOptions& options() const { return _options; }

    private:
        set<string> _seenIndexes;
        ClientOptions _options;
    };

}
