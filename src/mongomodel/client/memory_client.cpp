// memory_client.cpp

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
#include "mongomodel/client/memory_client.h"

#include <algorithm>

#include "mongomodel/db/errors.h"
#include "mongomodel/db/matcher.h"
#include "mongomodel/db/update.h"

namespace mongomodel {

    namespace {
        mongomodel::mutex storesMutex;
        map< string , shared_ptr<MemoryStore> > stores;

        bool containsReference( const Value& v ) {
            if ( v.type() == ModelRef )
                return true;
            if ( v.isDocument() ) {
                const Document& d = v.embeddedObject();
                for ( Document::const_iterator i = d.begin(); i != d.end(); ++i )
                    if ( containsReference( i->value ) )
                        return true;
            }
            if ( v.isArray() ) {
                const vector<Value>& a = v.array();
                for ( unsigned i = 0; i < a.size(); i++ )
                    if ( containsReference( a[i] ) )
                        return true;
            }
            return false;
        }

        void checkStorable( const Document& obj ) {
            for ( Document::const_iterator i = obj.begin(); i != obj.end(); ++i ) {
                massert( 16060 , string( "cannot store a live model reference in field: " ) + i->name ,
                         ! containsReference( i->value ) );
            }
        }

        /* the index key of doc, missing fields read as null */
        vector<Value> extractKey( const Document& key , const Document& doc , bool& allMissing ) {
            vector<Value> out;
            allMissing = true;
            for ( Document::const_iterator i = key.begin(); i != key.end(); ++i ) {
                Value v = doc.getFieldDotted( i->name );
                if ( v.eoo() )
                    v = Value::getNull();
                else
                    allMissing = false;
                out.push_back( v );
            }
            return out;
        }

        class SortComparator {
        public:
            SortComparator( const Document& sort ) : _sort( sort ) { }
            bool operator()( const Document& l , const Document& r ) const {
                for ( Document::const_iterator i = _sort.begin(); i != _sort.end(); ++i ) {
                    Value a = l.getFieldDotted( i->name );
                    Value b = r.getFieldDotted( i->name );
                    if ( a.eoo() ) a = Value::getNull();
                    if ( b.eoo() ) b = Value::getNull();
                    int c = a.woCompare( b );
                    if ( c == 0 )
                        continue;
                    bool desc = i->value.isNumber() && i->value.number() < 0;
                    return desc ? c > 0 : c < 0;
                }
                return false;
            }
        private:
            Document _sort;
        };
    }

    Document MemoryStore::IndexEntry::toDocument( const string& ns ) const {
        Document d;
        d.append( "ns" , ns );
        d.append( "key" , key );
        d.append( "name" , name );
        if ( unique )
            d.append( "unique" , true );
        if ( sparse )
            d.append( "sparse" , true );
        return d;
    }

    shared_ptr<MemoryStore> MemoryStore::get( const string& address ) {
        scoped_lock lk( storesMutex );
        shared_ptr<MemoryStore>& s = stores[address];
        if ( ! s )
            s.reset( new MemoryStore() );
        return s;
    }

    void MemoryStore::addUser( const string& db , const string& user , const string& pwd ) {
        scoped_lock lk( _m );
        _users[db][user] = pwd;
    }

    MemoryStore::CollectionData& MemoryStore::_getOrCreate( const string& ns ) {
        map< string , CollectionData >::iterator i = _collections.find( ns );
        if ( i != _collections.end() )
            return i->second;

        CollectionData& c = _collections[ns];
        IndexEntry id;
        id.name = "_id_";
        id.key = DOC( "_id" << 1 );
        id.unique = true;
        id.sparse = false;
        c.indexes.push_back( id );
        return c;
    }

    void DBClientMemory::connect( const string& host , int port ) {
        if ( host.empty() )
            throw ConnectException( "can't connect: no host given" );
        _host = host;
        _port = port;
        _store = MemoryStore::get( getServerAddress() );
        _connected = true;
        LOG(1) << "connected to " << toString() << " " << options().toString() << endl;
    }

    bool DBClientMemory::auth( const string& dbname , const string& username , const string& pwd , string& errmsg ) {
        _checkConnected();
        scoped_lock lk( _store->_m );
        map< string , map< string , string > >::iterator db = _store->_users.find( dbname );
        if ( db == _store->_users.end() || db->second.empty() )
            return true;
        map< string , string >::iterator u = db->second.find( username );
        if ( u == db->second.end() || u->second != pwd ) {
            errmsg = "auth fails";
            return false;
        }
        return true;
    }

    void DBClientMemory::disconnect() {
        if ( ! _connected )
            return;
        LOG(1) << "disconnecting from " << toString() << endl;
        _connected = false;
        _store.reset();
    }

    string DBClientMemory::getServerAddress() const {
        stringstream ss;
        ss << _host << ":" << _port;
        return ss.str();
    }

    void DBClientMemory::_checkConnected() const {
        uassert( 16062 , "not connected" , _connected && _store );
    }

    auto_ptr<DBClientCursor> DBClientMemory::query( const string& ns , Query query , int nToReturn , int nToSkip ) {
        _checkConnected();
        LOG(2) << "query " << ns << " " << query.toString() << endl;

        Matcher matcher( query.getFilter() );
        vector<Document> result;
        {
            scoped_lock lk( _store->_m );
            _store->_counters.queries++;
            map< string , MemoryStore::CollectionData >::const_iterator c = _store->_collections.find( ns );
            if ( c != _store->_collections.end() ) {
                const vector<Document>& docs = c->second.docs;
                for ( unsigned i = 0; i < docs.size(); i++ ) {
                    if ( matcher.matches( docs[i] ) )
                        result.push_back( docs[i] );
                }
            }
        }

        if ( ! query.getSort().isEmpty() )
            stable_sort( result.begin() , result.end() , SortComparator( query.getSort() ) );

        if ( nToSkip > 0 )
            result.erase( result.begin() , result.begin() + min( (size_t) nToSkip , result.size() ) );

        if ( nToReturn < 0 )
            nToReturn = -nToReturn;
        if ( nToReturn > 0 && result.size() > (size_t) nToReturn )
            result.resize( nToReturn );

        return auto_ptr<DBClientCursor>( new DBClientCursor( ns , result ) );
    }

    void DBClientMemory::_checkUnique( const MemoryStore::CollectionData& coll , const Document& doc , int self ) const {
        for ( unsigned i = 0; i < coll.indexes.size(); i++ ) {
            const MemoryStore::IndexEntry& idx = coll.indexes[i];
            if ( ! idx.unique )
                continue;

            bool allMissing;
            vector<Value> key = extractKey( idx.key , doc , allMissing );
            if ( allMissing && idx.sparse )
                continue;

            for ( unsigned j = 0; j < coll.docs.size(); j++ ) {
                if ( (int) j == self )
                    continue;
                bool otherMissing;
                vector<Value> other = extractKey( idx.key , coll.docs[j] , otherMissing );
                if ( otherMissing && idx.sparse )
                    continue;
                if ( key == other ) {
                    stringstream ss;
                    ss << "E11000 duplicate key error index: " << idx.name << "  dup key: { : ";
                    for ( unsigned k = 0; k < key.size(); k++ )
                        ss << ( k ? ", " : "" ) << key[k].toString();
                    ss << " }";
                    raiseError( DuplicateKeyError( ss.str() ) );
                }
            }
        }
    }

    void DBClientMemory::_insert( const string& ns , MemoryStore::CollectionData& coll , const Document& obj ) {
        checkStorable( obj );

        Document toStore;
        if ( obj.hasField( "_id" ) ) {
            toStore = obj;
        }
        else {
            toStore.append( "_id" , OID::gen() );
            for ( Document::const_iterator i = obj.begin(); i != obj.end(); ++i )
                toStore.append( i->name , i->value );
        }

        _checkUnique( coll , toStore , -1 );
        coll.docs.push_back( toStore );
    }

    void DBClientMemory::insert( const string& ns , const Document& obj , const Document& writeConcern ) {
        _checkConnected();
        LOG(1) << "insert " << ns << " " << obj.toString() << " " << writeConcern.toString() << endl;
        _lastWriteConcern = writeConcern;

        scoped_lock lk( _store->_m );
        _store->_counters.inserts++;
        _insert( ns , _store->_getOrCreate( ns ) , obj );
    }

    void DBClientMemory::update( const string& ns , Query query , const Document& obj , bool upsert ,
                                 bool multi , const Document& writeConcern ) {
        _checkConnected();
        LOG(1) << "update " << ns << " " << query.toString() << " " << obj.toString()
               << " upsert: " << upsert << " multi: " << multi << " " << writeConcern.toString() << endl;
        _lastWriteConcern = writeConcern;

        checkStorable( obj );
        bool mods = isModifierUpdate( obj );
        uassert( 10158 , "multi update only works with $ operators" , ! multi || mods );

        auto_ptr<ModSet> modSet;
        if ( mods )
            modSet.reset( new ModSet( obj ) );

        Matcher matcher( query.getFilter() );

        scoped_lock lk( _store->_m );
        _store->_counters.updates++;
        MemoryStore::CollectionData& coll = _store->_getOrCreate( ns );

        int nMatched = 0;
        for ( unsigned i = 0; i < coll.docs.size(); i++ ) {
            if ( ! matcher.matches( coll.docs[i] ) )
                continue;

            Document updated;
            if ( mods ) {
                updated = modSet->apply( coll.docs[i] );
            }
            else {
                // replacement keeps the _id of the original
                updated.append( "_id" , coll.docs[i].getField( "_id" ) );
                for ( Document::const_iterator f = obj.begin(); f != obj.end(); ++f ) {
                    if ( f->name == "_id" ) {
                        uassert( 13596 , "cannot change _id of a document" , f->value == updated.getField( "_id" ) );
                        continue;
                    }
                    updated.append( f->name , f->value );
                }
            }

            _checkUnique( coll , updated , i );
            coll.docs[i] = updated;
            nMatched++;
            if ( ! multi )
                break;
        }

        if ( nMatched == 0 && upsert ) {
            Document newObj;
            if ( mods ) {
                newObj = modSet->createNewFromQuery( query.getFilter() );
            }
            else {
                newObj = obj;
                Value id = query.getFilter().getField( "_id" );
                if ( ! newObj.hasField( "_id" ) && ! id.eoo() && ! id.isDocument() ) {
                    Document withId;
                    withId.append( "_id" , id );
                    for ( Document::const_iterator f = obj.begin(); f != obj.end(); ++f )
                        withId.append( f->name , f->value );
                    newObj = withId;
                }
            }
            _insert( ns , coll , newObj );
        }
    }

    void DBClientMemory::remove( const string& ns , Query query , bool justOne , const Document& writeConcern ) {
        _checkConnected();
        LOG(1) << "remove " << ns << " " << query.toString() << " justOne: " << justOne
               << " " << writeConcern.toString() << endl;
        _lastWriteConcern = writeConcern;

        Matcher matcher( query.getFilter() );

        scoped_lock lk( _store->_m );
        _store->_counters.removes++;
        map< string , MemoryStore::CollectionData >::iterator c = _store->_collections.find( ns );
        if ( c == _store->_collections.end() )
            return;

        vector<Document>& docs = c->second.docs;
        for ( vector<Document>::iterator i = docs.begin(); i != docs.end(); ) {
            if ( matcher.matches( *i ) ) {
                i = docs.erase( i );
                if ( justOne )
                    break;
            }
            else {
                ++i;
            }
        }
    }

    auto_ptr<DBClientCursor> DBClientMemory::getIndexes( const string& ns ) {
        _checkConnected();
        vector<Document> result;
        {
            scoped_lock lk( _store->_m );
            map< string , MemoryStore::CollectionData >::const_iterator c = _store->_collections.find( ns );
            if ( c != _store->_collections.end() ) {
                const vector<MemoryStore::IndexEntry>& indexes = c->second.indexes;
                for ( unsigned i = 0; i < indexes.size(); i++ )
                    result.push_back( indexes[i].toDocument( ns ) );
            }
        }
        return auto_ptr<DBClientCursor>( new DBClientCursor( ns , result ) );
    }

    void DBClientMemory::createIndex( const string& ns , const Document& spec ) {
        _checkConnected();
        LOG(1) << "createIndex " << ns << " " << spec.toString() << endl;

        Value key = spec.getField( "key" );
        uassert( 12523 , "no index key pattern specified" , key.isDocument() && ! key.embeddedObject().isEmpty() );

        MemoryStore::IndexEntry entry;
        entry.key = key.embeddedObject();
        Value name = spec.getField( "name" );
        entry.name = name.type() == String ? name.str() : genIndexName( entry.key );
        entry.unique = spec.getField( "unique" ).trueValue();
        entry.sparse = spec.getField( "sparse" ).trueValue();

        scoped_lock lk( _store->_m );
        MemoryStore::CollectionData& coll = _store->_getOrCreate( ns );

        for ( unsigned i = 0; i < coll.indexes.size(); i++ ) {
            const MemoryStore::IndexEntry& existing = coll.indexes[i];
            if ( existing.name != entry.name )
                continue;
            uassert( 16063 , string( "index with name " ) + entry.name + " already exists with a different key" ,
                     existing.key == entry.key );
            uassert( 16212 , string( "index " ) + entry.name + " already exists with different options" ,
                     existing.unique == entry.unique && existing.sparse == entry.sparse );
            return;
        }

        if ( entry.unique ) {
            MemoryStore::CollectionData scratch;
            scratch.indexes.push_back( entry );
            for ( unsigned i = 0; i < coll.docs.size(); i++ ) {
                _checkUnique( scratch , coll.docs[i] , -1 );
                scratch.docs.push_back( coll.docs[i] );
            }
        }

        coll.indexes.push_back( entry );
    }

    bool DBClientMemory::dropCollection( const string& ns ) {
        _checkConnected();
        resetIndexCache();
        scoped_lock lk( _store->_m );
        return _store->_collections.erase( ns ) > 0;
    }

    list<string> DBClientMemory::getCollectionNames( const string& db ) {
        _checkConnected();
        list<string> names;
        string prefix = db + ".";
        scoped_lock lk( _store->_m );
        for ( map< string , MemoryStore::CollectionData >::const_iterator i = _store->_collections.begin();
              i != _store->_collections.end(); ++i ) {
            if ( i->first.compare( 0 , prefix.size() , prefix ) == 0 )
                names.push_back( i->first );
        }
        return names;
    }

}
