// dbclient.cpp - connect to a document store

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
#include "mongomodel/client/dbclient.h"

namespace mongomodel {

    string Query::toString() const {
        stringstream ss;
        ss << "query: " << _filter.toString();
        if ( ! _sort.isEmpty() )
            ss << " orderby: " << _sort.toString();
        return ss.str();
    }

    string ClientOptions::toString() const {
        stringstream ss;
        ss << "slaveOk: " << slaveOk << " networkTimeout: " << networkTimeout
           << " tzAware: " << tzAware << " documentClass: " << documentClass;
        return ss.str();
    }

    Document DBClientBase::findOne( const string& ns , const Query& query ) {
        auto_ptr<DBClientCursor> c = this->query( ns , query , 1 );
        uassert( 10276 , "DBClientBase::findOne: transport error" , c.get() );
        return c->more() ? c->next() : Document();
    }

    unsigned long long DBClientBase::count( const string& ns , const Document& query , int limit , int skip ) {
        auto_ptr<DBClientCursor> c = this->query( ns , Query( query ) , limit , skip );
        uassert( 10277 , "DBClientBase::count: transport error" , c.get() );
        return c->itcount();
    }

    string DBClientBase::genIndexName( const Document& keys ) {
        stringstream ss;

        bool first = 1;
        for ( Document::const_iterator i = keys.begin(); i != keys.end(); ++i ) {
            if ( first )
                first = 0;
            else
                ss << "_";

            ss << i->name << "_";
            if ( i->value.isNumber() )
                ss << i->value.numberInt();
        }
        return ss.str();
    }

    bool DBClientBase::ensureIndex( const string& ns , const Document& keys , bool unique ,
                                    const string& name , bool sparse ) {
        Document toSave;
        toSave.append( "ns" , ns );
        toSave.append( "key" , keys );

        string cacheKey(ns);
        cacheKey += "--";

        if ( name != "" ) {
            toSave.append( "name" , name );
            cacheKey += name;
        }
        else {
            string nn = genIndexName( keys );
            toSave.append( "name" , nn );
            cacheKey += nn;
        }

        if ( unique )
            toSave.append( "unique" , true );
        if ( sparse )
            toSave.append( "sparse" , true );

        if ( _seenIndexes.count( cacheKey ) )
            return 0;

        createIndex( ns , toSave );
        _seenIndexes.insert( cacheKey );
        return 1;
    }

    void DBClientBase::resetIndexCache() {
        _seenIndexes.clear();
    }

}
