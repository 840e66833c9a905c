// query_translator.h

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
#include "mongomodel/model/model_descriptor.h"
#include "mongomodel/query/filter.h"

namespace mongomodel {

    enum QueryKind { QUERY_READ , QUERY_UPDATE_MULTI , QUERY_DELETE };

    const char * queryKindName( QueryKind kind );

    /** field changes of a bulk update */
    class UpdateSpec {
    public:
        UpdateSpec& set( const string& field , const Value& v ) {
            _sets.push_back( make_pair( field , v ) );
            return *this;
        }
        UpdateSpec& inc( const string& field , const Value& by = Value( 1 ) ) {
            _incs.push_back( make_pair( field , by ) );
            return *this;
        }

        const vector< pair<string,Value> >& sets() const { return _sets; }
        const vector< pair<string,Value> >& incs() const { return _incs; }

        bool isEmpty() const { return _sets.empty() && _incs.empty(); }

    private:
        vector< pair<string,Value> > _sets;
        vector< pair<string,Value> > _incs;
    };

    /** what gets sent to the collection */
    struct Command {
        Command() : kind( QUERY_READ ) , skip( 0 ) , limit( 0 ) { }

        QueryKind kind;
        string collection;
        Document query;
        Document update;
        Document sort;
        int skip;
        int limit;
        Document flags;

        string toString() const;
    };

    /**
       turns filters on model fields into query documents on storage columns.

       everything that can't be expressed is raised here, before anything is
       sent to the store.
     */
    class QueryTranslator {
    public:
        QueryTranslator( const ModelDescriptor& d ) : _d( d ) { }

        Document translateFilter( const Filter& f ) const;

        Command translate( QueryKind kind , const Filter& f ,
                           const vector<string>& orderBy = vector<string>() ,
                           int limit = 0 , int skip = 0 ) const;

        /** { $set : ... , $inc : ... }.  GridFS fields raise RestrictedOperationError. */
        Document translateUpdate( const UpdateSpec& u ) const;

        /** "name" ascending, "-name" descending */
        Document translateOrdering( const vector<string>& orderBy ) const;

        /** a 24 hex digit string (or an OID) to an OID, else InvalidIdentifierError */
        Value convertPk( const Value& v ) const;

        /** object ids for the primary key and foreign keys, anything else unchanged */
        Value convertValue( const FieldDescriptor& f , const Value& v ) const;

        /** "id" and "pk" are _id.  uasserts on an unknown field. */
        string columnFor( const string& field ) const;

        const FieldDescriptor& fieldFor( const string& field ) const;

    private:
        Value _condition( const FilterNode& n , const FieldDescriptor& f ) const;
        Document _and( const vector< shared_ptr<const FilterNode> >& children ) const;
        Document _not( const FilterNode& child ) const;

        const ModelDescriptor& _d;
    };

    /** quotes regex metacharacters */
    string escapeRegex( const string& s );

}
