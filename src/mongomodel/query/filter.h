// filter.h

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

#include "mongomodel/bson/value.h"

namespace mongomodel {

    enum LookupType {
        LOOKUP_EXACT ,
        LOOKUP_IEXACT ,
        LOOKUP_CONTAINS ,
        LOOKUP_ICONTAINS ,
        LOOKUP_GT ,
        LOOKUP_GTE ,
        LOOKUP_LT ,
        LOOKUP_LTE ,
        LOOKUP_IN ,
        LOOKUP_STARTSWITH ,
        LOOKUP_ISTARTSWITH ,
        LOOKUP_ENDSWITH ,
        LOOKUP_IENDSWITH ,
        LOOKUP_RANGE ,
        LOOKUP_ISNULL ,
        LOOKUP_REGEX ,
        LOOKUP_IREGEX ,
        LOOKUP_YEAR ,
        LOOKUP_MONTH ,
        LOOKUP_DAY ,
        LOOKUP_WEEK_DAY ,
        LOOKUP_WEEK ,
        LOOKUP_QUARTER ,
        LOOKUP_ISO_YEAR ,
        LOOKUP_ISO_WEEK_DAY ,
        LOOKUP_DATE ,
        LOOKUP_TIME ,
        LOOKUP_HOUR ,
        LOOKUP_MINUTE ,
        LOOKUP_SECOND
    };

    const char * lookupName( LookupType t );

    /** @return false if name is not a lookup */
    bool lookupFromName( const string& name , LookupType& t );

    /** matches elements of a list of embedded documents by one key: A( "b" , 2 ) */
    struct A {
        A( const string& k , const Value& v ) : key( k ) , value( v ) { }
        string key;
        Value value;
    };

    /** one node of a filter tree.  immutable once built. */
    class FilterNode {
    public:
        enum Kind { EMPTY , CONDITION , EMBEDDED_ATTRIBUTE , AND , OR , NOT };

        Kind kind;

        // CONDITION and EMBEDDED_ATTRIBUTE
        string field;
        LookupType lookup;
        Value value;
        string key;

        // AND OR NOT
        vector< shared_ptr<const FilterNode> > children;

        FilterNode() : kind( EMPTY ) , lookup( LOOKUP_EXACT ) { }

        string toString() const;
    };

    /**
       a filter over model fields, combined with & | and ~

         Filter f = ( Q( "title__icontains" , "mongo" ) | Q( "pk" , id ) ) & ~Q( "draft" , true );
         Filter g = Q( "raw" , A( "b" , 2 ) );
     */
    class Filter {
    public:
        /** matches everything */
        Filter() : _node( new FilterNode() ) { }

        Filter( const shared_ptr<const FilterNode>& node ) : _node( node ) { }

        const FilterNode& node() const { return *_node; }
        bool isEmpty() const { return _node->kind == FilterNode::EMPTY; }

        Filter operator&( const Filter& other ) const;
        Filter operator|( const Filter& other ) const;
        Filter operator~() const;
        Filter operator!() const { return ~*this; }

        string toString() const { return _node->toString(); }

    private:
        Filter _combine( FilterNode::Kind kind , const Filter& other ) const;

        shared_ptr<const FilterNode> _node;
    };

    /**
       "field" or "field__lookup".  a lookup suffix that is not a lookup name
       stays part of the field name.
     */
    Filter Q( const string& fieldAndLookup , const Value& value );

    Filter Q( const string& field , const A& a );

    inline ostream& operator<<( ostream& s , const Filter& f ) {
        return s << f.toString();
    }

}
