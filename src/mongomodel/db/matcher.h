// matcher.h

/* Matcher is our boolean expression evaluator for "where" clauses */

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

#include <pcrecpp.h>

#include "mongomodel/bson/document.h"

namespace mongomodel {

    class Matcher;

    class ElementMatcher {
    public:
        enum Op { EQ, NE, GT, GTE, LT, LTE, IN, NIN, ALL, EXISTS, REGEX, SIZE, ELEM_MATCH, NOT };

        ElementMatcher( const string& fieldName , Op op , const Value& toMatch )
            : _fieldName( fieldName ) , _op( op ) , _toMatch( toMatch ) { }

        string _fieldName;
        Op _op;
        Value _toMatch;
        shared_ptr< pcrecpp::RE > _re;
        vector< shared_ptr< pcrecpp::RE > > _inRegex;

        /** $elemMatch: applied to each embedded document.  $not: the negated clause. */
        shared_ptr< Matcher > _subMatcher;
    };

    /* Match documents against a query pattern.

       e.g.
           { a : 3 }
           { a : { $gt : 3 } }
           { "tags.name" : "x" }       matches any element of the tags array with name "x"
           { $or : [ { a : 1 } , { b : 2 } ] }

       Supported operators: $ne $gt $gte $lt $lte $in $nin $all $exists $regex/$options
       $size $elemMatch $not, and $or / $and / $nor at the top level.
       { a : null } also matches documents where a is missing.
    */
    class Matcher : boost::noncopyable {
    public:
        Matcher( const Document& pattern );

        bool matches( const Document& doc ) const;

        string toString() const { return _pattern.toString(); }

    private:
        void parseClause( const string& fieldName , const Value& v );
        void addOp( const string& fieldName , const string& op , const Value& v , const Document& opDoc );
        void addRegex( const string& fieldName , const string& regex , const string& flags );

        bool matchesElement( const ElementMatcher& em , const Document& doc ) const;
        bool valueMatches( const ElementMatcher& em , const Value& v ) const;
        bool equalOrContains( const Value& v , const Value& toMatch ) const;
        bool inSet( const ElementMatcher& em , const Value& v ) const;

        Document _pattern;
        vector< ElementMatcher > _basics;
        vector< shared_ptr< Matcher > > _orMatchers;
        vector< shared_ptr< Matcher > > _andMatchers;
        vector< shared_ptr< Matcher > > _norMatchers;
    };

    /**
       all the values a dotted path reaches in doc.  arrays along the path are
       expanded, a numeric path component also indexes into an array.
     */
    void collectDottedValues( const Document& doc , const string& path , vector<Value>& out );

}
