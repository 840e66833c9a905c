// querytests.cpp : filters to query documents.
//

/**
*    Copyright (C) 2008 10gen Inc.
*
*    This program is free software: you can redistribute it and/or  modify
*    it under the terms of the GNU Affero General Public License, version 3,
*    as published by the Free Software Foundation.
*
*    This program is distributed in the hope that it will be useful,
*    but WITHOUT ANY WARRANTY; without even the implied warranty of
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*    GNU Affero General Public License for more details.
*
*    You should have received a copy of the GNU Affero General Public License
*    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "mongomodel/pch.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/db/matcher.h"
#include "mongomodel/dbtests/dbtests.h"

namespace QueryTests {

    const char * const someId = "4d2b1a6f8e5cce2a38000001";
    const char * const otherId = "4d2b1a6f8e5cce2a38000002";

    Document translate( const string& model , const Filter& f ) {
        boost::shared_ptr<const ModelDescriptor> d = dbtests::model( model );
        return QueryTranslator( *d ).translateFilter( f );
    }

    class Empty {
    public:
        void run() {
            ASSERT( translate( "Entry" , Filter() ).isEmpty() );
        }
    };

    class Exact {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "title" << "hello" ) , translate( "Entry" , Q( "title" , "hello" ) ) );
            ASSERT_EQUALS( DOC( "title" << "hello" ) , translate( "Entry" , Q( "title__exact" , "hello" ) ) );
        }
    };

    class StringLookups {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "mo\\.ngo" ) ) ,
                           translate( "Entry" , Q( "title__contains" , "mo.ngo" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "mongo" << "$options" << "i" ) ) ,
                           translate( "Entry" , Q( "title__icontains" , "mongo" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "^Hello$" << "$options" << "i" ) ) ,
                           translate( "Entry" , Q( "title__iexact" , "Hello" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "^he" ) ) ,
                           translate( "Entry" , Q( "title__startswith" , "he" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "^he" << "$options" << "i" ) ) ,
                           translate( "Entry" , Q( "title__istartswith" , "he" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "lo$" ) ) ,
                           translate( "Entry" , Q( "title__endswith" , "lo" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "lo$" << "$options" << "i" ) ) ,
                           translate( "Entry" , Q( "title__iendswith" , "lo" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "^h.*o$" ) ) ,
                           translate( "Entry" , Q( "title__regex" , "^h.*o$" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$regex" << "^h.*o$" << "$options" << "i" ) ) ,
                           translate( "Entry" , Q( "title__iregex" , "^h.*o$" ) ) );
        }
    };

    class EscapeRegex {
    public:
        void run() {
            ASSERT_EQUALS( "a\\.b\\*c" , escapeRegex( "a.b*c" ) );
            ASSERT_EQUALS( "\\(x\\)\\[y\\]\\{z\\}" , escapeRegex( "(x)[y]{z}" ) );
            ASSERT_EQUALS( "plain" , escapeRegex( "plain" ) );
        }
    };

    class Comparisons {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "views" << DOC( "$gt" << 3 ) ) , translate( "Entry" , Q( "views__gt" , 3 ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$gte" << 3 ) ) , translate( "Entry" , Q( "views__gte" , 3 ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$lt" << 3 ) ) , translate( "Entry" , Q( "views__lt" , 3 ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$lte" << 3 ) ) , translate( "Entry" , Q( "views__lte" , 3 ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$in" << DOC_ARRAY( 1 << 2 ) ) ) ,
                           translate( "Entry" , Q( "views__in" , DOC_ARRAY( 1 << 2 ) ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$gte" << 1 << "$lte" << 5 ) ) ,
                           translate( "Entry" , Q( "views__range" , DOC_ARRAY( 1 << 5 ) ) ) );

            ASSERT_THROWS( translate( "Entry" , Q( "views__in" , 1 ) ) , UserException );
            ASSERT_THROWS( translate( "Entry" , Q( "views__range" , DOC_ARRAY( 1 ) ) ) , UserException );
        }
    };

    class IsNull {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "title" << Value::getNull() ) , translate( "Entry" , Q( "title__isnull" , true ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$ne" << Value::getNull() ) ) ,
                           translate( "Entry" , Q( "title__isnull" , false ) ) );
        }
    };

    class DateLookupsUnsupported {
    public:
        void run() {
            ASSERT_THROWS( translate( "DateModel" , Q( "date__year" , 2010 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__month" , 1 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__day" , 1 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__week_day" , 1 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__hour" , 1 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__quarter" , 1 ) ) , UnsupportedQueryError );
            ASSERT_THROWS( translate( "DateModel" , Q( "date__iso_week_day" , 1 ) ) , UnsupportedQueryError );
            try {
                translate( "DateModel" , Q( "date__hour" , 3 ) );
                FAIL( "hour lookup translated" );
            }
            catch ( UnsupportedQueryError& e ) {
                ASSERT_EQUALS( "MongoDB does not support hour queries" , string( e.what() ) );
            }
            try {
                translate( "DateModel" , Q( "date__year" , 2010 ) );
                FAIL( "year lookup translated" );
            }
            catch ( UnsupportedQueryError& e ) {
                ASSERT_EQUALS( "MongoDB does not support year/month/day queries" , string( e.what() ) );
                ASSERT_EQUALS( (int) UnsupportedQueryCode , e.getCode() );
            }
        }
    };

    class UnknownField {
    public:
        void run() {
            ASSERT_THROWS( translate( "Entry" , Q( "nosuch" , 1 ) ) , UserException );
            // not a lookup, so part of the field name
            ASSERT_THROWS( translate( "Entry" , Q( "title__nosuch" , 1 ) ) , UserException );
        }
    };

    class PrimaryKey {
    public:
        void run() {
            Document expected = DOC( "_id" << OID( someId ) );
            ASSERT_EQUALS( expected , translate( "Entry" , Q( "pk" , someId ) ) );
            ASSERT_EQUALS( expected , translate( "Entry" , Q( "id" , someId ) ) );
            ASSERT_EQUALS( expected , translate( "Entry" , Q( "pk" , OID( someId ) ) ) );
            ASSERT_EQUALS( DOC( "_id" << DOC( "$in" << DOC_ARRAY( OID( someId ) << OID( otherId ) ) ) ) ,
                           translate( "Entry" , Q( "pk__in" , DOC_ARRAY( someId << otherId ) ) ) );
        }
    };

    class InvalidPrimaryKey {
    public:
        void run() {
            try {
                translate( "Entry" , Q( "pk" , "some-pk" ) );
                FAIL( "invalid id accepted" );
            }
            catch ( InvalidIdentifierError& e ) {
                ASSERT_EQUALS( "AutoField (default primary key) values must be strings representing an ObjectId "
                               "on MongoDB (got 'some-pk' instead)" , string( e.what() ) );
            }

            try {
                translate( "Entry" , Q( "pk" , 42 ) );
                FAIL( "invalid id accepted" );
            }
            catch ( InvalidIdentifierError& e ) {
                ASSERT_EQUALS( "AutoField (default primary key) values must be strings representing an ObjectId "
                               "on MongoDB (got '42' instead)" , string( e.what() ) );
            }
        }
    };

    class InvalidPrimaryKeyHint {
    public:
        void run() {
            try {
                translate( "Site" , Q( "pk" , "1" ) );
                FAIL( "invalid id accepted" );
            }
            catch ( InvalidIdentifierError& e ) {
                ASSERT_EQUALS( "AutoField (default primary key) values must be strings representing an ObjectId "
                               "on MongoDB (got '1' instead). Please make sure your SITE_ID contains a valid ObjectId." ,
                               string( e.what() ) );
            }
        }
    };

    class ForeignKeys {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "author_id" << OID( someId ) ) , translate( "Entry" , Q( "author" , someId ) ) );
            ASSERT_EQUALS( DOC( "author_id" << Value::getNull() ) , translate( "Entry" , Q( "author" , Value::getNull() ) ) );
            ASSERT_THROWS( translate( "Entry" , Q( "author" , "nope" ) ) , InvalidIdentifierError );

            ModelInstancePtr author( new ModelInstance( dbtests::model( "RawModel" ) ) );
            ASSERT_THROWS( translate( "Entry" , Q( "author" , Value::createReference( author ) ) ) , UserException );
            author->setPk( Value( string( someId ) ) );
            ASSERT_EQUALS( DOC( "author_id" << OID( someId ) ) ,
                           translate( "Entry" , Q( "author" , Value::createReference( author ) ) ) );

            Value lazy = Value::createReference( boost::shared_ptr<Referent>(
                new LazyModelInstance( dbtests::model( "RawModel" ) , Value( otherId ) ) ) );
            ASSERT_EQUALS( DOC( "author_id" << OID( otherId ) ) , translate( "Entry" , Q( "author" , lazy ) ) );
        }
    };

    class EmbeddedAttribute {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "raw.b" << 2 ) , translate( "RawModel" , Q( "raw" , A( "b" , 2 ) ) ) );
            ASSERT_EQUALS( DOC( "raw.b.c" << "x" ) , translate( "RawModel" , Q( "raw" , A( "b.c" , "x" ) ) ) );
            ASSERT_THROWS( Q( "raw" , A( "" , 2 ) ) , UserException );
        }
    };

    class And {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "title" << "a" << "views" << 1 ) ,
                           translate( "Entry" , Q( "title" , "a" ) & Q( "views" , 1 ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$gt" << 3 << "$lt" << 10 ) ) ,
                           translate( "Entry" , Q( "views__gt" , 3 ) & Q( "views__lt" , 10 ) ) );
            ASSERT_EQUALS( DOC( "title" << "a" ) , translate( "Entry" , Filter() & Q( "title" , "a" ) ) );
        }
    };

    class AndClash {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "$and" << DOC_ARRAY( DOC( "views" << DOC( "$gt" << 3 ) )
                                                     << DOC( "views" << DOC( "$gt" << 5 ) ) ) ) ,
                           translate( "Entry" , Q( "views__gt" , 3 ) & Q( "views__gt" , 5 ) ) );
            ASSERT_EQUALS( DOC( "$and" << DOC_ARRAY( DOC( "views" << 1 ) << DOC( "views" << DOC( "$gt" << 0 ) ) ) ) ,
                           translate( "Entry" , Q( "views" , 1 ) & Q( "views__gt" , 0 ) ) );
        }
    };

    class Or {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "$or" << DOC_ARRAY( DOC( "title" << "a" ) << DOC( "title" << "b" ) << DOC( "views" << 1 ) ) ) ,
                           translate( "Entry" , Q( "title" , "a" ) | Q( "title" , "b" ) | Q( "views" , 1 ) ) );
            ASSERT_EQUALS( DOC( "views" << 2 << "$or" << DOC_ARRAY( DOC( "title" << "a" ) << DOC( "title" << "b" ) ) ) ,
                           translate( "Entry" , Q( "views" , 2 ) & ( Q( "title" , "a" ) | Q( "title" , "b" ) ) ) );
        }
    };

    class Not {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "title" << DOC( "$ne" << "a" ) ) , translate( "Entry" , ~Q( "title" , "a" ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$ne" << "a" ) ) , translate( "Entry" , !Q( "title" , "a" ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$nin" << DOC_ARRAY( 1 << 2 ) ) ) ,
                           translate( "Entry" , ~Q( "views__in" , DOC_ARRAY( 1 << 2 ) ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$ne" << Value::getNull() ) ) ,
                           translate( "Entry" , ~Q( "title__isnull" , true ) ) );
            ASSERT_EQUALS( DOC( "title" << Value::getNull() ) ,
                           translate( "Entry" , ~Q( "title__isnull" , false ) ) );
            ASSERT_EQUALS( DOC( "title" << DOC( "$not" << Value::createRegex( "^a" , "i" ) ) ) ,
                           translate( "Entry" , ~Q( "title__istartswith" , "a" ) ) );
            ASSERT_EQUALS( DOC( "views" << DOC( "$not" << DOC( "$gt" << 3 ) ) ) ,
                           translate( "Entry" , ~Q( "views__gt" , 3 ) ) );
        }
    };

    class NotCompound {
    public:
        void run() {
            ASSERT_EQUALS( DOC( "$nor" << DOC_ARRAY( DOC( "$or" << DOC_ARRAY( DOC( "title" << "a" ) << DOC( "views" << 1 ) ) ) ) ) ,
                           translate( "Entry" , ~( Q( "title" , "a" ) | Q( "views" , 1 ) ) ) );
            ASSERT_EQUALS( DOC( "$nor" << DOC_ARRAY( DOC( "title" << "a" << "views" << 1 ) ) ) ,
                           translate( "Entry" , ~( Q( "title" , "a" ) & Q( "views" , 1 ) ) ) );
        }
    };

    class NotRegexWithOtherCondition {
    public:
        void run() {
            Document q = translate( "Entry" , ~( Q( "title__startswith" , "a" ) & Q( "title__gt" , "ab" ) ) );
            ASSERT_EQUALS( DOC( "$nor" << DOC_ARRAY( DOC( "title" << DOC( "$regex" << "^a" << "$gt" << "ab" ) ) ) ) , q );

            Matcher m( q );
            ASSERT( m.matches( DOC( "title" << "aa" ) ) );
            ASSERT( m.matches( DOC( "title" << "b" ) ) );
            ASSERT( ! m.matches( DOC( "title" << "ac" ) ) );

            ASSERT_EQUALS( DOC( "title" << DOC( "$not" << Value::createRegex( "^a" , "i" ) ) ) ,
                           translate( "Entry" , ~Q( "title__istartswith" , "a" ) ) );
        }
    };

    class DoubleNegation {
    public:
        void run() {
            Filter f = Q( "title" , "a" );
            ASSERT_EQUALS( translate( "Entry" , f ) , translate( "Entry" , ~~f ) );
            Filter all;
            ASSERT_THROWS( ~all , UserException );
        }
    };

    class Ordering {
    public:
        void run() {
            boost::shared_ptr<const ModelDescriptor> d = dbtests::model( "IndexTestModel" );
            QueryTranslator t( *d );
            vector<string> order;
            order.push_back( "-regular_index" );
            order.push_back( "custom_column" );
            order.push_back( "pk" );
            ASSERT_EQUALS( DOC( "regular_index" << -1 << "foo" << 1 << "_id" << 1 ) , t.translateOrdering( order ) );

            order.push_back( "?" );
            ASSERT_THROWS( t.translateOrdering( order ) , UserException );
        }
    };

    class Commands {
    public:
        void run() {
            boost::shared_ptr<const ModelDescriptor> d = dbtests::model( "Entry" );
            QueryTranslator t( *d );
            vector<string> order( 1 , "-views" );

            Command read = t.translate( QUERY_READ , Q( "title" , "a" ) , order , 10 , 5 );
            ASSERT_EQUALS( "entry" , read.collection );
            ASSERT_EQUALS( DOC( "title" << "a" ) , read.query );
            ASSERT_EQUALS( DOC( "views" << -1 ) , read.sort );
            ASSERT_EQUALS( 10 , read.limit );
            ASSERT_EQUALS( 5 , read.skip );
            ASSERT( read.flags.isEmpty() );

            Command update = t.translate( QUERY_UPDATE_MULTI , Q( "title" , "a" ) );
            ASSERT_EQUALS( DOC( "multi" << true ) , update.flags );

            Command del = t.translate( QUERY_DELETE , Q( "title" , "a" ) );
            ASSERT( del.flags.isEmpty() );

            ASSERT_THROWS( t.translate( QUERY_DELETE , Q( "title" , "a" ) , order ) , UserException );
            ASSERT_THROWS( t.translate( QUERY_UPDATE_MULTI , Q( "title" , "a" ) , vector<string>() , 1 ) , UserException );
        }
    };

    class Updates {
    public:
        void run() {
            boost::shared_ptr<const ModelDescriptor> d = dbtests::model( "Entry" );
            QueryTranslator t( *d );
            ASSERT_EQUALS( DOC( "$set" << DOC( "title" << "x" << "author_id" << OID( someId ) ) << "$inc" << DOC( "views" << 1 ) ) ,
                           t.translateUpdate( UpdateSpec().set( "title" , "x" ).inc( "views" ).set( "author" , someId ) ) );
            ASSERT_EQUALS( DOC( "$inc" << DOC( "views" << -2 ) ) , t.translateUpdate( UpdateSpec().inc( "views" , -2 ) ) );

            ASSERT_THROWS( t.translateUpdate( UpdateSpec() ) , UserException );
            ASSERT_THROWS( t.translateUpdate( UpdateSpec().set( "pk" , someId ) ) , UserException );
            ASSERT_THROWS( t.translateUpdate( UpdateSpec().inc( "views" , "x" ) ) , UserException );
            ASSERT_THROWS( t.translateUpdate( UpdateSpec().set( "nosuch" , 1 ) ) , UserException );
        }
    };

    class GridFSUpdatesRestricted {
    public:
        void run() {
            boost::shared_ptr<const ModelDescriptor> d = dbtests::model( "GridFSFieldTestModel" );
            QueryTranslator t( *d );
            try {
                t.translateUpdate( UpdateSpec().set( "gridfile" , "data" ) );
                FAIL( "GridFS update translated" );
            }
            catch ( RestrictedOperationError& e ) {
                ASSERT_EQUALS( "Updates on GridFSFields are not allowed" , string( e.what() ) );
            }
            ASSERT_THROWS( t.translateUpdate( UpdateSpec().set( "gridstring" , "data" ) ) , RestrictedOperationError );
        }
    };

    class FilterStrings {
    public:
        void run() {
            ASSERT_EQUALS( "(all)" , Filter().toString() );
            ASSERT_EQUALS( "title__exact=\"a\"" , Q( "title" , "a" ).toString() );
            ASSERT_EQUALS( "(views__gt=1 OR NOT title__exact=\"a\")" , ( Q( "views__gt" , 1 ) | ~Q( "title" , "a" ) ).toString() );
            ASSERT_EQUALS( "raw=A(b, 2)" , Q( "raw" , A( "b" , 2 ) ).toString() );
        }
    };

    class Lookups {
    public:
        void run() {
            LookupType t;
            ASSERT( lookupFromName( "week_day" , t ) );
            ASSERT_EQUALS( LOOKUP_WEEK_DAY , t );
            ASSERT_EQUALS( "istartswith" , string( lookupName( LOOKUP_ISTARTSWITH ) ) );
            ASSERT( ! lookupFromName( "between" , t ) );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "query" ) {
        }

        void setupTests() {
            add< Empty >();
            add< Exact >();
            add< StringLookups >();
            add< EscapeRegex >();
            add< Comparisons >();
            add< IsNull >();
            add< DateLookupsUnsupported >();
            add< UnknownField >();
            add< PrimaryKey >();
            add< InvalidPrimaryKey >();
            add< InvalidPrimaryKeyHint >();
            add< ForeignKeys >();
            add< EmbeddedAttribute >();
            add< And >();
            add< AndClash >();
            add< Or >();
            add< Not >();
            add< NotCompound >();
            add< NotRegexWithOtherCondition >();
            add< DoubleNegation >();
            add< Ordering >();
            add< Commands >();
            add< Updates >();
            add< GridFSUpdatesRestricted >();
            add< FilterStrings >();
            add< Lookups >();
        }
    } myall;

}
