// matchertests.cpp : query pattern matching.
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
#include "mongomodel/db/matcher.h"
#include "mongomodel/dbtests/dbtests.h"

namespace MatcherTests {

    class Basic {
    public:
        void run() {
            Document query = DOC( "a" << "b" );
            Matcher m( query );
            ASSERT( m.matches( DOC( "a" << "b" ) ) );
            ASSERT( ! m.matches( DOC( "a" << "c" ) ) );
            ASSERT( ! m.matches( DOC( "b" << "b" ) ) );
        }
    };

    class DoubleEqual {
    public:
        void run() {
            Matcher m( DOC( "a" << 5 ) );
            ASSERT( m.matches( DOC( "a" << 5.0 ) ) );
            ASSERT( m.matches( DOC( "a" << 5LL ) ) );
        }
    };

    class MixedNumericGt {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$gt" << 4 ) ) );
            ASSERT( m.matches( DOC( "a" << 5.0 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 4 ) ) );
            ASSERT( ! m.matches( DOC( "a" << "x" ) ) );
        }
    };

    class Range {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$gte" << 2 << "$lte" << 4 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 1 ) ) );
            ASSERT( m.matches( DOC( "a" << 2 ) ) );
            ASSERT( m.matches( DOC( "a" << 4 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 5 ) ) );
        }
    };

    class MixedNumericIN {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$in" << DOC_ARRAY( 4 << 6 ) ) ) );
            ASSERT( m.matches( DOC( "a" << 4.0 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 5.0 ) ) );
            ASSERT( m.matches( DOC( "a" << 4LL ) ) );

            Matcher nin( DOC( "a" << DOC( "$nin" << DOC_ARRAY( 4 << 6 ) ) ) );
            ASSERT( ! nin.matches( DOC( "a" << 4 ) ) );
            ASSERT( nin.matches( DOC( "a" << 5 ) ) );
            ASSERT( nin.matches( DOC( "b" << 4 ) ) );
        }
    };

    class Size {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$size" << 4 ) ) );
            ASSERT( m.matches( DOC( "a" << DOC_ARRAY( 1 << 2 << 3 << 4 ) ) ) );
            ASSERT( ! m.matches( DOC( "a" << DOC_ARRAY( 1 << 2 << 3 ) ) ) );
            ASSERT( ! m.matches( DOC( "a" << "asdf" ) ) );
        }
    };

    class ArrayContains {
    public:
        void run() {
            Matcher m( DOC( "tags" << "mongo" ) );
            ASSERT( m.matches( DOC( "tags" << DOC_ARRAY( "db" << "mongo" ) ) ) );
            ASSERT( ! m.matches( DOC( "tags" << DOC_ARRAY( "db" ) ) ) );

            Matcher whole( DOC( "tags" << DOC_ARRAY( "db" << "mongo" ) ) );
            ASSERT( whole.matches( DOC( "tags" << DOC_ARRAY( "db" << "mongo" ) ) ) );
            ASSERT( ! whole.matches( DOC( "tags" << DOC_ARRAY( "mongo" << "db" ) ) ) );
        }
    };

    class Dotted {
    public:
        void run() {
            Matcher m( DOC( "raw.a" << 1 ) );
            ASSERT( m.matches( DOC( "raw" << DOC( "a" << 1 << "b" << 2 ) ) ) );
            ASSERT( m.matches( DOC( "raw" << DOC_ARRAY( DOC( "a" << 2 ) << DOC( "a" << 1 ) ) ) ) );
            ASSERT( ! m.matches( DOC( "raw" << DOC( "a" << 2 ) ) ) );
            ASSERT( ! m.matches( DOC( "raw" << 1 ) ) );

            Matcher indexed( DOC( "list.1" << "b" ) );
            ASSERT( indexed.matches( DOC( "list" << DOC_ARRAY( "a" << "b" ) ) ) );
            ASSERT( ! indexed.matches( DOC( "list" << DOC_ARRAY( "b" << "a" ) ) ) );
        }
    };

    class NullMatchesMissing {
    public:
        void run() {
            Matcher m( DOC( "a" << Value::getNull() ) );
            ASSERT( m.matches( DOC( "b" << 1 ) ) );
            ASSERT( m.matches( DOC( "a" << Value::getNull() ) ) );
            ASSERT( ! m.matches( DOC( "a" << 1 ) ) );

            Matcher ne( DOC( "a" << DOC( "$ne" << Value::getNull() ) ) );
            ASSERT( ! ne.matches( DOC( "b" << 1 ) ) );
            ASSERT( ne.matches( DOC( "a" << 1 ) ) );
        }
    };

    class Exists {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$exists" << true ) ) );
            ASSERT( m.matches( DOC( "a" << Value::getNull() ) ) );
            ASSERT( ! m.matches( DOC( "b" << 1 ) ) );
        }
    };

    class Regex {
    public:
        void run() {
            Matcher m( DOC( "name" << DOC( "$regex" << "^al" << "$options" << "i" ) ) );
            ASSERT( m.matches( DOC( "name" << "Alice" ) ) );
            ASSERT( ! m.matches( DOC( "name" << "Malice" ) ) );
            ASSERT( ! m.matches( DOC( "name" << 5 ) ) );

            Matcher literal( DOC( "name" << Value::createRegex( "ice$" ) ) );
            ASSERT( literal.matches( DOC( "name" << "Alice" ) ) );
            ASSERT( ! literal.matches( DOC( "name" << "ICE" ) ) );
        }
    };

    class NotRegex {
    public:
        void run() {
            Matcher m( DOC( "name" << DOC( "$not" << Value::createRegex( "^al" , "i" ) ) ) );
            ASSERT( ! m.matches( DOC( "name" << "Alice" ) ) );
            ASSERT( m.matches( DOC( "name" << "Bob" ) ) );
            ASSERT( m.matches( DOC( "other" << 1 ) ) );
        }
    };

    class NotOperators {
    public:
        void run() {
            Matcher m( DOC( "a" << DOC( "$not" << DOC( "$gt" << 3 ) ) ) );
            ASSERT( m.matches( DOC( "a" << 2 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 4 ) ) );
        }
    };

    class Or {
    public:
        void run() {
            Matcher m( DOC( "$or" << DOC_ARRAY( DOC( "a" << 1 ) << DOC( "b" << 2 ) ) ) );
            ASSERT( m.matches( DOC( "a" << 1 ) ) );
            ASSERT( m.matches( DOC( "b" << 2 ) ) );
            ASSERT( ! m.matches( DOC( "a" << 2 << "b" << 1 ) ) );
        }
    };

    class AndNor {
    public:
        void run() {
            Matcher a( DOC( "$and" << DOC_ARRAY( DOC( "a" << DOC( "$gt" << 1 ) ) << DOC( "a" << DOC( "$gt" << 2 ) ) ) ) );
            ASSERT( a.matches( DOC( "a" << 3 ) ) );
            ASSERT( ! a.matches( DOC( "a" << 2 ) ) );

            Matcher n( DOC( "$nor" << DOC_ARRAY( DOC( "a" << 1 ) << DOC( "b" << 1 ) ) ) );
            ASSERT( n.matches( DOC( "a" << 2 ) ) );
            ASSERT( ! n.matches( DOC( "b" << 1 ) ) );
        }
    };

    class Invalid {
    public:
        void run() {
            ASSERT_THROWS( Matcher( DOC( "a" << DOC( "$bogus" << 1 ) ) ) , UserException );
            ASSERT_THROWS( Matcher( DOC( "$or" << 1 ) ) , UserException );
            ASSERT_THROWS( Matcher( DOC( "$where" << "true" ) ) , UserException );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "matcher" ) {
        }

        void setupTests() {
            add< Basic >();
            add< DoubleEqual >();
            add< MixedNumericGt >();
            add< Range >();
            add< MixedNumericIN >();
            add< Size >();
            add< ArrayContains >();
            add< Dotted >();
            add< NullMatchesMissing >();
            add< Exists >();
            add< Regex >();
            add< NotRegex >();
            add< NotOperators >();
            add< Or >();
            add< AndNor >();
            add< Invalid >();
        }
    } dball;

}
