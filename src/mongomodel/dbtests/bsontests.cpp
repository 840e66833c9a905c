// bsontests.cpp : Value, Document and OID.
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
#include "mongomodel/dbtests/dbtests.h"

namespace BsonTests {

    namespace OIDTests {

        class Gen {
        public:
            void run() {
                OID a = OID::gen();
                OID b = OID::gen();
                ASSERT( a.isSet() );
                ASSERT( a != b );
                ASSERT( a < b );
                ASSERT_EQUALS( 24U , a.str().size() );
            }
        };

        class FromString {
        public:
            void run() {
                OID a = OID::gen();
                OID b( a.str() );
                ASSERT_EQUALS( a.str() , b.str() );
                ASSERT( a == b );
            }
        };

        class IsValid {
        public:
            void run() {
                ASSERT( OID::isValid( "4d2b1a6f8e5cce2a38000000" ) );
                ASSERT( OID::isValid( "4D2B1A6F8E5CCE2A38000000" ) );
                ASSERT( ! OID::isValid( "some-pk" ) );
                ASSERT( ! OID::isValid( "4d2b1a6f8e5cce2a3800000" ) );
                ASSERT( ! OID::isValid( "4d2b1a6f8e5cce2a3800000g" ) );
                ASSERT( ! OID::isValid( "" ) );
            }
        };

        class Clear {
        public:
            void run() {
                OID a = OID::gen();
                a.clear();
                ASSERT( ! a.isSet() );
                ASSERT_EQUALS( "000000000000000000000000" , a.str() );
            }
        };

    }

    namespace ValueTests {

        class Missing {
        public:
            void run() {
                Value v;
                ASSERT( v.eoo() );
                ASSERT( ! v.trueValue() );
                ASSERT( Value::getNull().isNull() );
                ASSERT( ! Value::getNull().eoo() );
            }
        };

        class Numbers {
        public:
            void run() {
                ASSERT_EQUALS( NumberInt , Value( 3 ).type() );
                ASSERT_EQUALS( NumberLong , Value( 3LL ).type() );
                ASSERT_EQUALS( NumberDouble , Value( 3.0 ).type() );
                ASSERT( Value( 3 ) == Value( 3.0 ) );
                ASSERT( Value( 3LL ) == Value( 3 ) );
                ASSERT( Value( 2 ) < Value( 2.5 ) );
                ASSERT_EQUALS( 7 , Value( 7.9 ).numberInt() );
            }
        };

        class CanonicalOrder {
        public:
            void run() {
                ASSERT( Value::getNull() < Value( 1 ) );
                ASSERT( Value( 100 ) < Value( "a" ) );
                ASSERT( Value( "z" ) < Value( DOC( "a" << 1 ) ) );
                ASSERT( Value( DOC( "a" << 1 ) ) < DOC_ARRAY( 1 ) );
                ASSERT( Value( OID::gen() ) < Value( false ) );
                ASSERT( Value( true ) < Value::createDate( 0 ) );
            }
        };

        class Strings {
        public:
            void run() {
                Value v( "say \"hi\"" );
                ASSERT_EQUALS( String , v.type() );
                ASSERT_EQUALS( "say \"hi\"" , v.str() );
                ASSERT_EQUALS( "\"say \\\"hi\\\"\"" , v.toString() );
                ASSERT( Value( "a" ) < Value( "b" ) );
            }
        };

        class Regex {
        public:
            void run() {
                Value v = Value::createRegex( "^ab" , "i" );
                ASSERT_EQUALS( RegEx , v.type() );
                ASSERT_EQUALS( "^ab" , v.regex() );
                ASSERT_EQUALS( "i" , v.regexFlags() );
                ASSERT_EQUALS( "/^ab/i" , v.toString() );
                ASSERT( v != Value::createRegex( "^ab" ) );
            }
        };

        class WrongTypeAccess {
        public:
            void run() {
                ASSERT_THROWS( Value( 1 ).str() , MsgAssertionException );
                ASSERT_THROWS( Value( "x" ).embeddedObject() , MsgAssertionException );
            }
        };

        class ArrayValues {
        public:
            void run() {
                Value a = DOC_ARRAY( 1 << "two" << 3.0 );
                ASSERT( a.isArray() );
                ASSERT_EQUALS( 3U , a.array().size() );
                ASSERT_EQUALS( "two" , a.array()[1].str() );
                ASSERT_EQUALS( "[ 1, \"two\", 3 ]" , a.toString() );
                ASSERT( DOC_ARRAY( 1 ) < DOC_ARRAY( 1 << 2 ) );
            }
        };

        class TestReferent : public Referent {
        public:
            virtual string toString() const { return "TestReferent"; }
        };

        class References {
        public:
            void run() {
                boost::shared_ptr<Referent> r( new TestReferent() );
                Value a = Value::createReference( r );
                Value b = Value::createReference( r );
                Value c = Value::createReference( boost::shared_ptr<Referent>( new TestReferent() ) );
                ASSERT_EQUALS( ModelRef , a.type() );
                ASSERT( a == b );
                ASSERT( a != c );
                ASSERT( a.referent() == r );
                ASSERT_EQUALS( "<TestReferent>" , a.toString() );
            }
        };

    }

    namespace DocumentTests {

        class Order {
        public:
            void run() {
                Document d = DOC( "b" << 1 << "a" << 2 );
                vector<string> names = d.fieldNames();
                ASSERT_EQUALS( 2U , names.size() );
                ASSERT_EQUALS( "b" , names[0] );
                ASSERT_EQUALS( "a" , names[1] );
                ASSERT( d != DOC( "a" << 2 << "b" << 1 ) );
                ASSERT_EQUALS( "{ b: 1, a: 2 }" , d.toString() );
            }
        };

        class SetAndRemove {
        public:
            void run() {
                Document d = DOC( "a" << 1 << "b" << 2 );
                d.set( "a" , 5 );
                d.set( "c" , 6 );
                ASSERT_EQUALS( DOC( "a" << 5 << "b" << 2 << "c" << 6 ) , d );
                ASSERT( d.remove( "b" ) );
                ASSERT( ! d.remove( "b" ) );
                ASSERT_EQUALS( 2 , d.nFields() );
                ASSERT( ! d.hasField( "b" ) );
                ASSERT( d["b"].eoo() );
            }
        };

        class Dotted {
        public:
            void run() {
                Document d = DOC( "a" << DOC( "b" << DOC( "c" << 3 ) )
                                  << "list" << DOC_ARRAY( DOC( "x" << 1 ) << DOC( "x" << 2 ) ) );
                ASSERT_EQUALS( Value( 3 ) , d.getFieldDotted( "a.b.c" ) );
                ASSERT_EQUALS( Value( 2 ) , d.getFieldDotted( "list.1.x" ) );
                ASSERT( d.getFieldDotted( "a.x.c" ).eoo() );
                ASSERT( d.getFieldDotted( "list.5" ).eoo() );
                ASSERT( d.getFieldDotted( "list.x" ).eoo() );
            }
        };

        class Compare {
        public:
            void run() {
                ASSERT( DOC( "a" << 1 ) == DOC( "a" << 1.0 ) );
                ASSERT( DOC( "a" << 1 ).woCompare( DOC( "a" << 2 ) ) < 0 );
                ASSERT( DOC( "a" << 1 ).woCompare( DOC( "b" << 1 ) ) < 0 );
                ASSERT( Document().woCompare( DOC( "a" << 1 ) ) < 0 );
                ASSERT( Document().isEmpty() );
                ASSERT_EQUALS( "{}" , Document().toString() );
            }
        };

    }

    class All : public Suite {
    public:
        All() : Suite( "bson" ) {
        }

        void setupTests() {
            add< OIDTests::Gen >();
            add< OIDTests::FromString >();
            add< OIDTests::IsValid >();
            add< OIDTests::Clear >();
            add< ValueTests::Missing >();
            add< ValueTests::Numbers >();
            add< ValueTests::CanonicalOrder >();
            add< ValueTests::Strings >();
            add< ValueTests::Regex >();
            add< ValueTests::WrongTypeAccess >();
            add< ValueTests::ArrayValues >();
            add< ValueTests::References >();
            add< DocumentTests::Order >();
            add< DocumentTests::SetAndRemove >();
            add< DocumentTests::Dotted >();
            add< DocumentTests::Compare >();
        }
    } myall;

}
