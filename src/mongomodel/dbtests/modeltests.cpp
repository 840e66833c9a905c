// modeltests.cpp : saving, reading and removing model instances.
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
#include "mongomodel/model/lazy_reference.h"
#include "mongomodel/dbtests/dbtests.h"

namespace ModelTests {

    class Base : public dbtests::ClientBase {
    public:
        Base() : entries( dbtests::model( "Entry" ) ) , raws( dbtests::model( "RawModel" ) ) {
        }

        Document stored( ModelManager& m , const ModelInstance& inst ) {
            return m.collection()->findOne( DOC( "_id" << OID( inst.pk().str() ) ) );
        }

        ModelInstancePtr entry( const string& title , int views ) {
            return entries.create( DOC( "title" << title << "views" << views ) );
        }

        ModelManager entries;
        ModelManager raws;
    };

    class SaveAssignsPk : public Base {
    public:
        void run() {
            ModelInstancePtr e = entries.instance();
            ASSERT( ! e->isSaved() );
            ASSERT( e->pk().eoo() );
            e->set( "title" , "hello" );
            entries.save( *e );

            ASSERT( e->isSaved() );
            ASSERT_EQUALS( String , e->pk().type() );
            ASSERT( OID::isValid( e->pk().str() ) );
            ASSERT_EQUALS( 1U , entries.count() );

            Document doc = stored( entries , *e );
            ASSERT_EQUALS( "_id" , doc.begin()->name );
            ASSERT_EQUALS( jstOID , doc["_id"].type() );
            ASSERT_EQUALS( "hello" , doc["title"].str() );
            ASSERT_EQUALS( 0 , doc["views"].numberInt() );
            ASSERT( ! doc.hasField( "published" ) );
            ASSERT( ! doc.hasField( "author_id" ) );
            ASSERT( ! doc.hasField( "id" ) );
        }
    };

    class SaveTwiceUpdates : public Base {
    public:
        void run() {
            ModelInstancePtr e = entry( "first" , 1 );
            Value pk = e->pk();
            e->set( "title" , "second" );
            entries.save( *e );
            ASSERT( pk == e->pk() );
            ASSERT_EQUALS( 1U , entries.count() );
            ASSERT_EQUALS( "second" , stored( entries , *e )["title"].str() );
        }
    };

    class ExplicitPk : public Base {
    public:
        void run() {
            string id = OID::gen().str();
            ModelInstancePtr e = entries.instance();
            e->setPk( Value( id ) );
            e->set( "title" , "mine" );
            entries.save( *e );
            ASSERT_EQUALS( id , e->pk().str() );
            ASSERT_EQUALS( "mine" , entries.getByPk( Value( id ) )->get( "title" ).str() );
        }
    };

    class InvalidPk : public Base {
    public:
        void run() {
            ModelInstancePtr e = entries.instance();
            e->setPk( Value( "some-pk" ) );
            ASSERT_THROWS( entries.save( *e ) , InvalidIdentifierError );
            ASSERT_EQUALS( 0U , entries.count() );
            ASSERT_THROWS( entries.getByPk( Value( "some-pk" ) ) , InvalidIdentifierError );
        }
    };

    class WrongModel : public Base {
    public:
        void run() {
            ModelInstancePtr r = raws.instance();
            ASSERT_THROWS( entries.save( *r ) , UserException );
        }
    };

    class RoundTrip : public Base {
    public:
        void run() {
            ModelInstancePtr e = entries.create( DOC( "title" << "t" << "views" << 3 << "published" << true
                                                      << "tags" << DOC_ARRAY( "a" << "b" )
                                                      << "meta" << DOC( "k" << 1 << "nested" << DOC( "x" << "y" ) ) ) );
            ModelInstancePtr back = entries.getByPk( e->pk() );
            ASSERT( back.get() != e.get() );
            ASSERT( *back == *e );
            ASSERT_EQUALS( "t" , back->get( "title" ).str() );
            ASSERT_EQUALS( 3 , back->get( "views" ).numberInt() );
            ASSERT_EQUALS( true , back->get( "published" ).boolean() );
            ASSERT_EQUALS( DOC_ARRAY( "a" << "b" ) , back->get( "tags" ) );
            ASSERT_EQUALS( Value( DOC( "k" << 1 << "nested" << DOC( "x" << "y" ) ) ) , back->get( "meta" ) );
            ASSERT( back->get( "author" ).isNull() );
            ASSERT( ! back->has( "author" ) );
        }
    };

    class Defaults : public Base {
    public:
        void run() {
            ModelInstancePtr e = entries.instance();
            ASSERT( ! e->has( "views" ) );
            ASSERT_EQUALS( 0 , e->get( "views" ).numberInt() );
            ASSERT( e->get( "title" ).isNull() );
            ASSERT_THROWS( e->get( "nosuch" ) , UserException );
            ASSERT_THROWS( e->set( "nosuch" , 1 ) , UserException );
        }
    };

    class Get : public Base {
    public:
        void run() {
            entry( "a" , 1 );
            entry( "b" , 1 );
            ASSERT_EQUALS( "a" , entries.get( Q( "title" , "a" ) )->get( "title" ).str() );

            try {
                entries.get( Q( "title" , "c" ) );
                FAIL( "found a record that doesn't exist" );
            }
            catch ( DoesNotExist& e ) {
                ASSERT_EQUALS( 0U , string( e.what() ).find( "Entry matching query does not exist" ) );
            }

            ASSERT_THROWS( entries.get( Q( "views" , 1 ) ) , MultipleObjectsReturned );
            ASSERT_THROWS( entries.getByPk( Value( OID::gen().str() ) ) , DoesNotExist );
        }
    };

    class FilterOrderLimitSkip : public Base {
    public:
        void run() {
            for ( int i = 1; i <= 5; i++ )
                entry( "e" , i );

            vector<string> order( 1 , "-views" );
            vector<ModelInstancePtr> found = entries.filter( Q( "views__gte" , 2 ) , order , 2 , 1 );
            ASSERT_EQUALS( 2U , found.size() );
            ASSERT_EQUALS( 4 , found[0]->get( "views" ).numberInt() );
            ASSERT_EQUALS( 3 , found[1]->get( "views" ).numberInt() );

            ASSERT_EQUALS( 5U , entries.all().size() );
            ASSERT_EQUALS( 3U , entries.count( Q( "views__in" , DOC_ARRAY( 1 << 2 << 5 ) ) ) );
            ASSERT_EQUALS( 3U , entries.count( Q( "views__range" , DOC_ARRAY( 2 << 4 ) ) ) );
            ASSERT_EQUALS( 2U , entries.count( ~Q( "views__lte" , 3 ) ) );
        }
    };

    class StringQueries : public Base {
    public:
        void run() {
            entry( "MongoDB rocks" , 1 );
            entry( "about mongo" , 2 );
            entry( "a.b" , 3 );

            ASSERT_EQUALS( 1U , entries.count( Q( "title__contains" , "mongo" ) ) );
            ASSERT_EQUALS( 2U , entries.count( Q( "title__icontains" , "mongo" ) ) );
            ASSERT_EQUALS( 1U , entries.count( Q( "title__istartswith" , "mongodb" ) ) );
            ASSERT_EQUALS( 1U , entries.count( Q( "title__endswith" , "mongo" ) ) );
            ASSERT_EQUALS( 1U , entries.count( Q( "title__iexact" , "ABOUT MONGO" ) ) );
            ASSERT_EQUALS( 1U , entries.count( Q( "title__contains" , "." ) ) );
            ASSERT_EQUALS( 2U , entries.count( ~Q( "title__icontains" , "rocks" ) ) );
            ASSERT_EQUALS( 2U , entries.count( Q( "title__regex" , "^[aM]" ) & Q( "views__gt" , 0 ) & ~Q( "title" , "a.b" ) ) );
        }
    };

    class OrQueries : public Base {
    public:
        void run() {
            entry( "a" , 1 );
            entry( "b" , 2 );
            entry( "c" , 3 );
            ASSERT_EQUALS( 2U , entries.count( Q( "title" , "a" ) | Q( "views" , 3 ) ) );
            ASSERT_EQUALS( 1U , entries.count( ~( Q( "title" , "a" ) | Q( "views" , 3 ) ) ) );
        }
    };

    class NullsAreNotStored : public Base {
    public:
        void run() {
            ModelInstancePtr r = raws.create( DOC( "raw" << Value::getNull() ) );
            ModelInstancePtr s = raws.create( DOC( "raw" << 5 ) );
            ASSERT( ! stored( raws , *r ).hasField( "raw" ) );
            ASSERT_EQUALS( 1U , raws.count( Q( "raw__isnull" , true ) ) );
            ASSERT_EQUALS( 1U , raws.count( Q( "raw__isnull" , false ) ) );
            ASSERT( raws.getByPk( r->pk() )->get( "raw" ).isNull() );
        }
    };

    class EmbeddedQueries : public Base {
    public:
        void run() {
            raws.create( DOC( "raw" << DOC( "a" << 1 << "b" << 2 ) ) );
            raws.create( DOC( "raw" << DOC_ARRAY( DOC( "b" << 3 ) << DOC( "b" << 4 ) ) ) );
            ASSERT_EQUALS( 1U , raws.count( Q( "raw" , A( "b" , 2 ) ) ) );
            ASSERT_EQUALS( 1U , raws.count( Q( "raw" , A( "b" , 4 ) ) ) );
            ASSERT_EQUALS( 0U , raws.count( Q( "raw" , A( "c" , 1 ) ) ) );
        }
    };

    class Dates : public Base {
    public:
        void run() {
            ModelManager dates( dbtests::model( "DateModel" ) );
            ModelInstancePtr d = dates.create( DOC( "date" << Value::createDate( 1294567890000LL ) ) );
            Value back = dates.getByPk( d->pk() )->get( "date" );
            ASSERT_EQUALS( Date , back.type() );
            ASSERT( back.date() == 1294567890000LL );
            ASSERT_EQUALS( 1U , dates.count( Q( "date__gt" , Value::createDate( 0 ) ) ) );
            ASSERT_THROWS( dates.count( Q( "date__year" , 2011 ) ) , UnsupportedQueryError );
        }
    };

    class UpdateMulti : public Base {
    public:
        void run() {
            entry( "a" , 1 );
            entry( "b" , 2 );
            entry( "c" , 3 );
            entries.update( Q( "views__lt" , 3 ) , UpdateSpec().inc( "views" , 10 ).set( "published" , true ) );
            ASSERT_EQUALS( 2U , entries.count( Q( "published" , true ) ) );
            ASSERT_EQUALS( 11 , entries.get( Q( "title" , "a" ) )->get( "views" ).numberInt() );
            ASSERT_EQUALS( 12 , entries.get( Q( "title" , "b" ) )->get( "views" ).numberInt() );
            ASSERT_EQUALS( 3 , entries.get( Q( "title" , "c" ) )->get( "views" ).numberInt() );

            ASSERT_THROWS( entries.update( Q( "title" , "a" ) , UpdateSpec() ) , UserException );
        }
    };

    class RemoveInstance : public Base {
    public:
        void run() {
            ModelInstancePtr a = entry( "a" , 1 );
            entry( "b" , 2 );
            entries.remove( *a );
            ASSERT( ! a->isSaved() );
            ASSERT_EQUALS( 1U , entries.count() );
            ASSERT_EQUALS( 0U , entries.count( Q( "title" , "a" ) ) );
            ASSERT_THROWS( entries.remove( *a ) , UserException );
        }
    };

    class RemoveFilter : public Base {
    public:
        void run() {
            for ( int i = 0; i < 4; i++ )
                entry( "e" , i );
            entries.remove( Q( "views__gte" , 2 ) );
            ASSERT_EQUALS( 2U , entries.count() );
            entries.remove( Filter() );
            ASSERT_EQUALS( 0U , entries.count() );
        }
    };

    class ForeignKeys : public Base {
    public:
        void run() {
            ModelInstancePtr author = raws.create( DOC( "raw" << "joe" ) );
            ModelInstancePtr e = entries.instance();
            e->set( "title" , "by joe" );
            e->set( "author" , Value::createReference( author ) );
            entries.save( *e );

            Document doc = stored( entries , *e );
            ASSERT_EQUALS( Value( OID( author->pk().str() ) ) , doc["author_id"] );

            ModelInstancePtr back = entries.getByPk( e->pk() );
            LazyModelInstancePtr lazy = lazyInstanceOf( back->get( "author" ) );
            ASSERT( lazy );
            ASSERT( ! lazy->isResolved() );
            ASSERT_EQUALS( author->pk().str() , lazy->pk().str() );
            ASSERT_EQUALS( "joe" , lazy->get( "raw" ).str() );
            ASSERT( lazy->isResolved() );

            ASSERT_EQUALS( 1U , entries.count( Q( "author" , Value::createReference( author ) ) ) );
            ASSERT_EQUALS( 1U , entries.count( Q( "author" , author->pk() ) ) );
            ASSERT_EQUALS( 0U , entries.count( Q( "author__isnull" , true ) ) );
        }
    };

    class UnsavedForeignKey : public Base {
    public:
        void run() {
            ModelInstancePtr author = raws.instance();
            ModelInstancePtr e = entries.instance();
            e->set( "author" , Value::createReference( author ) );
            ASSERT_THROWS( entries.save( *e ) , UserException );
            ASSERT_EQUALS( 0U , entries.count() );
        }
    };

    class Equality : public Base {
    public:
        void run() {
            ModelInstancePtr a = entry( "a" , 1 );
            ModelInstancePtr a2 = entries.getByPk( a->pk() );
            ModelInstancePtr b = entry( "b" , 1 );
            ASSERT( *a == *a2 );
            ASSERT( *a != *b );

            ModelInstancePtr u1 = entries.instance();
            ModelInstancePtr u2 = entries.instance();
            ASSERT( *u1 == *u1 );
            ASSERT( *u1 != *u2 );

            ModelInstancePtr r = raws.instance();
            r->setPk( a->pk() );
            ASSERT( *r != *a );

            ASSERT_EQUALS( "Entry(unsaved)" , u1->toString() );
            ASSERT_EQUALS( "Entry(\"" + a->pk().str() + "\")" , a->toString() );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "model" ) {
        }

        void setupTests() {
            add< SaveAssignsPk >();
            add< SaveTwiceUpdates >();
            add< ExplicitPk >();
            add< InvalidPk >();
            add< WrongModel >();
            add< RoundTrip >();
            add< Defaults >();
            add< Get >();
            add< FilterOrderLimitSkip >();
            add< StringQueries >();
            add< OrQueries >();
            add< NullsAreNotStored >();
            add< EmbeddedQueries >();
            add< Dates >();
            add< UpdateMulti >();
            add< RemoveInstance >();
            add< RemoveFilter >();
            add< ForeignKeys >();
            add< UnsavedForeignKey >();
            add< Equality >();
        }
    } myall;

}
