// lazyreftests.cpp : lazy references and automatic referencing.
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
#include "mongomodel/dbtests/dbtests.h"
#include "mongomodel/model/lazy_reference.h"
#include "mongomodel/query/serializer.h"

namespace LazyRefTests {

    class Base : public dbtests::ClientBase {
    public:
        Base() : raws( dbtests::model( "RawModel" ) ) {
        }

        LazyModelInstancePtr lazy( const Value& pk ) {
            return LazyModelInstancePtr( new LazyModelInstance( dbtests::model( "RawModel" ) , pk ) );
        }

        Document stored( const ModelInstance& inst ) {
            return raws.collection()->findOne( DOC( "_id" << OID( inst.pk().str() ) ) );
        }

        ModelManager raws;
    };

    /** turns automatic referencing on for the "default" alias while the test runs */
    class AutoRefBase : public Base {
    public:
        AutoRefBase() {
            ConnectionHandler::global().get( "default" )->setAutomaticReferencing( true );
        }
        ~AutoRefBase() {
            ConnectionHandler::global().get( "default" )->setAutomaticReferencing( false );
        }
    };

    class Equality : public Base {
    public:
        void run() {
            string id = OID::gen().str();
            LazyModelInstancePtr a = lazy( Value( id ) );
            LazyModelInstancePtr b = lazy( Value( id ) );
            LazyModelInstancePtr c = lazy( Value( OID::gen().str() ) );

            // nothing stored under these keys, comparing must not read
            ASSERT( *a == *b );
            ASSERT( *a != *c );
            ASSERT( ! a->isResolved() );
            ASSERT( ! b->isResolved() );

            LazyModelInstance other( dbtests::model( "DateModel" ) , Value( id ) );
            ASSERT( *a != other );
        }
    };

    class ResolvesOnce : public Base {
    public:
        void run() {
            ModelInstancePtr r = raws.create( DOC( "raw" << "before" ) );
            LazyModelInstancePtr l = lazy( r->pk() );
            ASSERT_EQUALS( "before" , l->get( "raw" ).str() );
            ASSERT( l->isResolved() );

            raws.collection()->update( DOC( "_id" << OID( r->pk().str() ) ) , DOC( "$set" << DOC( "raw" << "after" ) ) );
            ASSERT_EQUALS( "before" , l->get( "raw" ).str() );
            ASSERT_EQUALS( "after" , lazy( r->pk() )->get( "raw" ).str() );
        }
    };

    class RefersTo : public Base {
    public:
        void run() {
            ModelInstancePtr r = raws.create( DOC( "raw" << 1 ) );
            ModelInstancePtr s = raws.create( DOC( "raw" << 2 ) );
            ASSERT( lazy( r->pk() )->refersTo( *r ) );
            ASSERT( ! lazy( r->pk() )->refersTo( *s ) );
        }
    };

    class Missing : public Base {
    public:
        void run() {
            ASSERT_THROWS( lazy( Value( OID::gen().str() ) )->resolve() , DoesNotExist );
            ASSERT_THROWS( lazy( Value( "some-pk" ) )->resolve() , InvalidIdentifierError );
            ASSERT_THROWS( lazy( Value() ) , UserException );
            ASSERT_THROWS( lazy( Value::getNull() ) , UserException );
        }
    };

    class ToString : public Base {
    public:
        void run() {
            string id = OID::gen().str();
            ASSERT_EQUALS( "LazyRawModel(\"" + id + "\")" , lazy( Value( id ) )->toString() );
        }
    };

    class RefusedWithoutAutoRef : public Base {
    public:
        void run() {
            ModelInstancePtr inner = raws.create( DOC( "raw" << "inner" ) );
            ModelInstancePtr outer = raws.instance();
            outer->set( "raw" , DOC_ARRAY( Value::createReference( inner ) ) );
            try {
                raws.save( *outer );
                FAIL( "stored a model instance without automatic referencing" );
            }
            catch ( UnserializableReferenceError& e ) {
                ASSERT_EQUALS( 0U , string( e.what() ).find( "cannot encode object: " ) );
            }
            ASSERT_EQUALS( 1U , raws.count() );

            ModelManager entries( dbtests::model( "Entry" ) );
            ModelInstancePtr e = entries.instance();
            e->set( "tags" , DOC_ARRAY( "a" << Value::createReference( inner ) ) );
            ASSERT_THROWS( entries.save( *e ) , UnserializableReferenceError );
        }
    };

    class StoredAsReference : public AutoRefBase {
    public:
        void run() {
            ModelInstancePtr inner = raws.create( DOC( "raw" << "inner" ) );
            ModelInstancePtr outer = raws.create( DOC( "raw" << DOC_ARRAY( Value::createReference( inner ) << 5 ) ) );

            Value raw = stored( *outer )["raw"];
            ASSERT( raw.isArray() );
            ASSERT_EQUALS( 2U , raw.array().size() );
            ASSERT_EQUALS( Value( DOC( "_type" << "ref" << "_model" << "RawModel" << "pk" << OID( inner->pk().str() ) ) ) ,
                           raw.array()[0] );
            ASSERT( Serializer::isReference( raw.array()[0] ) );
            ASSERT_EQUALS( 5 , raw.array()[1].numberInt() );
        }
    };

    class LoadsAsLazy : public AutoRefBase {
    public:
        void run() {
            ModelInstancePtr inner = raws.create( DOC( "raw" << "inner" ) );
            ModelInstancePtr outer = raws.create( DOC( "raw" << DOC( "owner" << Value::createReference( inner ) ) ) );

            Value raw = raws.getByPk( outer->pk() )->get( "raw" );
            ASSERT( raw.isDocument() );
            LazyModelInstancePtr l = lazyInstanceOf( raw.embeddedObject()["owner"] );
            ASSERT( l );
            ASSERT( ! l->isResolved() );
            ASSERT_EQUALS( inner->pk().str() , l->pk().str() );
            ASSERT( l->refersTo( *inner ) );
            ASSERT_EQUALS( "inner" , l->get( "raw" ).str() );
        }
    };

    class SavesReferenced : public AutoRefBase {
    public:
        void run() {
            ModelInstancePtr inner = raws.instance();
            inner->set( "raw" , "new" );
            ModelInstancePtr outer = raws.create( DOC( "raw" << DOC_ARRAY( Value::createReference( inner ) ) ) );
            ASSERT( inner->isSaved() );
            ASSERT_EQUALS( 2U , raws.count() );
            ASSERT_EQUALS( Value( OID( inner->pk().str() ) ) ,
                           stored( *outer )["raw"].array()[0].embeddedObject()["pk"] );
        }
    };

    class LazyStoresAgain : public AutoRefBase {
    public:
        void run() {
            ModelInstancePtr inner = raws.create( DOC( "raw" << "inner" ) );
            ModelInstancePtr outer = raws.create( DOC( "raw" << DOC_ARRAY( Value::createReference( inner ) ) ) );

            // a loaded reference is saved back without being read
            ModelInstancePtr back = raws.getByPk( outer->pk() );
            raws.save( *back );
            LazyModelInstancePtr l = lazyInstanceOf( back->get( "raw" ).array()[0] );
            ASSERT( ! l->isResolved() );
            ASSERT_EQUALS( stored( *outer )["raw"] , DOC_ARRAY( DOC( "_type" << "ref" << "_model" << "RawModel"
                                                                     << "pk" << OID( inner->pk().str() ) ) ) );
        }
    };

    class ReferenceDocumentWithoutAutoRef : public Base {
    public:
        void run() {
            OID id = OID::gen();
            Document ref = DOC( "_type" << "ref" << "_model" << "RawModel" << "pk" << id );
            raws.collection()->insert( DOC( "_id" << OID::gen() << "raw" << ref ) );

            Value raw = raws.all()[0]->get( "raw" );
            ASSERT( raw.isDocument() );
            ASSERT_EQUALS( "ref" , raw.embeddedObject()["_type"].str() );
            ASSERT_EQUALS( id.str() , raw.embeddedObject()["pk"].str() );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "lazyref" ) {
        }

        void setupTests() {
            add< Equality >();
            add< ResolvesOnce >();
            add< RefersTo >();
            add< Missing >();
            add< ToString >();
            add< RefusedWithoutAutoRef >();
            add< StoredAsReference >();
            add< LoadsAsLazy >();
            add< SavesReferenced >();
            add< LazyStoresAgain >();
            add< ReferenceDocumentWithoutAutoRef >();
        }
    } myall;

}
