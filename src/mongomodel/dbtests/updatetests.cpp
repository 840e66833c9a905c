// updatetests.cpp : $set / $inc modifiers.
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
#include "mongomodel/db/update.h"
#include "mongomodel/dbtests/dbtests.h"

namespace UpdateTests {

    class SetAndInc {
    public:
        void run() {
            ModSet mods( DOC( "$set" << DOC( "title" << "new" ) << "$inc" << DOC( "views" << 2 ) ) );
            ASSERT_EQUALS( 2U , mods.size() );
            Document out = mods.apply( DOC( "_id" << 1 << "title" << "old" << "views" << 3 ) );
            ASSERT_EQUALS( DOC( "_id" << 1 << "title" << "new" << "views" << 5 ) , out );
        }
    };

    class IncMissingField {
    public:
        void run() {
            ModSet mods( DOC( "$inc" << DOC( "n" << 1 ) ) );
            ASSERT_EQUALS( DOC( "a" << 1 << "n" << 1 ) , mods.apply( DOC( "a" << 1 ) ) );
        }
    };

    class IncDouble {
    public:
        void run() {
            ModSet mods( DOC( "$inc" << DOC( "n" << 0.5 ) ) );
            Document out = mods.apply( DOC( "n" << 1 ) );
            ASSERT_EQUALS( NumberDouble , out["n"].type() );
            ASSERT_EQUALS( 1.5 , out["n"].number() );
        }
    };

    class IncNonNumber {
    public:
        void run() {
            ModSet mods( DOC( "$inc" << DOC( "n" << 1 ) ) );
            ASSERT_THROWS( mods.apply( DOC( "n" << "x" ) ) , UserException );
            ASSERT_THROWS( ModSet( DOC( "$inc" << DOC( "n" << "x" ) ) ).apply( Document() ) , UserException );
        }
    };

    class SetDotted {
    public:
        void run() {
            ModSet mods( DOC( "$set" << DOC( "a.b" << 2 ) ) );
            ASSERT_EQUALS( DOC( "a" << DOC( "b" << 2 << "c" << 3 ) ) ,
                           mods.apply( DOC( "a" << DOC( "b" << 1 << "c" << 3 ) ) ) );
            ASSERT_EQUALS( DOC( "a" << DOC( "b" << 2 ) ) , mods.apply( Document() ) );
        }
    };

    class Unset {
    public:
        void run() {
            ModSet mods( DOC( "$unset" << DOC( "a" << 1 ) ) );
            ASSERT_EQUALS( DOC( "b" << 2 ) , mods.apply( DOC( "a" << 1 << "b" << 2 ) ) );
        }
    };

    class Invalid {
    public:
        void run() {
            ASSERT_THROWS( ModSet( DOC( "$push" << DOC( "a" << 1 ) ) ) , UserException );
            ASSERT_THROWS( ModSet( DOC( "$set" << DOC( "a" << 1 ) << "b" << 2 ) ) , UserException );
            ASSERT_THROWS( ModSet( DOC( "$set" << DOC( "_id" << 1 ) ) ) , UserException );
            ASSERT_THROWS( ModSet( DOC( "$set" << DOC( "a" << 1 ) << "$inc" << DOC( "a.b" << 1 ) ) ) , UserException );
        }
    };

    class UpsertFromQuery {
    public:
        void run() {
            ModSet mods( DOC( "$inc" << DOC( "n" << 1 ) ) );
            Document out = mods.createNewFromQuery( DOC( "name" << "x" << "age" << DOC( "$gt" << 3 ) ) );
            ASSERT_EQUALS( DOC( "name" << "x" << "n" << 1 ) , out );
        }
    };

    class IsModifier {
    public:
        void run() {
            ASSERT( isModifierUpdate( DOC( "$set" << DOC( "a" << 1 ) ) ) );
            ASSERT( ! isModifierUpdate( DOC( "a" << 1 ) ) );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "update" ) {
        }

        void setupTests() {
            add< SetAndInc >();
            add< IncMissingField >();
            add< IncDouble >();
            add< IncNonNumber >();
            add< SetDotted >();
            add< Unset >();
            add< Invalid >();
            add< UpsertFromQuery >();
            add< IsModifier >();
        }
    } myall;

}
