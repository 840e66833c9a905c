// update.cpp

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
#include "mongomodel/db/update.h"

namespace mongomodel {

    const char* Mod::modNames[] = { "$inc", "$set", "$unset" };
    unsigned Mod::modNamesNum = sizeof(Mod::modNames)/sizeof(char*);

    Mod::Op Mod::opFromStr( const string& s ) {
        for ( unsigned i = 0; i < modNamesNum; i++ ) {
            if ( s == modNames[i] )
                return (Op) i;
        }
        uasserted( 16050 , string( "Invalid modifier specified: " ) + s );
        return SET;
    }

    void setDotted( Document& doc , const string& path , const Value& v ) {
        size_t dot = path.find( '.' );
        if ( dot == string::npos ) {
            doc.set( path , v );
            return;
        }

        string first = path.substr( 0 , dot );
        Value existing = doc.getField( first );
        uassert( 16051 , string( "can't append to a non-object field: " ) + first ,
                 existing.eoo() || existing.isNull() || existing.isDocument() );

        Document sub;
        if ( existing.isDocument() )
            sub = existing.embeddedObject();
        setDotted( sub , path.substr( dot + 1 ) , v );
        doc.set( first , sub );
    }

    bool unsetDotted( Document& doc , const string& path ) {
        size_t dot = path.find( '.' );
        if ( dot == string::npos )
            return doc.remove( path );

        string first = path.substr( 0 , dot );
        Value existing = doc.getField( first );
        if ( ! existing.isDocument() )
            return false;

        Document sub = existing.embeddedObject();
        if ( ! unsetDotted( sub , path.substr( dot + 1 ) ) )
            return false;
        doc.set( first , sub );
        return true;
    }

    void Mod::apply( Document& doc ) const {
        switch ( op ) {
        case SET:
            setDotted( doc , fieldName , elt );
            break;
        case UNSET:
            unsetDotted( doc , fieldName );
            break;
        case INC: {
            uassert( 16052 , "Modifier $inc allowed for numbers only" , elt.isNumber() );
            Value current = doc.getFieldDotted( fieldName );
            if ( current.eoo() ) {
                setDotted( doc , fieldName , elt );
                break;
            }
            uassert( 16053 , string( "Cannot apply $inc modifier to non-number: " ) + fieldName ,
                     current.isNumber() );
            if ( current.type() == NumberDouble || elt.type() == NumberDouble )
                setDotted( doc , fieldName , current.number() + elt.number() );
            else if ( current.type() == NumberInt && elt.type() == NumberInt )
                setDotted( doc , fieldName , current.numberInt() + elt.numberInt() );
            else
                setDotted( doc , fieldName , current.numberLong() + elt.numberLong() );
            break;
        }
        }
    }

    ModSet::ModSet( const Document& updateDoc ) {
        for ( Document::const_iterator i = updateDoc.begin(); i != updateDoc.end(); ++i ) {
            uassert( 16054 , string( "mixing modifiers and plain fields: " ) + i->name ,
                     ! i->name.empty() && i->name[0] == '$' );
            Mod::Op op = Mod::opFromStr( i->name );
            uassert( 16055 , string( "Modifier " ) + i->name + " needs an object" , i->value.isDocument() );

            const Document& fields = i->value.embeddedObject();
            for ( Document::const_iterator f = fields.begin(); f != fields.end(); ++f ) {
                uassert( 10148 , "Mod on _id not allowed" , f->name != "_id" );
                uassert( 16056 , string( "conflicting mods on field: " ) + f->name , ! haveModForField( f->name ) );
                Mod m;
                m.op = op;
                m.fieldName = f->name;
                m.elt = f->value;
                _mods.push_back( m );
            }
        }
    }

    bool ModSet::haveModForField( const string& fieldName ) const {
        for ( unsigned i = 0; i < _mods.size(); i++ ) {
            const string& other = _mods[i].fieldName;
            if ( other == fieldName )
                return true;
            // one is a parent of the other
            const string& shorter = other.size() < fieldName.size() ? other : fieldName;
            const string& longer = other.size() < fieldName.size() ? fieldName : other;
            if ( longer.compare( 0 , shorter.size() , shorter ) == 0 && longer[shorter.size()] == '.' )
                return true;
        }
        return false;
    }

    Document ModSet::apply( const Document& in ) const {
        Document out = in;
        for ( unsigned i = 0; i < _mods.size(); i++ )
            _mods[i].apply( out );
        return out;
    }

    Document ModSet::createNewFromQuery( const Document& query ) const {
        Document newObj;
        for ( Document::const_iterator i = query.begin(); i != query.end(); ++i ) {
            if ( i->name.empty() || i->name[0] == '$' )
                continue;
            if ( i->value.isDocument() ) {
                const Document& sub = i->value.embeddedObject();
                if ( ! sub.isEmpty() && sub.begin()->name[0] == '$' )
                    continue;
            }
            if ( i->value.type() == RegEx )
                continue;
            setDotted( newObj , i->name , i->value );
        }
        return apply( newObj );
    }

    string ModSet::toString() const {
        stringstream ss;
        ss << "{ ";
        for ( unsigned i = 0; i < _mods.size(); i++ ) {
            if ( i )
                ss << ", ";
            ss << Mod::modNames[_mods[i].op] << ": { " << _mods[i].fieldName << ": " << _mods[i].elt.toString() << " }";
        }
        ss << " }";
        return ss.str();
    }

    bool isModifierUpdate( const Document& update ) {
        return ! update.isEmpty() && ! update.begin()->name.empty() && update.begin()->name[0] == '$';
    }

}
