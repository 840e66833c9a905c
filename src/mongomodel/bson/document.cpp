// document.cpp

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
#include "mongomodel/bson/document.h"

namespace mongomodel {

    Value Document::getField( const string& name ) const {
        for ( const_iterator i = begin(); i != end(); ++i ) {
            if ( i->name == name )
                return i->value;
        }
        return Value();
    }

    namespace {
        bool isArrayIndex( const string& s , unsigned& idx ) {
            if ( s.empty() )
                return false;
            unsigned n = 0;
            for ( unsigned i = 0; i < s.size(); i++ ) {
                if ( s[i] < '0' || s[i] > '9' )
                    return false;
                n = n * 10 + ( s[i] - '0' );
            }
            idx = n;
            return true;
        }
    }

    Value Document::getFieldDotted( const string& path ) const {
        size_t dot = path.find( '.' );
        if ( dot == string::npos )
            return getField( path );

        Value sub = getField( path.substr( 0 , dot ) );
        string rest = path.substr( dot + 1 );

        while ( true ) {
            if ( sub.isDocument() )
                return sub.embeddedObject().getFieldDotted( rest );

            if ( ! sub.isArray() )
                return Value();

            size_t next = rest.find( '.' );
            string part = rest.substr( 0 , next );
            unsigned idx;
            if ( ! isArrayIndex( part , idx ) || idx >= sub.array().size() )
                return Value();
            Value elem = sub.array()[idx];
            if ( next == string::npos )
                return elem;
            sub = elem;
            rest = rest.substr( next + 1 );
        }
    }

    bool Document::hasField( const string& name ) const {
        return ! getField( name ).eoo();
    }

    Document& Document::append( const string& name , const Value& v ) {
        _elements.push_back( Element( name , v ) );
        return *this;
    }

    Document& Document::set( const string& name , const Value& v ) {
        for ( vector<Element>::iterator i = _elements.begin(); i != _elements.end(); ++i ) {
            if ( i->name == name ) {
                i->value = v;
                return *this;
            }
        }
        return append( name , v );
    }

    bool Document::remove( const string& name ) {
        for ( vector<Element>::iterator i = _elements.begin(); i != _elements.end(); ++i ) {
            if ( i->name == name ) {
                _elements.erase( i );
                return true;
            }
        }
        return false;
    }

    vector<string> Document::fieldNames() const {
        vector<string> names;
        for ( const_iterator i = begin(); i != end(); ++i )
            names.push_back( i->name );
        return names;
    }

    int Document::woCompare( const Document& other ) const {
        const_iterator l = begin();
        const_iterator r = other.begin();
        while ( true ) {
            if ( l == end() )
                return r == other.end() ? 0 : -1;
            if ( r == other.end() )
                return 1;

            int x = l->value.woCompare( r->value );
            if ( x != 0 )
                return x;
            x = l->name.compare( r->name );
            if ( x != 0 )
                return x < 0 ? -1 : 1;
            ++l;
            ++r;
        }
    }

    string Document::toString() const {
        if ( isEmpty() )
            return "{}";

        stringstream ss;
        ss << "{ ";
        for ( const_iterator i = begin(); i != end(); ++i ) {
            if ( i != begin() )
                ss << ", ";
            ss << i->name << ": " << i->value.toString();
        }
        ss << " }";
        return ss.str();
    }

}
