// matcher.cpp

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
#include "mongomodel/db/matcher.h"

namespace {
    inline pcrecpp::RE_Options flags2options(const char* flags){
        pcrecpp::RE_Options options;
        options.set_utf8(true);
        while ( flags && *flags ) {
            if ( *flags == 'i' )
                options.set_caseless(true);
            else if ( *flags == 'm' )
                options.set_multiline(true);
            else if ( *flags == 'x' )
                options.set_extended(true);
            else if ( *flags == 's' )
                options.set_dotall(true);
            flags++;
        }
        return options;
    }
}

namespace mongomodel {

    namespace {
        bool isAllDigits( const string& s ) {
            if ( s.empty() )
                return false;
            for ( unsigned i = 0; i < s.size(); i++ )
                if ( s[i] < '0' || s[i] > '9' )
                    return false;
            return true;
        }

        shared_ptr< pcrecpp::RE > compileRegex( const string& regex , const string& flags ) {
            shared_ptr< pcrecpp::RE > re( new pcrecpp::RE( regex , flags2options( flags.c_str() ) ) );
            uassert( 16030 , string( "invalid regular expression: " ) + re->error() , re->error().empty() );
            return re;
        }
    }

    void collectDottedValues( const Document& doc , const string& path , vector<Value>& out ) {
        size_t dot = path.find( '.' );
        Value v = doc.getField( path.substr( 0 , dot ) );
        if ( v.eoo() )
            return;
        if ( dot == string::npos ) {
            out.push_back( v );
            return;
        }

        string rest = path.substr( dot + 1 );
        if ( v.isDocument() ) {
            collectDottedValues( v.embeddedObject() , rest , out );
        }
        else if ( v.isArray() ) {
            const vector<Value>& arr = v.array();
            string next = rest.substr( 0 , rest.find( '.' ) );
            if ( isAllDigits( next ) ) {
                Document indexed;
                for ( unsigned i = 0; i < arr.size(); i++ ) {
                    stringstream ss;
                    ss << i;
                    indexed.append( ss.str() , arr[i] );
                }
                collectDottedValues( indexed , rest , out );
            }
            for ( unsigned i = 0; i < arr.size(); i++ ) {
                if ( arr[i].isDocument() )
                    collectDottedValues( arr[i].embeddedObject() , rest , out );
            }
        }
    }

    Matcher::Matcher( const Document& pattern ) : _pattern( pattern ) {
        for ( Document::const_iterator i = pattern.begin(); i != pattern.end(); ++i ) {
            const string& name = i->name;
            const Value& v = i->value;

            if ( name == "$or" || name == "$and" || name == "$nor" ) {
                uassert( 16031 , name + " requires an array" , v.isArray() );
                vector< shared_ptr< Matcher > >& target =
                    name == "$or" ? _orMatchers : ( name == "$and" ? _andMatchers : _norMatchers );
                const vector<Value>& clauses = v.array();
                uassert( 16032 , name + " requires a nonempty array" , ! clauses.empty() );
                for ( unsigned j = 0; j < clauses.size(); j++ ) {
                    uassert( 16033 , name + " entries must be objects" , clauses[j].isDocument() );
                    target.push_back( shared_ptr< Matcher >( new Matcher( clauses[j].embeddedObject() ) ) );
                }
                continue;
            }

            uassert( 16034 , string( "unknown top level operator: " ) + name , name.empty() || name[0] != '$' );
            parseClause( name , v );
        }
    }

    void Matcher::parseClause( const string& fieldName , const Value& v ) {
        if ( v.type() == RegEx ) {
            addRegex( fieldName , v.regex() , v.regexFlags() );
            return;
        }

        if ( v.isDocument() ) {
            const Document& opDoc = v.embeddedObject();
            if ( ! opDoc.isEmpty() && opDoc.begin()->name[0] == '$' ) {
                for ( Document::const_iterator i = opDoc.begin(); i != opDoc.end(); ++i )
                    addOp( fieldName , i->name , i->value , opDoc );
                return;
            }
        }

        _basics.push_back( ElementMatcher( fieldName , ElementMatcher::EQ , v ) );
    }

    void Matcher::addRegex( const string& fieldName , const string& regex , const string& flags ) {
        ElementMatcher em( fieldName , ElementMatcher::REGEX , Value::createRegex( regex , flags ) );
        em._re = compileRegex( regex , flags );
        _basics.push_back( em );
    }

    void Matcher::addOp( const string& fieldName , const string& op , const Value& v , const Document& opDoc ) {
        if ( op == "$gt" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::GT , v ) );
        else if ( op == "$gte" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::GTE , v ) );
        else if ( op == "$lt" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::LT , v ) );
        else if ( op == "$lte" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::LTE , v ) );
        else if ( op == "$ne" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::NE , v ) );
        else if ( op == "$in" || op == "$nin" ) {
            uassert( 16035 , op + " needs an array" , v.isArray() );
            ElementMatcher em( fieldName , op == "$in" ? ElementMatcher::IN : ElementMatcher::NIN , v );
            const vector<Value>& values = v.array();
            for ( unsigned i = 0; i < values.size(); i++ ) {
                if ( values[i].type() == RegEx )
                    em._inRegex.push_back( compileRegex( values[i].regex() , values[i].regexFlags() ) );
            }
            _basics.push_back( em );
        }
        else if ( op == "$all" ) {
            uassert( 16036 , "$all needs an array" , v.isArray() );
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::ALL , v ) );
        }
        else if ( op == "$exists" )
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::EXISTS , v ) );
        else if ( op == "$size" ) {
            uassert( 16037 , "$size needs a number" , v.isNumber() );
            _basics.push_back( ElementMatcher( fieldName , ElementMatcher::SIZE , v ) );
        }
        else if ( op == "$regex" ) {
            Value flags = opDoc.getField( "$options" );
            if ( v.type() == RegEx )
                addRegex( fieldName , v.regex() , flags.eoo() ? v.regexFlags() : flags.str() );
            else
                addRegex( fieldName , v.str() , flags.eoo() ? "" : flags.str() );
        }
        else if ( op == "$options" ) {
            uassert( 16038 , "$options needs a $regex" , opDoc.hasField( "$regex" ) );
        }
        else if ( op == "$elemMatch" ) {
            uassert( 16039 , "$elemMatch needs an object" , v.isDocument() );
            ElementMatcher em( fieldName , ElementMatcher::ELEM_MATCH , v );
            em._subMatcher.reset( new Matcher( v.embeddedObject() ) );
            _basics.push_back( em );
        }
        else if ( op == "$not" ) {
            uassert( 16040 , "$not needs a regex or a document" , v.isDocument() || v.type() == RegEx );
            ElementMatcher em( fieldName , ElementMatcher::NOT , v );
            Document negated;
            negated.append( fieldName , v );
            em._subMatcher.reset( new Matcher( negated ) );
            _basics.push_back( em );
        }
        else {
            uasserted( 16041 , string( "invalid operator: " ) + op );
        }
    }

    bool Matcher::equalOrContains( const Value& v , const Value& toMatch ) const {
        if ( v == toMatch )
            return true;
        if ( v.isArray() ) {
            const vector<Value>& arr = v.array();
            for ( unsigned i = 0; i < arr.size(); i++ )
                if ( arr[i] == toMatch )
                    return true;
        }
        return false;
    }

    bool Matcher::inSet( const ElementMatcher& em , const Value& v ) const {
        const vector<Value>& values = em._toMatch.array();
        for ( unsigned i = 0; i < values.size(); i++ ) {
            if ( values[i].type() != RegEx && equalOrContains( v , values[i] ) )
                return true;
        }
        for ( unsigned i = 0; i < em._inRegex.size(); i++ ) {
            if ( v.type() == String && em._inRegex[i]->PartialMatch( v.str() ) )
                return true;
        }
        return false;
    }

    /* a single reached value against a positive operator */
    bool Matcher::valueMatches( const ElementMatcher& em , const Value& v ) const {
        switch ( em._op ) {
        case ElementMatcher::EQ:
            return equalOrContains( v , em._toMatch );
        case ElementMatcher::IN:
            return inSet( em , v );
        case ElementMatcher::GT:
        case ElementMatcher::GTE:
        case ElementMatcher::LT:
        case ElementMatcher::LTE: {
            if ( v.isArray() ) {
                const vector<Value>& arr = v.array();
                for ( unsigned i = 0; i < arr.size(); i++ )
                    if ( valueMatches( em , arr[i] ) )
                        return true;
                return false;
            }
            // comparisons only hold within one canonical type
            if ( canonicalizeBSONType( v.type() ) != canonicalizeBSONType( em._toMatch.type() ) )
                return false;
            int c = v.woCompare( em._toMatch );
            if ( em._op == ElementMatcher::GT ) return c > 0;
            if ( em._op == ElementMatcher::GTE ) return c >= 0;
            if ( em._op == ElementMatcher::LT ) return c < 0;
            return c <= 0;
        }
        case ElementMatcher::REGEX: {
            if ( v.type() == String )
                return em._re->PartialMatch( v.str() );
            if ( v.isArray() ) {
                const vector<Value>& arr = v.array();
                for ( unsigned i = 0; i < arr.size(); i++ )
                    if ( arr[i].type() == String && em._re->PartialMatch( arr[i].str() ) )
                        return true;
            }
            return false;
        }
        case ElementMatcher::SIZE:
            return v.isArray() && (long long) v.array().size() == em._toMatch.numberLong();
        case ElementMatcher::ALL: {
            const vector<Value>& required = em._toMatch.array();
            if ( required.empty() )
                return false;
            for ( unsigned i = 0; i < required.size(); i++ )
                if ( ! equalOrContains( v , required[i] ) )
                    return false;
            return true;
        }
        case ElementMatcher::ELEM_MATCH: {
            if ( ! v.isArray() )
                return false;
            const vector<Value>& arr = v.array();
            for ( unsigned i = 0; i < arr.size(); i++ )
                if ( arr[i].isDocument() && em._subMatcher->matches( arr[i].embeddedObject() ) )
                    return true;
            return false;
        }
        default:
            verify( false );
            return false;
        }
    }

    bool Matcher::matchesElement( const ElementMatcher& em , const Document& doc ) const {
        vector<Value> values;
        collectDottedValues( doc , em._fieldName , values );

        switch ( em._op ) {
        case ElementMatcher::EXISTS:
            return values.empty() != em._toMatch.trueValue();
        case ElementMatcher::NOT:
            return ! em._subMatcher->matches( doc );
        case ElementMatcher::NE: {
            ElementMatcher eq( em._fieldName , ElementMatcher::EQ , em._toMatch );
            return ! matchesElement( eq , doc );
        }
        case ElementMatcher::NIN: {
            ElementMatcher in( em._fieldName , ElementMatcher::IN , em._toMatch );
            in._inRegex = em._inRegex;
            return ! matchesElement( in , doc );
        }
        default:
            break;
        }

        if ( values.empty() ) {
            // a missing field equals null
            if ( em._op == ElementMatcher::EQ )
                return em._toMatch.isNull();
            if ( em._op == ElementMatcher::IN )
                return inSet( em , Value::getNull() );
            return false;
        }

        for ( unsigned i = 0; i < values.size(); i++ ) {
            if ( valueMatches( em , values[i] ) )
                return true;
        }
        return false;
    }

    bool Matcher::matches( const Document& doc ) const {
        for ( unsigned i = 0; i < _basics.size(); i++ ) {
            if ( ! matchesElement( _basics[i] , doc ) )
                return false;
        }

        for ( unsigned i = 0; i < _andMatchers.size(); i++ ) {
            if ( ! _andMatchers[i]->matches( doc ) )
                return false;
        }

        for ( unsigned i = 0; i < _norMatchers.size(); i++ ) {
            if ( _norMatchers[i]->matches( doc ) )
                return false;
        }

        if ( _orMatchers.empty() )
            return true;
        for ( unsigned i = 0; i < _orMatchers.size(); i++ ) {
            if ( _orMatchers[i]->matches( doc ) )
                return true;
        }
        return false;
    }

}
