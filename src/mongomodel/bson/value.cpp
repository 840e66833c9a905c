// value.cpp

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
#include "mongomodel/bson/value.h"
#include "mongomodel/bson/document.h"

namespace mongomodel {

    const char * typeName( BSONType type ) {
        switch ( type ) {
        case EOO: return "EOO";
        case NumberDouble: return "NumberDouble";
        case String: return "String";
        case Object: return "Object";
        case Array: return "Array";
        case BinData: return "BinData";
        case jstOID: return "OID";
        case Bool: return "Bool";
        case Date: return "Date";
        case jstNULL: return "NULL";
        case RegEx: return "RegEx";
        case NumberInt: return "NumberInt";
        case NumberLong: return "NumberLong";
        case ModelRef: return "ModelRef";
        default: return "invalid";
        }
    }

    Value::Value() : _type( EOO ) , _bool( false ) , _long( 0 ) , _double( 0 ) { }

    Value::Value( bool b ) : _type( Bool ) , _bool( b ) , _long( 0 ) , _double( 0 ) { }

    Value::Value( int i ) : _type( NumberInt ) , _bool( false ) , _long( i ) , _double( 0 ) { }

    Value::Value( long i ) : _type( NumberLong ) , _bool( false ) , _long( i ) , _double( 0 ) { }

    Value::Value( unsigned i ) : _type( NumberLong ) , _bool( false ) , _long( i ) , _double( 0 ) { }

    Value::Value( long long i ) : _type( NumberLong ) , _bool( false ) , _long( i ) , _double( 0 ) { }

    Value::Value( double d ) : _type( NumberDouble ) , _bool( false ) , _long( 0 ) , _double( d ) { }

    Value::Value( const char *s ) : _type( String ) , _bool( false ) , _long( 0 ) , _double( 0 ) , _str( s ) { }

    Value::Value( const string& s ) : _type( String ) , _bool( false ) , _long( 0 ) , _double( 0 ) , _str( s ) { }

    Value::Value( const OID& oid ) : _type( jstOID ) , _bool( false ) , _long( 0 ) , _double( 0 ) , _oid( oid ) { }

    Value::Value( const Document& doc )
        : _type( Object ) , _bool( false ) , _long( 0 ) , _double( 0 ) , _doc( new Document( doc ) ) {
    }

    Value Value::getNull() {
        Value v;
        v._type = jstNULL;
        return v;
    }

    Value Value::createDate( Date_t millis ) {
        Value v;
        v._type = Date;
        v._long = millis;
        return v;
    }

    Value Value::createBinData( const string& bytes ) {
        Value v;
        v._type = BinData;
        v._str = bytes;
        return v;
    }

    Value Value::createArray( const vector<Value>& values ) {
        Value v;
        v._type = Array;
        v._array.reset( new vector<Value>( values ) );
        return v;
    }

    Value Value::createRegex( const string& pattern , const string& flags ) {
        Value v;
        v._type = RegEx;
        v._str = pattern;
        v._flags = flags;
        return v;
    }

    Value Value::createReference( const shared_ptr<Referent>& referent ) {
        verify( referent );
        Value v;
        v._type = ModelRef;
        v._referent = referent;
        return v;
    }

    void Value::_checkType( BSONType t , const char *what ) const {
        if ( _type == t )
            return;
        stringstream ss;
        ss << what << "() called on a value of type " << typeName( _type );
        msgasserted( 16021 , ss.str() );
    }

    bool Value::boolean() const {
        _checkType( Bool , "boolean" );
        return _bool;
    }

    int Value::numberInt() const {
        return (int) numberLong();
    }

    long long Value::numberLong() const {
        switch ( _type ) {
        case NumberInt:
        case NumberLong:
            return _long;
        case NumberDouble:
            return (long long) _double;
        default:
            _checkType( NumberLong , "numberLong" );
            return 0;
        }
    }

    double Value::number() const {
        switch ( _type ) {
        case NumberInt:
        case NumberLong:
            return (double) _long;
        case NumberDouble:
            return _double;
        default:
            _checkType( NumberDouble , "number" );
            return 0;
        }
    }

    const string& Value::str() const {
        if ( _type != RegEx )
            _checkType( String , "str" );
        return _str;
    }

    const string& Value::regexFlags() const {
        _checkType( RegEx , "regexFlags" );
        return _flags;
    }

    const string& Value::binData() const {
        _checkType( BinData , "binData" );
        return _str;
    }

    const OID& Value::oid() const {
        _checkType( jstOID , "oid" );
        return _oid;
    }

    Date_t Value::date() const {
        _checkType( Date , "date" );
        return _long;
    }

    const Document& Value::embeddedObject() const {
        _checkType( Object , "embeddedObject" );
        return *_doc;
    }

    const vector<Value>& Value::array() const {
        _checkType( Array , "array" );
        return *_array;
    }

    shared_ptr<Referent> Value::referent() const {
        _checkType( ModelRef , "referent" );
        return _referent;
    }

    bool Value::trueValue() const {
        switch ( _type ) {
        case EOO:
        case jstNULL:
            return false;
        case Bool:
            return _bool;
        case NumberInt:
        case NumberLong:
            return _long != 0;
        case NumberDouble:
            return _double != 0;
        default:
            return true;
        }
    }

    namespace {
        template< class T >
        int cmp3( const T& l , const T& r ) {
            if ( l < r ) return -1;
            if ( r < l ) return 1;
            return 0;
        }
    }

    int Value::woCompare( const Value& other ) const {
        int x = canonicalizeBSONType( _type ) - canonicalizeBSONType( other._type );
        if ( x != 0 )
            return x < 0 ? -1 : 1;

        switch ( _type ) {
        case EOO:
        case jstNULL:
            return 0;
        case Bool:
            return cmp3( _bool , other._bool );
        case NumberInt:
        case NumberLong:
        case NumberDouble:
            if ( _type != NumberDouble && other._type != NumberDouble )
                return cmp3( _long , other._long );
            return cmp3( number() , other.number() );
        case String:
        case BinData:
            return cmp3( _str , other._str );
        case jstOID: {
            int c = _oid.compare( other._oid );
            return c < 0 ? -1 : ( c > 0 ? 1 : 0 );
        }
        case Date:
            return cmp3( _long , other._long );
        case Object:
            return _doc->woCompare( *other._doc );
        case Array: {
            const vector<Value>& l = *_array;
            const vector<Value>& r = *other._array;
            for ( unsigned i = 0; i < l.size() && i < r.size(); i++ ) {
                int c = l[i].woCompare( r[i] );
                if ( c )
                    return c;
            }
            return cmp3( l.size() , r.size() );
        }
        case RegEx: {
            int c = cmp3( _str , other._str );
            if ( c )
                return c;
            return cmp3( _flags , other._flags );
        }
        case ModelRef:
            return cmp3( _referent.get() , other._referent.get() );
        default:
            verify( false );
            return 0;
        }
    }

    namespace {
        void appendEscaped( stringstream& ss , const string& s ) {
            ss << '"';
            for ( unsigned i = 0; i < s.size(); i++ ) {
                char c = s[i];
                switch ( c ) {
                case '"': ss << "\\\""; break;
                case '\\': ss << "\\\\"; break;
                case '\n': ss << "\\n"; break;
                case '\t': ss << "\\t"; break;
                default: ss << c;
                }
            }
            ss << '"';
        }
    }

    string Value::toString() const {
        stringstream ss;
        switch ( _type ) {
        case EOO:
            ss << "EOO";
            break;
        case jstNULL:
            ss << "null";
            break;
        case Bool:
            ss << ( _bool ? "true" : "false" );
            break;
        case NumberInt:
            ss << _long;
            break;
        case NumberLong:
            ss << _long;
            break;
        case NumberDouble:
            ss << _double;
            break;
        case String:
            appendEscaped( ss , _str );
            break;
        case BinData:
            ss << "BinData(" << _str.size() << ")";
            break;
        case jstOID:
            ss << "ObjectId('" << _oid.str() << "')";
            break;
        case Date:
            ss << "new Date(" << _long << ")";
            break;
        case RegEx:
            ss << "/" << _str << "/" << _flags;
            break;
        case Object:
            ss << _doc->toString();
            break;
        case Array: {
            ss << "[ ";
            const vector<Value>& a = *_array;
            for ( unsigned i = 0; i < a.size(); i++ ) {
                if ( i )
                    ss << ", ";
                ss << a[i].toString();
            }
            ss << ( a.empty() ? "]" : " ]" );
            break;
        }
        case ModelRef:
            ss << "<" << _referent->toString() << ">";
            break;
        default:
            ss << "?";
        }
        return ss.str();
    }

}
