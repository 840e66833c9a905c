// bson_codec.cpp


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
#include "mongomodel/bson/bson_codec.h"

namespace mongomodel {

    namespace {

        /* wire types read into a near Value form */
        enum WireOnlyTypes {
            Undefined = 6 ,
            Code = 13 ,
            Symbol = 14 ,
            Timestamp = 17
        };

        void appendInt( string& b , int x ) {
            unsigned u = (unsigned) x;
            for ( int i = 0; i < 4; i++ )
                b.push_back( (char)( ( u >> ( 8 * i ) ) & 0xff ) );
        }

        void appendLong( string& b , long long x ) {
            unsigned long long u = (unsigned long long) x;
            for ( int i = 0; i < 8; i++ )
                b.push_back( (char)( ( u >> ( 8 * i ) ) & 0xff ) );
        }

        void appendCStr( string& b , const string& s , const char *what ) {
            uassert( 16213 , string( "embedded null in " ) + what + ": " + s , s.find( '\0' ) == string::npos );
            b.append( s );
            b.push_back( '\0' );
        }

        void appendString( string& b , const string& s ) {
            appendInt( b , (int) s.size() + 1 );
            b.append( s );
            b.push_back( '\0' );
        }

        void appendDocument( string& b , const Document& d , int depth );
        void appendArray( string& b , const vector<Value>& a , int depth );

        void appendValue( string& b , const string& name , const Value& v , int depth ) {
            BSONType t = v.type();
            massert( 16214 , string( "cannot send a live model reference in field: " ) + name , t != ModelRef );
            massert( 16215 , string( "cannot send a missing value in field: " ) + name , t != EOO );

            b.push_back( (char) t );
            appendCStr( b , name , "field name" );

            switch ( t ) {
            case NumberDouble: {
                double d = v.number();
                long long bits;
                memcpy( &bits , &d , sizeof( bits ) );
                appendLong( b , bits );
                break;
            }
            case String:
                appendString( b , v.str() );
                break;
            case Object:
                appendDocument( b , v.embeddedObject() , depth + 1 );
                break;
            case Array:
                appendArray( b , v.array() , depth + 1 );
                break;
            case BinData:
                appendInt( b , (int) v.binData().size() );
                b.push_back( '\0' ); // generic subtype
                b.append( v.binData() );
                break;
            case jstOID:
                b.append( (const char *) v.oid().getData() , 12 );
                break;
            case Bool:
                b.push_back( v.boolean() ? 1 : 0 );
                break;
            case Date:
                appendLong( b , v.date() );
                break;
            case jstNULL:
                break;
            case RegEx:
                appendCStr( b , v.regex() , "regex" );
                appendCStr( b , v.regexFlags() , "regex options" );
                break;
            case NumberInt:
                appendInt( b , v.numberInt() );
                break;
            case NumberLong:
                appendLong( b , v.numberLong() );
                break;
            default:
                msgasserted( 16216 , string( "can't encode type " ) + typeName( t ) );
            }
        }

        void appendDocument( string& b , const Document& d , int depth ) {
            uassert( 16217 , "document nested too deeply" , depth <= BSONMaxDepth );
            size_t start = b.size();
            appendInt( b , 0 );
            for ( Document::const_iterator i = d.begin(); i != d.end(); ++i )
                appendValue( b , i->name , i->value , depth );
            b.push_back( '\0' );

            string len;
            appendInt( len , (int)( b.size() - start ) );
            b.replace( start , 4 , len );
        }

        void appendArray( string& b , const vector<Value>& a , int depth ) {
            uassert( 16217 , "document nested too deeply" , depth <= BSONMaxDepth );
            size_t start = b.size();
            appendInt( b , 0 );
            for ( unsigned i = 0; i < a.size(); i++ ) {
                stringstream ss;
                ss << i;
                appendValue( b , ss.str() , a[i] , depth );
            }
            b.push_back( '\0' );

            string len;
            appendInt( len , (int)( b.size() - start ) );
            b.replace( start , 4 , len );
        }

        /** bounds checked cursor over one encoded document */
        class Reader {
        public:
            Reader( const char *data , int len ) : _p( data ) , _end( data + len ) { }

            int left() const { return (int)( _end - _p ); }
            const char *pos() const { return _p; }

            void need( int n ) const {
                uassert( 16218 , "truncated BSON" , n >= 0 && n <= left() );
            }

            unsigned char byte() {
                need( 1 );
                return (unsigned char) *_p++;
            }

            int readInt() {
                need( 4 );
                unsigned u = 0;
                for ( int i = 0; i < 4; i++ )
                    u |= ( (unsigned)(unsigned char) _p[i] ) << ( 8 * i );
                _p += 4;
                return (int) u;
            }

            long long readLong() {
                need( 8 );
                unsigned long long u = 0;
                for ( int i = 0; i < 8; i++ )
                    u |= ( (unsigned long long)(unsigned char) _p[i] ) << ( 8 * i );
                _p += 8;
                return (long long) u;
            }

            string cstr() {
                const char *z = (const char *) memchr( _p , '\0' , left() );
                uassert( 16219 , "unterminated BSON string" , z );
                string s( _p , z - _p );
                _p = z + 1;
                return s;
            }

            string str() {
                int len = readInt();
                uassert( 16220 , "bad BSON string length" , len >= 1 );
                need( len );
                uassert( 16221 , "BSON string not null terminated" , _p[len - 1] == '\0' );
                string s( _p , len - 1 );
                _p += len;
                return s;
            }

            string bytes( int n ) {
                need( n );
                string s( _p , n );
                _p += n;
                return s;
            }

            void skip( int n ) {
                need( n );
                _p += n;
            }

        private:
            const char *_p;
            const char *_end;
        };

        Document readDocument( Reader& r , int depth , vector<Value>* asArray );

        Value readValue( Reader& r , int type , int depth ) {
            switch ( type ) {
            case NumberDouble: {
                long long bits = r.readLong();
                double d;
                memcpy( &d , &bits , sizeof( d ) );
                return Value( d );
            }
            case String:
            case Symbol:
            case Code:
                return Value( r.str() );
            case Object:
                return Value( readDocument( r , depth + 1 , 0 ) );
            case Array: {
                vector<Value> a;
                readDocument( r , depth + 1 , &a );
                return Value::createArray( a );
            }
            case BinData: {
                int len = r.readInt();
                uassert( 16222 , "bad BSON binary length" , len >= 0 );
                r.byte(); // subtype
                return Value::createBinData( r.bytes( len ) );
            }
            case Undefined:
            case jstNULL:
                return Value::getNull();
            case jstOID: {
                string raw = r.bytes( 12 );
                return Value( OID( toHexLower( raw.data() , 12 ) ) );
            }
            case Bool:
                return Value( r.byte() != 0 );
            case Date:
                return Value::createDate( r.readLong() );
            case RegEx: {
                string pattern = r.cstr();
                string flags = r.cstr();
                return Value::createRegex( pattern , flags );
            }
            case NumberInt:
                return Value( r.readInt() );
            case Timestamp:
            case NumberLong:
                return Value( r.readLong() );
            default: {
                stringstream ss;
                ss << "unsupported BSON type " << type;
                uasserted( 16223 , ss.str() );
                return Value();
            }
            }
        }

        Document readDocument( Reader& r , int depth , vector<Value>* asArray ) {
            uassert( 16217 , "document nested too deeply" , depth <= BSONMaxDepth );

            const char *start = r.pos();
            int len = r.readInt();
            uassert( 16224 , "bad BSON document length" , len >= 5 );
            r.need( len - 4 );
            Reader body( r.pos() , len - 5 );
            r.skip( len - 5 );
            uassert( 16225 , "BSON document not terminated" , r.byte() == 0 );
            verify( r.pos() - start == len );

            Document d;
            while ( body.left() > 0 ) {
                int type = (signed char) body.byte();
                string name = body.cstr();
                Value v = readValue( body , type , depth );
                if ( asArray )
                    asArray->push_back( v );
                else
                    d.append( name , v );
            }
            return d;
        }

    }

    string toBSON( const Document& d ) {
        string b;
        appendDocument( b , d , 0 );
        return b;
    }

    Document fromBSON( const char *data , int len , int *consumed ) {
        Reader r( data , len );
        Document d = readDocument( r , 0 , 0 );
        if ( consumed )
            *consumed = (int)( r.pos() - data );
        return d;
    }

}
