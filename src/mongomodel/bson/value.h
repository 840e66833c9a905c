// value.h

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

#pragma once

#include "mongomodel/bson/bsontypes.h"
#include "mongomodel/bson/oid.h"

namespace mongomodel {

    class Document;

    /**
       Something a Value can point at without owning its storage form,
       e.g. a live model instance.  Values of type ModelRef carry one.
     */
    class Referent {
    public:
        virtual ~Referent() { }
        virtual string toString() const = 0;
    };

    /**
       An immutable, copyable field value.

       A default constructed Value is EOO and stands for "missing".
       Copies share the underlying embedded document / array.
     */
    class Value {
    public:
        Value();
        Value( bool b );
        Value( int i );
        Value( long i );
        Value( unsigned i );
        Value( long long i );
        Value( double d );
        Value( const char *s );
        Value( const string& s );
        Value( const OID& oid );
        Value( const Document& doc );

        static Value getNull();
        static Value createDate( Date_t millis );
        static Value createBinData( const string& bytes );
        static Value createArray( const vector<Value>& values );
        static Value createRegex( const string& pattern , const string& flags = "" );
        static Value createReference( const shared_ptr<Referent>& referent );

        BSONType type() const { return _type; }

        /** true for the "missing" value */
        bool eoo() const { return _type == EOO; }
        bool isNull() const { return _type == jstNULL; }
        bool isNumber() const {
            return _type == NumberInt || _type == NumberLong || _type == NumberDouble;
        }
        bool isDocument() const { return _type == Object; }
        bool isArray() const { return _type == Array; }

        /* typed accessors.  massert()s if the value is not of the right type. */
        bool boolean() const;
        int numberInt() const;
        long long numberLong() const;
        double number() const;
        const string& str() const;
        const string& regex() const { return str(); }
        const string& regexFlags() const;
        const string& binData() const;
        const OID& oid() const;
        Date_t date() const;
        const Document& embeddedObject() const;
        const vector<Value>& array() const;
        shared_ptr<Referent> referent() const;

        /** truthiness as a query would see it: false, 0, null and missing are false */
        bool trueValue() const;

        /**
           cross-type comparison: first by canonical type order, then by value.
           numbers of different widths compare by numeric value.
         */
        int woCompare( const Value& other ) const;

        bool operator==( const Value& other ) const { return woCompare( other ) == 0; }
        bool operator!=( const Value& other ) const { return woCompare( other ) != 0; }
        bool operator<( const Value& other ) const { return woCompare( other ) < 0; }

        /** json-ish rendering, for logs and error messages */
        string toString() const;

    private:
        BSONType _type;
        bool _bool;
        long long _long;
        double _double;
        string _str;
        string _flags;
        OID _oid;
        shared_ptr<const Document> _doc;
        shared_ptr<const vector<Value> > _array;
        shared_ptr<Referent> _referent;

        void _checkType( BSONType t , const char *what ) const;
    };

    inline ostream& operator<<( ostream& s , const Value& v ) {
        return s << v.toString();
    }

}
