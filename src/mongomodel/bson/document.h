// document.h

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

#include "mongomodel/bson/value.h"

namespace mongomodel {

    /** one field of a Document */
    struct Element {
        Element( const string& n , const Value& v ) : name( n ) , value( v ) { }
        string name;
        Value value;
    };

    /**
       An ordered list of named values.  Field order is preserved, it matters for
       index keys and sort specifications.
     */
    class Document {
    public:
        typedef vector<Element>::const_iterator const_iterator;

        Document() { }

        /** @return the field, or an EOO value if not present */
        Value getField( const string& name ) const;
        Value operator[]( const string& name ) const { return getField( name ); }

        /**
           "a.b.c" walks embedded documents, "a.0" indexes into an array.
           @return EOO if the path does not resolve
         */
        Value getFieldDotted( const string& path ) const;

        bool hasField( const string& name ) const;

        /** appends without checking for an existing field of the same name */
        Document& append( const string& name , const Value& v );

        /** replaces the field in place if present, otherwise appends */
        Document& set( const string& name , const Value& v );

        /** @return true if something was removed */
        bool remove( const string& name );

        int nFields() const { return (int) _elements.size(); }
        bool isEmpty() const { return _elements.empty(); }

        const_iterator begin() const { return _elements.begin(); }
        const_iterator end() const { return _elements.end(); }

        vector<string> fieldNames() const;

        /** field by field comparison, names then values, in order */
        int woCompare( const Document& other ) const;

        bool operator==( const Document& other ) const { return woCompare( other ) == 0; }
        bool operator!=( const Document& other ) const { return woCompare( other ) != 0; }

        string toString() const;

    private:
        vector<Element> _elements;
    };

    inline ostream& operator<<( ostream& s , const Document& d ) {
        return s << d.toString();
    }

    class DocumentBuilder;

    /** the "value" half of  builder << "name" << value  */
    class DocumentValueStream {
    public:
        DocumentValueStream( DocumentBuilder* builder , const string& name )
            : _builder( builder ) , _name( name ) { }
        DocumentBuilder& operator<<( const Value& v );
    private:
        DocumentBuilder* _builder;
        string _name;
    };

    /**
       Usage:
         Document d = DOC( "name" << "joe" << "age" << 33 );
     */
    class DocumentBuilder : boost::noncopyable {
    public:
        DocumentBuilder() { }

        DocumentValueStream operator<<( const string& name ) {
            return DocumentValueStream( this , name );
        }

        DocumentBuilder& append( const string& name , const Value& v ) {
            _d.append( name , v );
            return *this;
        }

        Document obj() const { return _d; }

    private:
        Document _d;
    };

    inline DocumentBuilder& DocumentValueStream::operator<<( const Value& v ) {
        return _builder->append( _name , v );
    }

    /** Usage: Value a = DOC_ARRAY( "x" << 1 << true ); */
    class ArrayBuilder : boost::noncopyable {
    public:
        ArrayBuilder& operator<<( const Value& v ) {
            _values.push_back( v );
            return *this;
        }
        ArrayBuilder& append( const Value& v ) { return *this << v; }
        Value arr() const { return Value::createArray( _values ); }
        int len() const { return (int) _values.size(); }
    private:
        vector<Value> _values;
    };

}

#define DOC(x) (( mongomodel::DocumentBuilder() << x ).obj())
#define DOC_ARRAY(x) (( mongomodel::ArrayBuilder() << x ).arr())
