// filter.cpp

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
#include "mongomodel/query/filter.h"

namespace mongomodel {

    namespace {
        const char * lookupNames[] = {
            "exact" , "iexact" , "contains" , "icontains" , "gt" , "gte" , "lt" , "lte" , "in" ,
            "startswith" , "istartswith" , "endswith" , "iendswith" , "range" , "isnull" ,
            "regex" , "iregex" , "year" , "month" , "day" , "week_day" ,
            "week" , "quarter" , "iso_year" , "iso_week_day" , "date" , "time" , "hour" , "minute" , "second"
        };
        const unsigned nLookups = sizeof( lookupNames ) / sizeof( char* );
    }

    const char * lookupName( LookupType t ) {
        verify( (unsigned) t < nLookups );
        return lookupNames[t];
    }

    bool lookupFromName( const string& name , LookupType& t ) {
        for ( unsigned i = 0; i < nLookups; i++ ) {
            if ( name == lookupNames[i] ) {
                t = (LookupType) i;
                return true;
            }
        }
        return false;
    }

    string FilterNode::toString() const {
        stringstream ss;
        switch ( kind ) {
        case EMPTY:
            ss << "(all)";
            break;
        case CONDITION:
            ss << field << "__" << lookupName( lookup ) << "=" << value.toString();
            break;
        case EMBEDDED_ATTRIBUTE:
            ss << field << "=A(" << key << ", " << value.toString() << ")";
            break;
        case NOT:
            ss << "NOT " << children[0]->toString();
            break;
        case AND:
        case OR:
            ss << "(";
            for ( unsigned i = 0; i < children.size(); i++ ) {
                if ( i )
                    ss << ( kind == AND ? " AND " : " OR " );
                ss << children[i]->toString();
            }
            ss << ")";
            break;
        }
        return ss.str();
    }

    Filter Filter::_combine( FilterNode::Kind kind , const Filter& other ) const {
        if ( isEmpty() )
            return other;
        if ( other.isEmpty() )
            return *this;

        shared_ptr<FilterNode> n( new FilterNode() );
        n->kind = kind;
        // flatten (a & b) & c into one node
        const Filter* parts[] = { this , &other };
        for ( int i = 0; i < 2; i++ ) {
            const FilterNode& p = parts[i]->node();
            if ( p.kind == kind )
                n->children.insert( n->children.end() , p.children.begin() , p.children.end() );
            else
                n->children.push_back( parts[i]->_node );
        }
        return Filter( n );
    }

    Filter Filter::operator&( const Filter& other ) const {
        return _combine( FilterNode::AND , other );
    }

    Filter Filter::operator|( const Filter& other ) const {
        return _combine( FilterNode::OR , other );
    }

    Filter Filter::operator~() const {
        uassert( 16160 , "can't negate an empty filter" , ! isEmpty() );
        if ( _node->kind == FilterNode::NOT )
            return Filter( _node->children[0] );
        shared_ptr<FilterNode> n( new FilterNode() );
        n->kind = FilterNode::NOT;
        n->children.push_back( _node );
        return Filter( n );
    }

    Filter Q( const string& fieldAndLookup , const Value& value ) {
        shared_ptr<FilterNode> n( new FilterNode() );
        n->kind = FilterNode::CONDITION;
        n->field = fieldAndLookup;
        n->value = value;

        size_t pos = fieldAndLookup.rfind( "__" );
        if ( pos != string::npos ) {
            LookupType t;
            if ( lookupFromName( fieldAndLookup.substr( pos + 2 ) , t ) ) {
                n->field = fieldAndLookup.substr( 0 , pos );
                n->lookup = t;
            }
        }
        uassert( 16161 , "filter needs a field name: " + fieldAndLookup , ! n->field.empty() );
        return Filter( n );
    }

    Filter Q( const string& field , const A& a ) {
        uassert( 16162 , "A() needs a key" , ! a.key.empty() );
        shared_ptr<FilterNode> n( new FilterNode() );
        n->kind = FilterNode::EMBEDDED_ATTRIBUTE;
        n->field = field;
        n->key = a.key;
        n->value = a.value;
        return Filter( n );
    }

}
