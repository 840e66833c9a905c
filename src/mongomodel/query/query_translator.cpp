// query_translator.cpp

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
#include "mongomodel/query/query_translator.h"

#include "mongomodel/db/errors.h"
#include "mongomodel/model/lazy_reference.h"

namespace mongomodel {

    const char * queryKindName( QueryKind kind ) {
        switch ( kind ) {
        case QUERY_READ: return "read";
        case QUERY_UPDATE_MULTI: return "update";
        case QUERY_DELETE: return "delete";
        }
        return "unknown";
    }

    string Command::toString() const {
        stringstream ss;
        ss << queryKindName( kind ) << " " << collection << " query: " << query.toString();
        if ( ! update.isEmpty() )
            ss << " update: " << update.toString();
        if ( ! sort.isEmpty() )
            ss << " sort: " << sort.toString();
        if ( skip )
            ss << " skip: " << skip;
        if ( limit )
            ss << " limit: " << limit;
        if ( ! flags.isEmpty() )
            ss << " flags: " << flags.toString();
        return ss.str();
    }

    string escapeRegex( const string& s ) {
        static const string special = "\\^$.|?*+()[]{}";
        string out;
        for ( unsigned i = 0; i < s.size(); i++ ) {
            if ( special.find( s[i] ) != string::npos )
                out += '\\';
            out += s[i];
        }
        return out;
    }

    namespace {

        bool isOperatorDoc( const Value& v ) {
            if ( ! v.isDocument() )
                return false;
            const Document& d = v.embeddedObject();
            return ! d.isEmpty() && d.begin()->name[0] == '$';
        }

        Value regexOp( const string& pattern , bool caseInsensitive ) {
            Document d;
            d.append( "$regex" , pattern );
            if ( caseInsensitive )
                d.append( "$options" , "i" );
            return Value( d );
        }

        Value op( const char * name , const Value& v ) {
            Document d;
            d.append( name , v );
            return Value( d );
        }

        string display( const Value& v ) {
            return v.type() == String ? v.str() : v.toString();
        }

    }

    const FieldDescriptor& QueryTranslator::fieldFor( const string& field ) const {
        const FieldDescriptor* f = _d.field( field );
        if ( ! f && field == "id" )
            f = &_d.pk();
        uassert( 16170 , "cannot resolve keyword '" + field + "' into field of " + _d.name() , f );
        return *f;
    }

    string QueryTranslator::columnFor( const string& field ) const {
        return fieldFor( field ).column();
    }

    Value QueryTranslator::convertPk( const Value& v ) const {
        if ( v.type() == jstOID )
            return v;
        if ( v.type() == String && OID::isValid( v.str() ) )
            return Value( OID( v.str() ) );

        stringstream ss;
        ss << "AutoField (default primary key) values must be strings representing an ObjectId on MongoDB (got '"
           << display( v ) << "' instead)";
        if ( ! _d.idHint().empty() )
            ss << ". Please make sure your " << _d.idHint() << " contains a valid ObjectId.";
        raiseError( InvalidIdentifierError( ss.str() ) );
        return Value();
    }

    Value QueryTranslator::convertValue( const FieldDescriptor& f , const Value& v ) const {
        if ( ! f.holdsObjectId() || v.isNull() || v.eoo() )
            return v;

        if ( v.type() == ModelRef ) {
            ModelInstancePtr inst = modelInstanceOf( v );
            if ( inst ) {
                uassert( 16172 , f.name() + ": related " + inst->toString() + " has not been saved" , inst->isSaved() );
                return convertPk( inst->pk() );
            }
            LazyModelInstancePtr lazy = lazyInstanceOf( v );
            uassert( 16173 , f.name() + ": can't use " + v.toString() + " as a key" , lazy );
            return convertPk( lazy->pk() );
        }
        return convertPk( v );
    }

    Value QueryTranslator::_condition( const FilterNode& n , const FieldDescriptor& f ) const {
        const Value& v = n.value;
        switch ( n.lookup ) {
        case LOOKUP_EXACT:
            return convertValue( f , v );
        case LOOKUP_IEXACT:
            return regexOp( "^" + escapeRegex( v.str() ) + "$" , true );
        case LOOKUP_CONTAINS:
        case LOOKUP_ICONTAINS:
            return regexOp( escapeRegex( v.str() ) , n.lookup == LOOKUP_ICONTAINS );
        case LOOKUP_STARTSWITH:
        case LOOKUP_ISTARTSWITH:
            return regexOp( "^" + escapeRegex( v.str() ) , n.lookup == LOOKUP_ISTARTSWITH );
        case LOOKUP_ENDSWITH:
        case LOOKUP_IENDSWITH:
            return regexOp( escapeRegex( v.str() ) + "$" , n.lookup == LOOKUP_IENDSWITH );
        case LOOKUP_REGEX:
        case LOOKUP_IREGEX:
            return regexOp( v.str() , n.lookup == LOOKUP_IREGEX );
        case LOOKUP_GT:
            return op( "$gt" , convertValue( f , v ) );
        case LOOKUP_GTE:
            return op( "$gte" , convertValue( f , v ) );
        case LOOKUP_LT:
            return op( "$lt" , convertValue( f , v ) );
        case LOOKUP_LTE:
            return op( "$lte" , convertValue( f , v ) );
        case LOOKUP_IN: {
            uassert( 16174 , f.name() + "__in needs a list" , v.isArray() );
            const vector<Value>& values = v.array();
            vector<Value> converted;
            for ( unsigned i = 0; i < values.size(); i++ )
                converted.push_back( convertValue( f , values[i] ) );
            return op( "$in" , Value::createArray( converted ) );
        }
        case LOOKUP_RANGE: {
            uassert( 16175 , f.name() + "__range needs a list of two values" , v.isArray() && v.array().size() == 2 );
            Document d;
            d.append( "$gte" , convertValue( f , v.array()[0] ) );
            d.append( "$lte" , convertValue( f , v.array()[1] ) );
            return Value( d );
        }
        case LOOKUP_ISNULL:
            if ( v.trueValue() )
                return Value::getNull();
            return op( "$ne" , Value::getNull() );
        case LOOKUP_YEAR:
        case LOOKUP_MONTH:
        case LOOKUP_DAY:
        case LOOKUP_WEEK_DAY:
            raiseError( UnsupportedQueryError( "MongoDB does not support year/month/day queries" ) );
        case LOOKUP_WEEK:
        case LOOKUP_QUARTER:
        case LOOKUP_ISO_YEAR:
        case LOOKUP_ISO_WEEK_DAY:
        case LOOKUP_DATE:
        case LOOKUP_TIME:
        case LOOKUP_HOUR:
        case LOOKUP_MINUTE:
        case LOOKUP_SECOND:
            raiseError( UnsupportedQueryError( string( "MongoDB does not support " ) + lookupName( n.lookup ) + " queries" ) );
        }
        uasserted( 16176 , string( "unsupported lookup " ) + lookupName( n.lookup ) );
        return Value();
    }

    Document QueryTranslator::_and( const vector< shared_ptr<const FilterNode> >& children ) const {
        vector<Document> parts;
        for ( unsigned i = 0; i < children.size(); i++ )
            parts.push_back( translateFilter( Filter( children[i] ) ) );

        // one document with conditions on the same column merged, if no operator repeats
        Document merged;
        bool clash = false;
        for ( unsigned i = 0; i < parts.size() && ! clash; i++ ) {
            for ( Document::const_iterator j = parts[i].begin(); j != parts[i].end(); ++j ) {
                Value existing = merged[j->name];
                if ( existing.eoo() ) {
                    merged.append( j->name , j->value );
                    continue;
                }
                if ( j->name[0] == '$' || ! isOperatorDoc( existing ) || ! isOperatorDoc( j->value ) ) {
                    clash = true;
                    break;
                }
                Document ops = existing.embeddedObject();
                const Document& more = j->value.embeddedObject();
                for ( Document::const_iterator k = more.begin(); k != more.end(); ++k ) {
                    if ( ops.hasField( k->name ) ) {
                        clash = true;
                        break;
                    }
                    ops.append( k->name , k->value );
                }
                if ( clash )
                    break;
                merged.set( j->name , Value( ops ) );
            }
        }
        if ( ! clash )
            return merged;

        ArrayBuilder b;
        for ( unsigned i = 0; i < parts.size(); i++ )
            b << Value( parts[i] );
        Document d;
        d.append( "$and" , b.arr() );
        return d;
    }

    Document QueryTranslator::_not( const FilterNode& child ) const {
        Document inner = translateFilter( Filter( shared_ptr<const FilterNode>( new FilterNode( child ) ) ) );

        if ( inner.nFields() == 1 && inner.begin()->name[0] != '$' ) {
            const string& column = inner.begin()->name;
            const Value& v = inner.begin()->value;
            Document d;
            if ( ! isOperatorDoc( v ) ) {
                if ( v.type() == RegEx )
                    d.append( column , op( "$not" , v ) );
                else
                    d.append( column , op( "$ne" , v ) );
                return d;
            }

            const Document& ops = v.embeddedObject();
            if ( ops.nFields() == 1 && ops.hasField( "$in" ) ) {
                d.append( column , op( "$nin" , ops["$in"] ) );
                return d;
            }
            if ( ops.nFields() == 1 && ops.hasField( "$ne" ) ) {
                d.append( column , ops["$ne"] );
                return d;
            }
            if ( ! ops.hasField( "$regex" ) ) {
                d.append( column , op( "$not" , v ) );
                return d;
            }
            // $not takes a bare regex, so only a lone $regex ( + $options ) can be folded into one
            if ( ops.nFields() == 1 || ( ops.nFields() == 2 && ops.hasField( "$options" ) ) ) {
                Value options = ops["$options"];
                Value re = Value::createRegex( ops["$regex"].str() , options.eoo() ? "" : options.str() );
                d.append( column , op( "$not" , re ) );
                return d;
            }
        }

        ArrayBuilder b;
        b << Value( inner );
        Document d;
        d.append( "$nor" , b.arr() );
        return d;
    }

    Document QueryTranslator::translateFilter( const Filter& f ) const {
        const FilterNode& n = f.node();
        Document d;
        switch ( n.kind ) {
        case FilterNode::EMPTY:
            break;
        case FilterNode::CONDITION: {
            const FieldDescriptor& field = fieldFor( n.field );
            d.append( field.column() , _condition( n , field ) );
            break;
        }
        case FilterNode::EMBEDDED_ATTRIBUTE: {
            const FieldDescriptor& field = fieldFor( n.field );
            d.append( field.column() + "." + n.key , n.value );
            break;
        }
        case FilterNode::AND:
            return _and( n.children );
        case FilterNode::OR: {
            ArrayBuilder b;
            for ( unsigned i = 0; i < n.children.size(); i++ )
                b << Value( translateFilter( Filter( n.children[i] ) ) );
            d.append( "$or" , b.arr() );
            break;
        }
        case FilterNode::NOT:
            return _not( *n.children[0] );
        }
        return d;
    }

    Document QueryTranslator::translateOrdering( const vector<string>& orderBy ) const {
        Document sort;
        for ( unsigned i = 0; i < orderBy.size(); i++ ) {
            string name = orderBy[i];
            int direction = 1;
            if ( ! name.empty() && name[0] == '-' ) {
                direction = -1;
                name = name.substr( 1 );
            }
            uassert( 16177 , "random ordering is not supported" , name != "?" );
            sort.set( columnFor( name ) , direction );
        }
        return sort;
    }

    Document QueryTranslator::translateUpdate( const UpdateSpec& u ) const {
        uassert( 16178 , "update without changes" , ! u.isEmpty() );

        Document sets;
        for ( unsigned i = 0; i < u.sets().size(); i++ ) {
            const FieldDescriptor& f = fieldFor( u.sets()[i].first );
            if ( f.isGridFS() )
                raiseError( RestrictedOperationError( "Updates on GridFSFields are not allowed" ) );
            uassert( 16179 , "can't update the primary key of " + _d.name() , ! f.isPrimaryKey() );
            sets.set( f.column() , convertValue( f , u.sets()[i].second ) );
        }

        Document incs;
        for ( unsigned i = 0; i < u.incs().size(); i++ ) {
            const FieldDescriptor& f = fieldFor( u.incs()[i].first );
            if ( f.isGridFS() )
                raiseError( RestrictedOperationError( "Updates on GridFSFields are not allowed" ) );
            uassert( 16180 , f.name() + ": $inc needs a number" , u.incs()[i].second.isNumber() );
            incs.set( f.column() , u.incs()[i].second );
        }

        Document update;
        if ( ! sets.isEmpty() )
            update.append( "$set" , sets );
        if ( ! incs.isEmpty() )
            update.append( "$inc" , incs );
        return update;
    }

    Command QueryTranslator::translate( QueryKind kind , const Filter& f , const vector<string>& orderBy ,
                                        int limit , int skip ) const {
        Command c;
        c.kind = kind;
        c.collection = _d.collection();
        c.query = translateFilter( f );
        if ( kind == QUERY_READ ) {
            c.sort = translateOrdering( orderBy );
            c.limit = limit;
            c.skip = skip;
        }
        else {
            uassert( 16181 , "sort/limit/skip only apply to reads" ,
                     orderBy.empty() && limit == 0 && skip == 0 );
        }
        if ( kind == QUERY_UPDATE_MULTI )
            c.flags.append( "multi" , true );
        LOG(2) << "translated " << f << " to " << c.toString() << endl;
        return c;
    }

}
