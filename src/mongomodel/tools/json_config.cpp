/*
 *    Copyright (C) 2010 10gen Inc.
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

// json_config.cpp

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/filesystem/operations.hpp>

#include "mongomodel/pch.h"
#include "mongomodel/tools/json_config.h"

namespace pt = boost::property_tree;

namespace mongomodel {

    namespace {

        /* the json reader keeps every scalar as text, guess the type back */
        Value scalarFromText( const string& s ) {
            if ( s == "true" )
                return Value( true );
            if ( s == "false" )
                return Value( false );
            if ( s == "null" )
                return Value::getNull();
            if ( s.empty() )
                return Value( s );
            char * end = 0;
            errno = 0;
            long long n = strtoll( s.c_str() , &end , 10 );
            if ( *end == '\0' && errno == 0 )
                return Value( n );
            double d = strtod( s.c_str() , &end );
            if ( *end == '\0' )
                return Value( d );
            return Value( s );
        }

        bool isArray( const pt::ptree& t ) {
            if ( t.empty() )
                return false;
            for ( pt::ptree::const_iterator i = t.begin(); i != t.end(); ++i ) {
                if ( ! i->first.empty() )
                    return false;
            }
            return true;
        }

        Value valueFromTree( const pt::ptree& t ) {
            if ( t.empty() )
                return scalarFromText( t.data() );

            if ( isArray( t ) ) {
                vector<Value> values;
                for ( pt::ptree::const_iterator i = t.begin(); i != t.end(); ++i )
                    values.push_back( valueFromTree( i->second ) );
                return Value::createArray( values );
            }

            Document d;
            for ( pt::ptree::const_iterator i = t.begin(); i != t.end(); ++i )
                d.append( i->first , valueFromTree( i->second ) );
            return Value( d );
        }

        vector<string> stringList( const pt::ptree& t , const string& key ) {
            vector<string> result;
            boost::optional<const pt::ptree&> list = t.get_child_optional( key );
            if ( ! list )
                return result;
            for ( pt::ptree::const_iterator i = list->begin(); i != list->end(); ++i )
                result.push_back( i->second.data() );
            return result;
        }

        FieldDescriptor fieldFromTree( const string& model , const pt::ptree& t ) {
            string name = t.get<string>( "name" , "" );
            uassert( 16200 , model + ": field without a name" , ! name.empty() );

            string typeName = t.get<string>( "type" , "" );
            FieldType type;
            uassert( 16201 , model + "." + name + ": unknown field type '" + typeName + "'" ,
                     fieldTypeFromName( typeName , type ) );

            FieldDescriptor f( name , type );
            string column = t.get<string>( "db_column" , "" );
            if ( ! column.empty() )
                f.dbColumn( column );
            f.dbIndex( t.get<bool>( "db_index" , false ) );
            f.unique( t.get<bool>( "unique" , false ) );
            f.sparse( t.get<bool>( "sparse" , false ) );
            f.primaryKey( t.get<bool>( "primary_key" , type == AutoField ) );
            f.versioning( t.get<bool>( "versioning" , false ) );
            f.autodelete( t.get<bool>( "autodelete" , true ) );

            string related = t.get<string>( "to" , "" );
            if ( ! related.empty() )
                f.to( related );

            boost::optional<const pt::ptree&> def = t.get_child_optional( "default" );
            if ( def )
                f.defaultValue( valueFromTree( *def ) );
            return f;
        }

        IndexSpec indexFromTree( const string& model , const pt::ptree& t ) {
            IndexSpec spec;
            boost::optional<const pt::ptree&> fields = t.get_child_optional( "fields" );
            uassert( 16202 , model + ": index without fields" , fields );
            for ( pt::ptree::const_iterator i = fields->begin(); i != fields->end(); ++i ) {
                const pt::ptree& entry = i->second;
                if ( entry.empty() ) {
                    spec.on( entry.data() );
                    continue;
                }
                uassert( 16203 , model + ": index entries are [ name , direction ]" , entry.size() == 2 );
                pt::ptree::const_iterator j = entry.begin();
                string key = j->second.data();
                ++j;
                spec.on( key , j->second.get_value<int>() );
            }
            spec.unique( t.get<bool>( "unique" , false ) );
            spec.sparse( t.get<bool>( "sparse" , false ) );
            return spec;
        }

        shared_ptr<const ModelDescriptor> modelFromTree( const pt::ptree& t ) {
            string name = t.get<string>( "name" , "" );
            uassert( 16204 , "model without a name" , ! name.empty() );

            ModelDescriptorBuilder b( name );
            string collection = t.get<string>( "collection" , "" );
            if ( ! collection.empty() )
                b.collection( collection );
            string idHint = t.get<string>( "id_hint" , "" );
            if ( ! idHint.empty() )
                b.idHint( idHint );

            boost::optional<const pt::ptree&> fields = t.get_child_optional( "fields" );
            if ( fields ) {
                for ( pt::ptree::const_iterator i = fields->begin(); i != fields->end(); ++i )
                    b.field( fieldFromTree( name , i->second ) );
            }

            vector<string> descending = stringList( t , "descending_indexes" );
            for ( unsigned i = 0; i < descending.size(); i++ )
                b.descendingIndex( descending[i] );

            boost::optional<const pt::ptree&> indexes = t.get_child_optional( "indexes" );
            if ( indexes ) {
                for ( pt::ptree::const_iterator i = indexes->begin(); i != indexes->end(); ++i )
                    b.index( indexFromTree( name , i->second ) );
            }
            return b.done();
        }

        pt::ptree parse( istream& in , const string& what ) {
            pt::ptree t;
            try {
                pt::read_json( in , t );
            }
            catch ( pt::json_parser_error& e ) {
                uasserted( 16205 , "bad json in " + what + ": " + e.what() );
            }
            return t;
        }

        void openFile( ifstream& in , const string& fileName ) {
            boost::filesystem::path p( fileName );
            uassert( 16209 , "file not found: " + fileName , boost::filesystem::exists( p ) );
            uassert( 16210 , fileName + " is a directory" , ! boost::filesystem::is_directory( p ) );
            in.open( fileName.c_str() );
            uassert( 16206 , "couldn't open file: " + fileName , in.is_open() );
        }

    }

    ConnectionSettings settingsFromJson( istream& in ) {
        const pt::ptree t = parse( in , "settings" );

        ConnectionSettings s;
        s.host = t.get<string>( "HOST" , s.host );
        s.port = t.get<int>( "PORT" , s.port );
        s.name = t.get<string>( "NAME" , s.name );
        s.user = t.get<string>( "USER" , s.user );
        s.password = t.get<string>( "PASSWORD" , s.password );
        s.driver = t.get<string>( "DRIVER" , s.driver );
        s.debug = t.get<bool>( "DEBUG" , s.debug );
        s.automaticReferencing = t.get<bool>( "AUTOMATIC_REFERENCING" , s.automaticReferencing );

        boost::optional<const pt::ptree&> options = t.get_child_optional( "OPTIONS" );
        if ( options && ! options->empty() ) {
            Value v = valueFromTree( *options );
            uassert( 16207 , "OPTIONS must be an object" , v.isDocument() );
            s.options = v.embeddedObject();
        }
        LOG(1) << "settings: " << s.toString() << endl;
        return s;
    }

    ConnectionSettings loadSettingsFile( const string& fileName ) {
        ifstream in;
        openFile( in , fileName );
        return settingsFromJson( in );
    }

    vector< shared_ptr<const ModelDescriptor> > schemaFromJson( istream& in ) {
        const pt::ptree t = parse( in , "schema" );

        vector< shared_ptr<const ModelDescriptor> > models;
        boost::optional<const pt::ptree&> list = t.get_child_optional( "models" );
        uassert( 16208 , "schema needs a \"models\" list" , list );
        for ( pt::ptree::const_iterator i = list->begin(); i != list->end(); ++i ) {
            shared_ptr<const ModelDescriptor> d = modelFromTree( i->second );
            Schema::global().registerModel( d );
            LOG(1) << "loaded model " << d->toString() << endl;
            models.push_back( d );
        }
        return models;
    }

    vector< shared_ptr<const ModelDescriptor> > loadSchemaFile( const string& fileName ) {
        ifstream in;
        openFile( in , fileName );
        return schemaFromJson( in );
    }

}
