// configtests.cpp : json settings and schema files, model descriptors.
//

/**
*    Copyright (C) 2008 10gen Inc.
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

#include "mongomodel/pch.h"
#include "mongomodel/dbtests/dbtests.h"
#include "mongomodel/tools/json_config.h"

namespace ConfigTests {

    ConnectionSettings settings( const string& json ) {
        istringstream in( json );
        return settingsFromJson( in );
    }

    vector< boost::shared_ptr<const ModelDescriptor> > schema( const string& json ) {
        istringstream in( json );
        return schemaFromJson( in );
    }

    class SettingsDefaults {
    public:
        void run() {
            ConnectionSettings s = settings( "{ \"NAME\" : \"blog\" }" );
            ASSERT_EQUALS( "blog" , s.name );
            ASSERT_EQUALS( "localhost" , s.host );
            ASSERT_EQUALS( 27017 , s.port );
            ASSERT_EQUALS( "mongodb" , s.driver );
            ASSERT( ! s.debug );
            ASSERT( ! s.automaticReferencing );
            ASSERT( s.options.isEmpty() );
        }
    };

    class SettingsAll {
    public:
        void run() {
            ConnectionSettings s = settings( "{ \"HOST\" : \"db1\" , \"PORT\" : 27018 , \"NAME\" : \"blog\" ,"
                                             "  \"USER\" : \"joe\" , \"PASSWORD\" : \"pw\" , \"DRIVER\" : \"memory\" ,"
                                             "  \"DEBUG\" : true , \"AUTOMATIC_REFERENCING\" : true ,"
                                             "  \"OPTIONS\" : { \"SLAVE_OKAY\" : true , \"NETWORK_TIMEOUT\" : 2.5 ,"
                                             "                \"OPERATIONS\" : { \"save\" : { \"safe\" : true , \"w\" : 2 } } } }" );
            ASSERT_EQUALS( "db1" , s.host );
            ASSERT_EQUALS( 27018 , s.port );
            ASSERT_EQUALS( "joe" , s.user );
            ASSERT_EQUALS( "pw" , s.password );
            ASSERT( s.debug );
            ASSERT( s.automaticReferencing );

            ASSERT_EQUALS( true , s.options["SLAVE_OKAY"].boolean() );
            ASSERT_EQUALS( 2.5 , s.options["NETWORK_TIMEOUT"].number() );
            ASSERT_EQUALS( Value( DOC( "save" << DOC( "safe" << true << "w" << 2 ) ) ) , s.options["OPERATIONS"] );
        }
    };

    class SettingsResolve {
    public:
        void run() {
            ConnectionSettings s = settings( "{ \"OPTIONS\" : { \"SAFE_INSERTS\" : true , \"WAIT_FOR_SLAVES\" : 3 } }" );
            OperationFlags flags = OperationFlags::resolve( s.options );
            ASSERT_EQUALS( DOC( "safe" << true << "w" << 3 ) , flags.forCall( OP_SAVE ) );
            ASSERT( flags.forCall( OP_REMOVE ).isEmpty() );
        }
    };

    class BadSettings {
    public:
        void run() {
            ASSERT_THROWS( settings( "{ \"NAME\" : " ) , UserException );
            ASSERT_THROWS( settings( "{ \"PORT\" : \"many\" }" ) , std::exception );
            ASSERT_THROWS( settings( "{ \"OPTIONS\" : [ 1 , 2 ] }" ) , UserException );
            ASSERT_THROWS( loadSettingsFile( "/nonexistent/settings.json" ) , UserException );
            ASSERT_THROWS( loadSchemaFile( "/" ) , UserException );
        }
    };

    class SchemaFile {
    public:
        void run() {
            vector< boost::shared_ptr<const ModelDescriptor> > models =
                schema( "{ \"models\" : [ { \"name\" : \"ConfigPost\" , \"collection\" : \"blog_post\" ,"
                        "    \"descending_indexes\" : [ \"date\" ] ,"
                        "    \"fields\" : [ { \"name\" : \"title\" , \"type\" : \"CharField\" , \"db_index\" : true ,"
                        "                     \"db_column\" : \"t\" } ,"
                        "                   { \"name\" : \"date\" , \"type\" : \"DateField\" , \"db_index\" : true } ,"
                        "                   { \"name\" : \"views\" , \"type\" : \"IntegerField\" , \"default\" : 7 } ,"
                        "                   { \"name\" : \"author\" , \"type\" : \"ForeignKey\" , \"to\" : \"RawModel\" } ,"
                        "                   { \"name\" : \"body\" , \"type\" : \"GridFSField\" ,"
                        "                     \"versioning\" : true , \"autodelete\" : false } ] ,"
                        "    \"indexes\" : [ { \"fields\" : [ [ \"t\" , 1 ] , [ \"date\" , -1 ] ] , \"unique\" : true } ] } ,"
                        "  { \"name\" : \"ConfigSite\" , \"id_hint\" : \"SITE_ID\" ,"
                        "    \"fields\" : [ { \"name\" : \"domain\" , \"type\" : \"CharField\" , \"unique\" : true ,"
                        "                     \"sparse\" : true } ] } ] }" );
            ASSERT_EQUALS( 2U , models.size() );

            const ModelDescriptor& post = *models[0];
            ASSERT_EQUALS( "ConfigPost" , post.name() );
            ASSERT_EQUALS( "blog_post" , post.collection() );
            ASSERT_EQUALS( "id" , post.pk().name() );
            ASSERT_EQUALS( "_id" , post.pk().column() );

            const FieldDescriptor* title = post.field( "title" );
            ASSERT( title );
            ASSERT_EQUALS( CharField , title->type() );
            ASSERT_EQUALS( "t" , title->column() );
            ASSERT( title->hasDbIndex() );
            ASSERT( post.fieldByColumn( "t" ) == title );

            ASSERT( post.isDescending( "date" ) );
            ASSERT( ! post.isDescending( "title" ) );
            ASSERT_EQUALS( 7 , post.field( "views" )->getDefault().numberInt() );
            ASSERT_EQUALS( "RawModel" , post.field( "author" )->relatedModel() );
            ASSERT_EQUALS( "author_id" , post.field( "author" )->column() );
            ASSERT( post.field( "body" )->isVersioned() );
            ASSERT( ! post.field( "body" )->isAutodelete() );
            ASSERT( post.hasGridFSFields() );

            ASSERT_EQUALS( 1U , post.indexes().size() );
            ASSERT( post.indexes()[0].isUnique() );
            ASSERT_EQUALS( "date" , post.indexes()[0].fields()[1].first );
            ASSERT_EQUALS( -1 , post.indexes()[0].fields()[1].second );

            const ModelDescriptor& site = *models[1];
            ASSERT_EQUALS( "configsite" , site.collection() );
            ASSERT_EQUALS( "SITE_ID" , site.idHint() );
            ASSERT( site.field( "domain" )->isUnique() );
            ASSERT( site.field( "domain" )->isSparse() );
            ASSERT( ! site.hasGridFSFields() );

            // registered
            ASSERT( Schema::global().has( "ConfigPost" ) );
            ASSERT( Schema::global().get( "ConfigSite" ) == models[1] );
        }
    };

    class BadSchema {
    public:
        void run() {
            ASSERT_THROWS( schema( "{ \"models\" : [ " ) , UserException );
            ASSERT_THROWS( schema( "{ \"other\" : 1 }" ) , UserException );
            ASSERT_THROWS( schema( "{ \"models\" : [ { \"fields\" : [] } ] }" ) , UserException );
            ASSERT_THROWS( schema( "{ \"models\" : [ { \"name\" : \"ConfigBad\" , \"fields\" : "
                                   "[ { \"name\" : \"x\" , \"type\" : \"NoSuchField\" } ] } ] }" ) , UserException );
            ASSERT_THROWS( schema( "{ \"models\" : [ { \"name\" : \"ConfigBad\" , \"fields\" : "
                                   "[ { \"type\" : \"CharField\" } ] } ] }" ) , UserException );
            ASSERT_THROWS( schema( "{ \"models\" : [ { \"name\" : \"ConfigBad\" , \"indexes\" : [ { \"unique\" : true } ] } ] }" ) ,
                           UserException );
            ASSERT( ! Schema::global().has( "ConfigBad" ) );
        }
    };

    class DescriptorValidation {
    public:
        void run() {
            ASSERT_THROWS( ModelDescriptorBuilder( "Dup" ).field( FieldDescriptor( "a" , CharField ) )
                           .field( FieldDescriptor( "a" , IntegerField ) ).done() , UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "DupColumn" ).field( FieldDescriptor( "a" , CharField ) )
                           .field( FieldDescriptor( "b" , CharField ).dbColumn( "a" ) ).done() , UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "NoTarget" ).field( FieldDescriptor( "fk" , ForeignKey ) ).done() ,
                           UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "TwoPks" ).field( FieldDescriptor( "a" , AutoField ) )
                           .field( FieldDescriptor( "b" , CharField ).primaryKey() ).done() , UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "IdTaken" ).field( FieldDescriptor( "id" , CharField ) ).done() ,
                           UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "BadDesc" ).descendingIndex( "nosuch" ).done() , UserException );
            ASSERT_THROWS( ModelDescriptorBuilder( "BadDir" ).field( FieldDescriptor( "a" , CharField ) )
                           .index( IndexSpec().on( "a" , 2 ) ).done() , UserException );

            boost::shared_ptr<const ModelDescriptor> own = ModelDescriptorBuilder( "OwnPk" )
                .field( FieldDescriptor( "code" , AutoField ) ).done();
            ASSERT_EQUALS( "code" , own->pk().name() );
            ASSERT_EQUALS( 1U , own->fields().size() );

            ASSERT_THROWS( Schema::global().get( "NeverRegistered" ) , UserException );
        }
    };

    class FieldTypes {
    public:
        void run() {
            FieldType t;
            ASSERT( fieldTypeFromName( "GridFSStringField" , t ) );
            ASSERT_EQUALS( GridFSStringField , t );
            ASSERT( fieldTypeFromName( "ListField" , t ) );
            ASSERT_EQUALS( ListField , t );
            ASSERT( ! fieldTypeFromName( "charfield" , t ) );
            ASSERT_EQUALS( "DictField" , string( fieldTypeName( DictField ) ) );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "config" ) {
        }

        void setupTests() {
            add< SettingsDefaults >();
            add< SettingsAll >();
            add< SettingsResolve >();
            add< BadSettings >();
            add< SchemaFile >();
            add< BadSchema >();
            add< DescriptorValidation >();
            add< FieldTypes >();
        }
    } myall;

}
