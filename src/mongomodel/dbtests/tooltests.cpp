// tooltests.cpp : the command line tools, driven through Tool::main.
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

#include <fstream>

#include <boost/filesystem/operations.hpp>

#include "mongomodel/dbtests/dbtests.h"
#include "mongomodel/tools/syncindexes.h"

namespace ToolTests {

    const char * const schemaJson =
        "{ \"models\" : [ { \"name\" : \"SyncToolPost\" , \"collection\" : \"synctool_post\" ,"
        "    \"fields\" : [ { \"name\" : \"title\" , \"type\" : \"CharField\" , \"db_index\" : true , \"unique\" : true } ,"
        "                   { \"name\" : \"views\" , \"type\" : \"IntegerField\" , \"db_index\" : true } ] } ] }";

    /** takes the "default" alias away for its lifetime */
    class SetAsideDefault : boost::noncopyable {
    public:
        SetAsideDefault()
            : _previous( ConnectionHandler::global().swap( "default" , boost::shared_ptr<DatabaseWrapper>() ) ) {
        }
        ~SetAsideDefault() {
            ConnectionHandler::global().swap( "default" , _previous );
        }
    private:
        boost::shared_ptr<DatabaseWrapper> _previous;
    };

    class Base : public dbtests::ClientBase {
    public:
        Base() : _schema( boost::filesystem::temp_directory_path() /
                          boost::filesystem::unique_path( "mongomodel-schema-%%%%-%%%%.json" ) ) {
            ofstream f( _schema.string().c_str() );
            f << schemaJson;
        }
        ~Base() {
            boost::system::error_code ec;
            boost::filesystem::remove( _schema , ec );
        }

        string schemaFile() const { return _schema.string(); }

        /**
           runs syncindexes with args, the report lands in out().
           the tool owns the "default" alias while it runs, the test one is put back after.
         */
        int syncIndexes( const vector<string>& args ) {
            _out.str( "" );

            vector<string> all;
            all.push_back( "syncindexes" );
            all.insert( all.end() , args.begin() , args.end() );
            vector<char*> argv;
            for ( unsigned i = 0; i < all.size(); i++ )
                argv.push_back( const_cast<char*>( all[i].c_str() ) );
            argv.push_back( 0 );

            SetAsideDefault aside;
            SyncIndexes tool( _out );
            return tool.main( (int) all.size() , &argv[0] );
        }

        /** --schema <file> --db <test database> --driver memory plus extra */
        vector<string> standardArgs() const {
            vector<string> args;
            args.push_back( "--schema" );
            args.push_back( schemaFile() );
            args.push_back( "--db" );
            args.push_back( dbtests::testDatabase );
            args.push_back( "--driver" );
            args.push_back( "memory" );
            return args;
        }

        string out() const { return _out.str(); }

        Document liveIndexes() {
            Document info;
            auto_ptr<DBClientCursor> c = ConnectionHandler::global().get()->connection()
                ->getIndexes( string( dbtests::testDatabase ) + ".synctool_post" );
            while ( c->more() ) {
                Document idx = c->next();
                info.append( idx["name"].str() , idx );
            }
            return info;
        }

    private:
        boost::filesystem::path _schema;
        ostringstream _out;
    };

    class CreatesThenReportsExisting : public Base {
    public:
        void run() {
            ASSERT_EQUALS( (int) EXIT_CLEAN , syncIndexes( standardArgs() ) );
            ASSERT( out().find( "created synctool_post.title_1 " ) != string::npos );
            ASSERT( out().find( "created synctool_post.views_1" ) != string::npos );

            Document live = liveIndexes();
            ASSERT( live.hasField( "title_1" ) );
            ASSERT( live["title_1"].embeddedObject()["unique"].trueValue() );
            ASSERT( live.hasField( "views_1" ) );

            ASSERT_EQUALS( (int) EXIT_CLEAN , syncIndexes( standardArgs() ) );
            ASSERT( out().find( "exists  synctool_post.title_1" ) != string::npos );
            ASSERT( out().find( "created" ) == string::npos );
        }
    };

    class SchemaRequired : public Base {
    public:
        void run() {
            vector<string> args;
            args.push_back( "--db" );
            args.push_back( dbtests::testDatabase );
            ASSERT_EQUALS( (int) EXIT_BADOPTIONS , syncIndexes( args ) );
            ASSERT( out().empty() );
        }
    };

    class BadOptions : public Base {
    public:
        void run() {
            vector<string> args = standardArgs();
            args.push_back( "--nosuchoption" );
            ASSERT_EQUALS( (int) EXIT_BADOPTIONS , syncIndexes( args ) );

            args = standardArgs();
            args[1] = "/nonexistent/schema.json";
            ASSERT_EQUALS( (int) EXIT_BADOPTIONS , syncIndexes( args ) );

            // no database
            args = standardArgs();
            args.erase( args.begin() + 2 , args.begin() + 4 );
            ASSERT_EQUALS( (int) EXIT_BADOPTIONS , syncIndexes( args ) );
        }
    };

    class ConnectError : public Base {
    public:
        void run() {
            vector<string> args = standardArgs();
            args[5] = "nosuchdriver";
            ASSERT_EQUALS( (int) EXIT_CONNECT_ERROR , syncIndexes( args ) );
        }
    };

    class SyncFailed : public Base {
    public:
        void run() {
            // title_1 is there but not unique
            ConnectionHandler::global().get()->connection()->createIndex(
                string( dbtests::testDatabase ) + ".synctool_post" ,
                DOC( "key" << DOC( "title" << 1 ) << "name" << "title_1" ) );

            ASSERT_EQUALS( (int) EXIT_SYNC_FAILED , syncIndexes( standardArgs() ) );
            ASSERT( ! liveIndexes()["title_1"].embeddedObject()["unique"].trueValue() );
        }
    };

    class Help : public Base {
    public:
        void run() {
            vector<string> args;
            args.push_back( "--help" );
            ASSERT_EQUALS( (int) EXIT_CLEAN , syncIndexes( args ) );
        }
    };

    class All : public Suite {
    public:
        All() : Suite( "tools" ) {
        }

        void setupTests() {
            add< CreatesThenReportsExisting >();
            add< SchemaRequired >();
            add< BadOptions >();
            add< ConnectError >();
            add< SyncFailed >();
            add< Help >();
        }
    } myall;

}
