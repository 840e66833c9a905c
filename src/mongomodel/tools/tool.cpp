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

// tool.cpp

#include <boost/program_options.hpp>

#include "mongomodel/pch.h"
#include "mongomodel/tools/tool.h"

#include <iostream>

#include "mongomodel/client/connection_registry.h"
#include "mongomodel/tools/json_config.h"

using namespace std;

namespace po = boost::program_options;

namespace mongomodel {

    Tool::Tool( string name ) : _name( name ) {

        _options = new po::options_description( "options" );
        _options->add_options()
            ("help","produce help message")
            ("verbose,v", "be more verbose (include multiple times for more verbosity e.g. -vvvvv)")
            ("settings", po::value<string>(), "json file with the connection settings" )
            ("host,h",po::value<string>(), "host to connect to" )
            ("port",po::value<int>(), "server port" )
            ("db,d",po::value<string>(), "database to use" )
            ("driver",po::value<string>(), "client driver: mongodb (default) or memory" )
            ("logpath",po::value<string>(), "log file to send output to instead of stdout" )
            ("logappend", "append to logpath instead of over-writing" )
            ;

        _hidden_options = new po::options_description( name + " hidden options" );

        /* support for -vv -vvvv etc. */
        for (string s = "vv"; s.length() <= 10; s.append("v")) {
            _hidden_options->add_options()(s.c_str(), "verbose");
        }
    }

    Tool::~Tool(){
        delete( _options );
        delete( _hidden_options );
    }

    void Tool::printHelp(ostream &out) {
        printExtraHelp(out);
        _options->print(out);
    }

    int Tool::main( int argc , char ** argv ){
        _name = argv[0];

        /* using the same style as db.cpp */
        int command_line_style = (((po::command_line_style::unix_style ^
                                    po::command_line_style::allow_guessing) |
                                   po::command_line_style::allow_long_disguise) ^
                                  po::command_line_style::allow_sticky);
        try {
            po::options_description all_options("all options");
            all_options.add(*_options).add(*_hidden_options);

            po::store( po::command_line_parser( argc , argv ).
                       options(all_options).
                       style(command_line_style).run() , _params );

            po::notify( _params );
        } catch (po::error &e) {
            cerr << "ERROR: " << e.what() << endl << endl;
            printHelp(cerr);
            return EXIT_BADOPTIONS;
        }

        if ( _params.count( "help" ) ){
            printHelp(cout);
            return EXIT_CLEAN;
        }

        if ( _params.count( "verbose" ) ) {
            logLevel = 1;
        }

        for (string s = "vv"; s.length() <= 10; s.append("v")) {
            if (_params.count(s)) {
                logLevel = s.length();
            }
        }

        try {
            if ( _params.count( "logpath" ) )
                initLogging( _params["logpath"].as<string>() , _params.count( "logappend" ) > 0 );
            if ( _params.count( "settings" ) )
                _settings = loadSettingsFile( _params["settings"].as<string>() );
        }
        catch ( DBException& e ) {
            cerr << "ERROR: " << e.what() << endl;
            return EXIT_BADOPTIONS;
        }

        if ( _params.count( "host" ) )
            _settings.host = _params["host"].as<string>();
        if ( _params.count( "port" ) )
            _settings.port = _params["port"].as<int>();
        if ( _params.count( "db" ) )
            _settings.name = _params["db"].as<string>();
        if ( _params.count( "driver" ) )
            _settings.driver = _params["driver"].as<string>();

        int ret = EXIT_UNCAUGHT;
        try {
            ret = run();
        }
        catch ( DBException& e ){
            cerr << "assertion: " << e.toString() << endl;
            ret = EXIT_UNCAUGHT;
        }

        ConnectionHandler::global().closeAll();
        return ret;
    }

    shared_ptr<DatabaseWrapper> Tool::connect() {
        shared_ptr<DatabaseWrapper> db = ConnectionHandler::global().configure( "default" , _settings );
        db->connect();
        log(1) << "connected to: " << _settings.toString() << endl;
        return db;
    }

}
