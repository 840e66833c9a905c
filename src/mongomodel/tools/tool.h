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

// tool.h

#pragma once

#include <string>

#include <boost/program_options.hpp>

#include "mongomodel/client/connection.h"

namespace mongomodel {

    /**
       base of the command line tools.  parses the common options, builds the
       ConnectionSettings from --settings and the --host / --port / --db / --driver
       overrides, then calls run().
     */
    class Tool {
    public:
        Tool( string name );
        virtual ~Tool();

        int main( int argc , char ** argv );

        boost::program_options::options_description_easy_init add_options(){
            return _options->add_options();
        }

        string getParam( string name , string def="" ){
            if ( _params.count( name ) )
                return _params[name.c_str()].as<string>();
            return def;
        }
        bool hasParam( string name ){
            return _params.count( name ) > 0;
        }

        virtual int run() = 0;

        virtual void printHelp(ostream &out);

        virtual void printExtraHelp( ostream & out ){}

    protected:

        /** configures the "default" alias with settings() and connects it */
        shared_ptr<DatabaseWrapper> connect();

        ConnectionSettings& settings() { return _settings; }

        string _name;

    private:
        ConnectionSettings _settings;

        boost::program_options::options_description * _options;
        boost::program_options::options_description * _hidden_options;

        boost::program_options::variables_map _params;
    };

}
