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

// syncindexes.cpp

#include <boost/program_options.hpp>

#include "mongomodel/pch.h"
#include "mongomodel/tools/syncindexes.h"

#include "mongomodel/index/index_synchronizer.h"
#include "mongomodel/tools/json_config.h"

namespace po = boost::program_options;

namespace mongomodel {

    SyncIndexes::SyncIndexes( ostream& out ) : Tool( "syncindexes" ) , _out( out ) {
        add_options()
            ( "schema" , po::value<string>() , "json file with the model descriptors" )
            ;
    }

    void SyncIndexes::printExtraHelp( ostream & out ){
        out << "usage: " << _name << " --schema <file.json> [options]" << endl;
        out << "creates the indexes the models declare, one line per index:" << endl;
        out << "  created <collection>.<index> <key>" << endl;
        out << "  exists  <collection>.<index> <key>" << endl;
    }

    int SyncIndexes::run(){
        if ( ! hasParam( "schema" ) ){
            cerr << "ERROR: --schema is required" << endl << endl;
            printHelp( cerr );
            return EXIT_BADOPTIONS;
        }

        vector< shared_ptr<const ModelDescriptor> > models;
        try {
            models = loadSchemaFile( getParam( "schema" ) );
        }
        catch ( DBException& e ){
            cerr << "ERROR: " << e.what() << endl;
            return EXIT_BADOPTIONS;
        }

        if ( settings().name.empty() ){
            cerr << "ERROR: no database, use --db or NAME in --settings" << endl;
            return EXIT_BADOPTIONS;
        }

        shared_ptr<DatabaseWrapper> db;
        try {
            db = connect();
        }
        catch ( DBException& e ){
            cerr << "couldn't connect to [" << settings().host << ":" << settings().port << "] " << e.what() << endl;
            return EXIT_CONNECT_ERROR;
        }

        IndexSynchronizer sync( db );
        for ( unsigned i = 0; i < models.size(); i++ ){
            vector<IndexDefinition> done;
            try {
                done = sync.sync( *models[i] );
            }
            catch ( DBException& e ){
                cerr << "index sync failed for " << models[i]->name() << ": " << e.what() << endl;
                return EXIT_SYNC_FAILED;
            }

            for ( unsigned j = 0; j < done.size(); j++ ){
                _out << ( done[j].created ? "created " : "exists  " )
                     << done[j].collection << "." << done[j].name << " " << done[j].key.toString() << endl;
            }
        }
        return EXIT_CLEAN;
    }

}
