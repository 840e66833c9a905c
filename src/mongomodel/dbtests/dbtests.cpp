// dbtests.cpp : Runs the mongomodel unit tests.
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

namespace mongomodel {
    namespace dbtests {

        const char * const testDatabase = "test_mongomodel";

        ConnectionSettings testSettings() {
            ConnectionSettings s;
            s.driver = "memory";
            s.host = "localhost";
            s.name = testDatabase;
            return s;
        }

        void resetDatabase() {
            shared_ptr<DBClientBase> conn = ConnectionHandler::global().get()->connection();
            list<string> names = conn->getCollectionNames( testDatabase );
            for ( list<string>::iterator i = names.begin(); i != names.end(); ++i )
                conn->dropCollection( *i );
        }

        int LogCapture::count( const string& s ) const {
            int n = 0;
            for ( unsigned i = 0; i < _lines.size(); i++ )
                if ( _lines[i].find( s ) != string::npos )
                    n++;
            return n;
        }

        shared_ptr<const ModelDescriptor> model( const string& name ) {
            return Schema::global().get( name );
        }

    }
}

int main( int argc, char** argv ) {
    ConnectionHandler::global().configure( "default" , dbtests::testSettings() );
    dbtests::registerTestModels();

    int ret = mongomodel::regression::Suite::run( argc , argv );

    ConnectionHandler::global().closeAll();
    return ret;
}
