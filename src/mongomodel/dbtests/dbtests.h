// dbtests.h : Test suite helpers.
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

#pragma once

#include "mongomodel/dbtests/framework.h"

#include "mongomodel/client/connection_registry.h"
#include "mongomodel/model/model_manager.h"

using namespace mongomodel;
using namespace mongomodel::regression;

namespace mongomodel {
    namespace dbtests {

        /** the database every suite writes to */
        extern const char * const testDatabase;

        /** memory driver settings on testDatabase */
        ConnectionSettings testSettings();

        /** drops every collection of the "default" connection */
        void resetDatabase();

        /** registers the models of testmodels.cpp with Schema::global() */
        void registerTestModels();

        shared_ptr<const ModelDescriptor> model( const string& name );

        /** keeps every log line written while it lives */
        class LogCapture : public Tee {
        public:
            LogCapture() { Logstream::addGlobalTee( this ); }
            ~LogCapture() { Logstream::removeGlobalTee( this ); }

            virtual void write( LogLevel level , const string& str ) { _lines.push_back( str ); }

            /** number of lines containing s */
            int count( const string& s ) const;

            const vector<string>& lines() const { return _lines; }

        private:
            vector<string> _lines;
        };

        /** reset the database in the constructor */
        class ClientBase {
        public:
            ClientBase() {
                resetDatabase();
            }
            virtual ~ClientBase() { }
        };

    }
}
