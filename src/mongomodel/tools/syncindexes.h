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

// syncindexes.h

#pragma once

#include <iostream>

#include "mongomodel/tools/tool.h"

namespace mongomodel {

    /**
       creates the indexes the models of a --schema file declare and writes one
       line per index to out:
         created <collection>.<index> <key>
         exists  <collection>.<index> <key>
     */
    class SyncIndexes : public Tool {
    public:
        SyncIndexes( ostream& out = cout );

        virtual void printExtraHelp( ostream & out );

        virtual int run();

    private:
        ostream& _out;
    };

}
