/** @file log.cpp
 */

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

#include <algorithm>

#include "mongomodel/util/time_support.h"

namespace mongomodel {

    Nullstream nullstream;
    int logLevel = 0;

    mongomodel::mutex Logstream::mutex;
    FILE* Logstream::logfile = stdout;
    vector<Tee*>* Logstream::globalTees = 0;

    boost::thread_specific_ptr<Logstream> Logstream::tsp;

    void Logstream::setLogFile(FILE* f) {
        scoped_lock lk(mutex);
        logfile = f;
    }

    void Logstream::addGlobalTee( Tee * t ) {
        scoped_lock lk(mutex);
        if ( ! globalTees )
            globalTees = new vector<Tee*>();
        globalTees->push_back( t );
    }

    void Logstream::removeGlobalTee( Tee * t ) {
        scoped_lock lk(mutex);
        if ( ! globalTees )
            return;
        globalTees->erase( std::remove( globalTees->begin() , globalTees->end() , t ) , globalTees->end() );
    }

    void Logstream::flush() {
        string msg = ss.str();
        const char * type = logLevelToString(logLevel);

        stringstream line;
        line << terseCurrentTime() << ' ';
        if ( type[0] )
            line << type << ": ";
        line << msg;
        string out = line.str();

        {
            scoped_lock lk(mutex);

            if ( globalTees ){
                for ( unsigned i=0; i<globalTees->size(); i++ )
                    (*globalTees)[i]->write(logLevel,out);
            }

            if( fwrite(out.data(), out.size(), 1, logfile) ){
                fflush(logfile);
            }
            else {
                int x = errno;
                cout << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out << endl;
            }
        }
        _init();
    }

    class LoggingManager {
    public:
        LoggingManager()
            : _enabled(0) , _file(0) {
        }

        void start( const string& lp , bool append ) {
            uassert( 10268 ,  "LoggingManager already started" , ! _enabled );

            FILE * f = fopen( lp.c_str() , append ? "a" : "w" );
            if ( ! f ) {
                stringstream ss;
                ss << "can't open [" << lp << "] for log file: " << errnoWithDescription();
                uasserted( 10269 , ss.str() );
            }

            _path = lp;
            _file = f;
            _enabled = 1;
            Logstream::setLogFile( _file );
        }

    private:
        bool _enabled;
        string _path;
        FILE * _file;
    } loggingManager;

    void initLogging( const string& lp , bool append ) {
        cout << "all output going to: " << lp << endl;
        loggingManager.start( lp , append );
    }

} // namespace mongomodel
