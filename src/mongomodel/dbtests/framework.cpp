// framework.cpp

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

#include <boost/program_options.hpp>

#include "mongomodel/pch.h"
#include "mongomodel/dbtests/framework.h"
#include "mongomodel/util/timer.h"

namespace po = boost::program_options;

namespace mongomodel {

    namespace regression {

        map<string,Suite*> * Suite::_suites = 0;

        /** counts for one suite; Result::cur is the one assertions are charged to */
        class Result {
        public:
            Result( const string& name ) : _name( name ) , _rc(0) , _tests(0) , _fails(0) , _asserts(0) , _millis(0) { }

            string toString() const {
                stringstream ss;
                ss << _name << " tests:" << _tests << " fails:" << _fails
                   << " assert calls:" << _asserts << " time:" << _millis << "ms\n";
                for ( list<string>::const_iterator i = _messages.begin(); i != _messages.end(); ++i )
                    ss << "\t" << *i << "\n";
                return ss.str();
            }

            string _name;
            int _rc;
            int _tests;
            int _fails;
            int _asserts;
            int _millis;
            list<string> _messages;

            static Result * cur;
        };

        Result * Result::cur = 0;

        Result * Suite::run( const string& filter ) {
            setupTests();

            Result * r = new Result( _name );
            Result::cur = r;
            Timer suiteTimer;

            for ( list<TestCase*>::iterator i = _tests.begin(); i != _tests.end(); ++i ) {
                TestCase * tc = *i;
                const string name = tc->getName();
                if ( ! filter.empty() && name.find( filter ) == string::npos )
                    continue;

                r->_tests++;
                LOG(1) << "\t" << name << endl;

                string failure;
                try {
                    tc->run();
                }
                catch ( TestAssertionFailure& e ) {
                    failure = e.what();
                }
                catch ( DBException& e ) {
                    failure = "exception " + e.toString();
                }
                catch ( std::exception& e ) {
                    failure = string( "std::exception " ) + e.what();
                }

                if ( ! failure.empty() ) {
                    log() << "FAILED " << name << ": " << failure << endl;
                    r->_messages.push_back( name + ": " + failure );
                    r->_fails++;
                    r->_rc = EXIT_TEST;
                }
            }

            r->_millis = suiteTimer.millis();
            return r;
        }

        void show_help_text(const char* name, po::options_description options) {
            cout << "usage: " << name << " [options] [suite]..." << endl
                 << options << "suite: run the specified test suite(s) only" << endl;
        }

        int Suite::run( int argc , char** argv ) {
            po::options_description shell_options("options");
            po::options_description hidden_options("Hidden options");
            po::options_description cmdline_options("Command line options");
            po::positional_options_description positional_options;

            shell_options.add_options()
                ("help,h", "show this usage information")
                ("debug", "run tests with verbose output")
                ("list,l", "list available test suites")
                ("filter,f", po::value<string>(), "run only tests whose name contains this string")
                ;

            hidden_options.add_options()
                ("suites", po::value< vector<string> >(), "test suites to run")
                ;

            positional_options.add("suites", -1);

            cmdline_options.add(shell_options).add(hidden_options);

            po::variables_map params;
            int command_line_style = (((po::command_line_style::unix_style ^
                                        po::command_line_style::allow_guessing) |
                                       po::command_line_style::allow_long_disguise) ^
                                      po::command_line_style::allow_sticky);

            try {
                po::store(po::command_line_parser(argc, argv).options(cmdline_options).
                          positional(positional_options).
                          style(command_line_style).run(), params);
                po::notify(params);
            } catch (po::error &e) {
                cout << "ERROR: " << e.what() << endl << endl;
                show_help_text(argv[0], shell_options);
                return EXIT_BADOPTIONS;
            }

            if (params.count("help")) {
                show_help_text(argv[0], shell_options);
                return EXIT_CLEAN;
            }

            if (params.count("debug")) {
                logLevel = 1;
            }

            string filter;
            if (params.count("filter")) {
                filter = params["filter"].as<string>();
            }

            if (params.count("list")) {
                for ( map<string,Suite*>::iterator i = _suites->begin() ; i != _suites->end(); i++ )
                    cout << i->first << endl;
                return EXIT_CLEAN;
            }

            vector<string> suites;
            if (params.count("suites")) {
                suites = params["suites"].as< vector<string> >();
            }
            return run(suites, filter);
        }

        int Suite::run( const vector<string>& suites , const string& filter ) {
            for ( unsigned int i = 0; i < suites.size(); i++ ) {
                if ( _suites->find( suites[i] ) == _suites->end() ) {
                    cout << "invalid test [" << suites[i] << "], use --list to see valid names" << endl;
                    return EXIT_BADOPTIONS;
                }
            }

            vector<string> torun( suites );
            if ( torun.empty() )
                for ( map<string,Suite*>::iterator i = _suites->begin(); i != _suites->end(); ++i )
                    torun.push_back( i->first );

            int rc = EXIT_CLEAN;
            int tests = 0;
            int fails = 0;
            int asserts = 0;
            stringstream report;

            for ( vector<string>::iterator i = torun.begin(); i != torun.end(); ++i ) {
                Suite * s = (*_suites)[*i];
                verify( s );

                log() << "going to run suite: " << *i << endl;
                auto_ptr<Result> r( s->run( filter ) );
                Result::cur = 0;

                report << r->toString();
                if ( r->_rc != EXIT_CLEAN )
                    rc = r->_rc;
                tests += r->_tests;
                fails += r->_fails;
                asserts += r->_asserts;
            }

            cout << "**************************************************" << endl;
            cout << report.str();
            cout << "TOTALS  tests:" << tests << " fails: " << fails << " asserts calls: " << asserts << endl;

            return rc;
        }

        void Suite::registerSuite( string name , Suite * s ){
            if ( ! _suites )
                _suites = new map<string,Suite*>();
            Suite*& m = (*_suites)[name];
            uassert( 16300 , "already have suite with that name" , ! m );
            m = s;
        }

        void assert_pass(){
            Result::cur->_asserts++;
        }

        void assert_fail( const char * exp , const char * file , unsigned line ){
            Result::cur->_asserts++;

            stringstream ss;
            ss << "ASSERT FAILED! " << file << ":" << line << " " << exp;
            log() << ss.str() << endl;
            throw TestAssertionFailure( ss.str() );
        }

        void fail( const char * exp , const char * file , unsigned line ){
            stringstream ss;
            ss << "FAIL " << file << ":" << line << " " << exp;
            log() << ss.str() << endl;
            throw TestAssertionFailure( ss.str() );
        }

        void MyAsserts::countAssert(){
            Result::cur->_asserts++;
        }

        void MyAsserts::failed( const string& values ){
            stringstream ss;
            ss << _file << ":" << _line << " " << _aexp << " != " << _bexp << " " << values;
            log() << ss.str() << endl;
            throw TestAssertionFailure( ss.str() );
        }

        void MyAsserts::ae( double a , double b ){
            countAssert();
            if ( a == b )
                return;

            stringstream ss;
            ss << a << " != " << b;
            failed( ss.str() );
        }

        void MyAsserts::ae( const string& a , const string& b ){
            countAssert();
            if ( a == b )
                return;

            failed( a + " != " + b );
        }

    }
}
