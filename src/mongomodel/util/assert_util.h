// assert_util.h

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

#pragma once

#include <exception>
#include <typeinfo>

namespace mongomodel {

    /** base for every error this library raises; carries a numeric code */
    class DBException : public std::exception {
    public:
        DBException( const string& msg , int code ) : _msg(msg) , _code(code) { }
        virtual ~DBException() throw() { }

        virtual const char* what() const throw() { return _msg.c_str(); }
        virtual int getCode() const { return _code; }

        virtual string toString() const {
            stringstream ss; ss << getCode() << " " << what();
            return ss.str();
        }

    protected:
        string _msg;
        int _code;
    };

    /* raised by verify() when an internal invariant breaks */
    class AssertionException : public DBException {
    public:
        AssertionException( const string& msg , int code ) : DBException(msg,code) { }
        virtual ~AssertionException() throw() { }
    };

    /* UserExceptions are valid errors that a user can cause, like a bad lookup or duplicate key */
    class UserException : public AssertionException {
    public:
        UserException(int c , const string& m) : AssertionException( m , c ) { }
    };

    /* store or connection level failure that is not the caller's fault */
    class MsgAssertionException : public AssertionException {
    public:
        MsgAssertionException(int c, const string& m) : AssertionException( m , c ) { }
    };

    /** logs a user assertion at debug level; uasserted() and raiseError() both go through it */
    void logUserAssertion( int code , const char *msg );

    void asserted(const char *msg, const char *file, unsigned line);
    void uasserted(int msgid, const char *msg);
    inline void uasserted(int msgid , const string& msg) { uasserted(msgid, msg.c_str()); }
    void msgasserted(int msgid, const char *msg);
    inline void msgasserted(int msgid, const string& msg) { msgasserted(msgid, msg.c_str()); }

    /* internal invariant; throws AssertionException rather than aborting */
#define MONGOMODEL_verify(_Expression) (void)( (!!(_Expression)) || (mongomodel::asserted(#_Expression, __FILE__, __LINE__), 0) )
#define verify MONGOMODEL_verify

    /* "user assert".  if asserts, user did something wrong, not our code */
#define MONGOMODEL_uassert(msgid, msg, expr) (void)( (!!(expr)) || (mongomodel::uasserted(msgid, msg), 0) )
#define uassert MONGOMODEL_uassert

    /* display a message, no context, and throw assertionexception */
#define MONGOMODEL_massert(msgid, msg, expr) (void)( (!!(expr)) || (mongomodel::msgasserted(msgid, msg), 0) )
#define massert MONGOMODEL_massert

    string demangleName( const type_info& typeinfo );

} // namespace mongomodel

#define DESTRUCTOR_GUARD MONGOMODEL_DESTRUCTOR_GUARD
#define MONGOMODEL_DESTRUCTOR_GUARD( expression ) \
    try { \
        expression; \
    } catch ( const std::exception &e ) { \
        mongomodel::problem() << "caught exception (" << e.what() << ") in destructor (" << __FUNCTION__ << ")" << std::endl; \
    } catch ( ... ) { \
        mongomodel::problem() << "caught unknown exception in destructor (" << __FUNCTION__ << ")" << std::endl; \
    }
