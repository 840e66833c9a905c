// errors.h

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

namespace mongomodel {

    enum ErrorCodes {
        DuplicateKeyCode = 11000 ,
        InvalidIdentifierCode = 16001 ,
        UnsupportedQueryCode = 16002 ,
        UnserializableReferenceCode = 16003 ,
        RestrictedOperationCode = 16004 ,
        MissingPayloadCode = 16005 ,
        DoesNotExistCode = 16006 ,
        MultipleObjectsReturnedCode = 16007
    };

    /** a primary key value that is not a 24 hex digit object id */
    class InvalidIdentifierError : public UserException {
    public:
        InvalidIdentifierError( const string& msg ) : UserException( InvalidIdentifierCode , msg ) { }
    };

    /** a lookup the store cannot express, e.g. date components */
    class UnsupportedQueryError : public UserException {
    public:
        UnsupportedQueryError( const string& msg ) : UserException( UnsupportedQueryCode , msg ) { }
    };

    class UnserializableReferenceError : public UserException {
    public:
        UnserializableReferenceError( const string& msg ) : UserException( UnserializableReferenceCode , msg ) { }
    };

    class RestrictedOperationError : public UserException {
    public:
        RestrictedOperationError( const string& msg ) : UserException( RestrictedOperationCode , msg ) { }
    };

    class MissingPayloadError : public UserException {
    public:
        MissingPayloadError( const string& msg ) : UserException( MissingPayloadCode , msg ) { }
    };

    class DoesNotExist : public UserException {
    public:
        DoesNotExist( const string& msg ) : UserException( DoesNotExistCode , msg ) { }
    };

    class MultipleObjectsReturned : public UserException {
    public:
        MultipleObjectsReturned( const string& msg ) : UserException( MultipleObjectsReturnedCode , msg ) { }
    };

    /** raised by the store when a unique index would be violated */
    class DuplicateKeyError : public UserException {
    public:
        DuplicateKeyError( const string& msg ) : UserException( DuplicateKeyCode , msg ) { }
    };

    /**
       log like uasserted() does, then throw the typed error.
       usage: raiseError( InvalidIdentifierError( ss.str() ) );
     */
    template< class E >
    void raiseError( const E& e ) {
        logUserAssertion( e.getCode() , e.what() );
        throw e;
    }

}
