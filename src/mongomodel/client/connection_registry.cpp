// connection_registry.cpp

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
#include "mongomodel/client/connection_registry.h"

namespace mongomodel {

    ConnectionHandler& ConnectionHandler::global() {
        static ConnectionHandler h;
        return h;
    }

    shared_ptr<DatabaseWrapper> ConnectionHandler::configure( const string& alias , const ConnectionSettings& settings ) {
        shared_ptr<DatabaseWrapper> w( new DatabaseWrapper( settings ) );
        shared_ptr<DatabaseWrapper> old = swap( alias , w );
        if ( old )
            old->disconnect();
        return w;
    }

    shared_ptr<DatabaseWrapper> ConnectionHandler::get( const string& alias ) {
        scoped_lock lk( _m );
        map< string , shared_ptr<DatabaseWrapper> >::iterator i = _wrappers.find( alias );
        uassert( 16090 , string( "no connection configured as '" ) + alias + "'" , i != _wrappers.end() );
        return i->second;
    }

    bool ConnectionHandler::has( const string& alias ) {
        scoped_lock lk( _m );
        return _wrappers.count( alias ) > 0;
    }

    shared_ptr<DatabaseWrapper> ConnectionHandler::swap( const string& alias , const shared_ptr<DatabaseWrapper>& wrapper ) {
        scoped_lock lk( _m );
        shared_ptr<DatabaseWrapper> old;
        map< string , shared_ptr<DatabaseWrapper> >::iterator i = _wrappers.find( alias );
        if ( i != _wrappers.end() ) {
            old = i->second;
            if ( wrapper )
                i->second = wrapper;
            else
                _wrappers.erase( i );
        }
        else if ( wrapper ) {
            _wrappers[alias] = wrapper;
        }
        return old;
    }

    void ConnectionHandler::closeAll() {
        vector< shared_ptr<DatabaseWrapper> > all;
        {
            scoped_lock lk( _m );
            for ( map< string , shared_ptr<DatabaseWrapper> >::iterator i = _wrappers.begin(); i != _wrappers.end(); ++i )
                all.push_back( i->second );
        }
        for ( unsigned i = 0; i < all.size(); i++ )
            all[i]->disconnect();
    }

    vector<string> ConnectionHandler::aliases() {
        scoped_lock lk( _m );
        vector<string> names;
        for ( map< string , shared_ptr<DatabaseWrapper> >::iterator i = _wrappers.begin(); i != _wrappers.end(); ++i )
            names.push_back( i->first );
        return names;
    }

    ScopedConnection::ScopedConnection( const shared_ptr<DatabaseWrapper>& wrapper , const string& alias )
        : _alias( alias ) , _wrapper( wrapper ) {
        uassert( 16091 , "ScopedConnection needs a wrapper" , _wrapper );
        _previous = ConnectionHandler::global().swap( _alias , _wrapper );
        try {
            _wrapper->connect();
        }
        catch ( std::exception& ) {
            ConnectionHandler::global().swap( _alias , _previous );
            throw;
        }
    }

    ScopedConnection::~ScopedConnection() {
        DESTRUCTOR_GUARD( _wrapper->disconnect() );
        DESTRUCTOR_GUARD( ConnectionHandler::global().swap( _alias , _previous ) );
    }

}
