// connection_registry.h

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

#include "mongomodel/client/connection.h"

namespace mongomodel {

    /**
       process wide map of alias -> DatabaseWrapper.  "default" is what the model
       layer uses unless told otherwise.
       thread safe.
     */
    class ConnectionHandler : boost::noncopyable {
    public:
        static ConnectionHandler& global();

        /** installs a new, not yet connected wrapper under alias */
        shared_ptr<DatabaseWrapper> configure( const string& alias , const ConnectionSettings& settings );

        /** uasserts if nothing is configured under alias */
        shared_ptr<DatabaseWrapper> get( const string& alias = "default" );

        bool has( const string& alias );

        /**
           puts wrapper under alias, a null wrapper removes the alias.
           @return what was there before, possibly null
         */
        shared_ptr<DatabaseWrapper> swap( const string& alias , const shared_ptr<DatabaseWrapper>& wrapper );

        /** disconnect every wrapper, the aliases stay */
        void closeAll();

        vector<string> aliases();

    private:
        ConnectionHandler() { }

        mongomodel::mutex _m;
        map< string , shared_ptr<DatabaseWrapper> > _wrappers;
    };

    /**
       makes wrapper the connection of alias for the life of this object:

         {
             ScopedConnection c( shared_ptr<DatabaseWrapper>( new DatabaseWrapper( settings ) ) );
             ...  // ModelManagers on "default" now use it
         }

       the wrapper is connected in the constructor.  the destructor disconnects it
       and restores the previous wrapper, also when leaving through an exception.
     */
    class ScopedConnection : boost::noncopyable {
    public:
        ScopedConnection( const shared_ptr<DatabaseWrapper>& wrapper , const string& alias = "default" );
        ~ScopedConnection();

        DatabaseWrapper* operator->() const { return _wrapper.get(); }
        DatabaseWrapper& operator*() const { return *_wrapper; }
        shared_ptr<DatabaseWrapper> get() const { return _wrapper; }

    private:
        string _alias;
        shared_ptr<DatabaseWrapper> _wrapper;
        shared_ptr<DatabaseWrapper> _previous;
    };

}
