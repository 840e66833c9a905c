// model_manager.h

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
#include "mongomodel/model/model_instance.h"
#include "mongomodel/query/query_translator.h"

namespace mongomodel {

    /**
       reads and writes the records of one model through the connection
       registered under an alias.  cheap to construct, holds no connection.

         ModelManager posts( Schema::global().get( "Post" ) );
         ModelInstancePtr p = posts.create( DOC( "title" << "hello" ) );
         vector<ModelInstancePtr> recent = posts.filter( Q( "title__startswith" , "he" ) , orderBy );
     */
    class ModelManager {
    public:
        ModelManager( const shared_ptr<const ModelDescriptor>& d , const string& alias = "default" );

        const ModelDescriptor& descriptor() const { return *_d; }
        const string& alias() const { return _alias; }

        shared_ptr<DatabaseWrapper> wrapper() const;
        shared_ptr<Collection> collection() const;

        /** a new unsaved instance */
        ModelInstancePtr instance() const;

        /** sets values (field name -> value) on a new instance and saves it */
        ModelInstancePtr create( const Document& values );

        /**
           one collection save.  a new primary key is generated if there is none.
           GridFS payloads are written first and replaced ones removed after.
         */
        void save( ModelInstance& inst );

        /** raises DoesNotExist or MultipleObjectsReturned unless exactly one record matches */
        ModelInstancePtr get( const Filter& f );

        ModelInstancePtr getByPk( const Value& pk );

        vector<ModelInstancePtr> filter( const Filter& f ,
                                         const vector<string>& orderBy = vector<string>() ,
                                         int limit = 0 , int skip = 0 );

        vector<ModelInstancePtr> all() { return filter( Filter() ); }

        unsigned long long count( const Filter& f = Filter() );

        /** one multi update.  GridFS fields raise RestrictedOperationError. */
        void update( const Filter& f , const UpdateSpec& u );

        /** removes the record and its autodelete payloads, the instance becomes unsaved */
        void remove( ModelInstance& inst );

        /** one collection remove */
        void remove( const Filter& f );

        ModelInstancePtr fromDocument( const Document& doc );

    private:
        bool _hasAutodeletePayloads() const;

        shared_ptr<const ModelDescriptor> _d;
        string _alias;
    };

}
