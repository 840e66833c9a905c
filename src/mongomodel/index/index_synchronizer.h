// index_synchronizer.h

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
#include "mongomodel/model/model_descriptor.h"

namespace mongomodel {

    struct IndexDefinition {
        IndexDefinition() : unique( false ) , sparse( false ) , created( false ) { }

        string collection;
        string name;
        Document key;
        bool unique;
        bool sparse;

        /** set by IndexSynchronizer::sync: false if the index was already there */
        bool created;

        string toString() const;
    };

    /**
       creates the indexes a model declares.

       single field indexes come from fields with db_index or unique, on their
       storage column, descending if the model lists the field in its
       descending indexes.  compound indexes name storage keys and are used as
       declared.  index names are DBClientBase::genIndexName() of the key.
     */
    class IndexSynchronizer {
    public:
        IndexSynchronizer( const shared_ptr<DatabaseWrapper>& db ) : _db( db ) { }

        /** what d asks for, nothing is read */
        static vector<IndexDefinition> targetIndexes( const ModelDescriptor& d );

        /**
           creates the missing indexes of d.  an index whose name exists with the same key is left alone,
           unless its unique or sparse option differs: that is a UserException naming the index.
         */
        vector<IndexDefinition> sync( const ModelDescriptor& d );

        /** every model of the schema, in registration order */
        vector<IndexDefinition> syncAll();

    private:
        shared_ptr<DatabaseWrapper> _db;
    };

}
