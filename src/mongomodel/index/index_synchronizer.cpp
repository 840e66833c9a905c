// index_synchronizer.cpp

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
#include "mongomodel/index/index_synchronizer.h"

namespace mongomodel {

    string IndexDefinition::toString() const {
        stringstream ss;
        ss << collection << "." << name << " " << key.toString();
        if ( unique )
            ss << " unique";
        if ( sparse )
            ss << " sparse";
        return ss.str();
    }

    vector<IndexDefinition> IndexSynchronizer::targetIndexes( const ModelDescriptor& d ) {
        vector<IndexDefinition> result;

        const vector<FieldDescriptor>& fields = d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( f.isPrimaryKey() || ! ( f.hasDbIndex() || f.isUnique() ) )
                continue;

            IndexDefinition def;
            def.collection = d.collection();
            def.key.append( f.column() , d.isDescending( f.name() ) ? -1 : 1 );
            def.name = DBClientBase::genIndexName( def.key );
            def.unique = f.isUnique();
            def.sparse = f.isSparse();
            result.push_back( def );
        }

        const vector<IndexSpec>& compound = d.indexes();
        for ( unsigned i = 0; i < compound.size(); i++ ) {
            IndexDefinition def;
            def.collection = d.collection();
            const vector< pair<string,int> >& keys = compound[i].fields();
            for ( unsigned j = 0; j < keys.size(); j++ )
                def.key.append( keys[j].first , keys[j].second );
            def.name = DBClientBase::genIndexName( def.key );
            def.unique = compound[i].isUnique();
            def.sparse = compound[i].isSparse();
            result.push_back( def );
        }

        return result;
    }

    vector<IndexDefinition> IndexSynchronizer::sync( const ModelDescriptor& d ) {
        vector<IndexDefinition> target = targetIndexes( d );
        if ( target.empty() )
            return target;

        shared_ptr<Collection> c = _db->getCollection( d.collection() );
        Document existing = c->indexInformation();

        // what the server lists wins over what this client remembers creating
        _db->connection()->resetIndexCache();

        for ( unsigned i = 0; i < target.size(); i++ ) {
            IndexDefinition& def = target[i];

            Value info = existing[def.name];
            if ( info.isDocument() && info.embeddedObject()["key"] == Value( def.key ) ) {
                Document live = info.embeddedObject();
                if ( live["unique"].trueValue() != def.unique || live["sparse"].trueValue() != def.sparse ) {
                    stringstream ss;
                    ss << "index " << def.collection << "." << def.name << " exists with different options: "
                       << live.toString() << " expected " << def.toString();
                    uasserted( 16211 , ss.str() );
                }
                LOG(1) << "index " << def.toString() << " already exists" << endl;
                continue;
            }

            Document options;
            options.append( "name" , def.name );
            if ( def.unique )
                options.append( "unique" , true );
            if ( def.sparse )
                options.append( "sparse" , true );
            def.created = ! c->ensureIndex( def.key , options ).empty();
            if ( def.created )
                log() << "created index " << def.toString() << endl;
        }
        return target;
    }

    vector<IndexDefinition> IndexSynchronizer::syncAll() {
        vector<IndexDefinition> result;
        vector< shared_ptr<const ModelDescriptor> > models = Schema::global().all();
        for ( unsigned i = 0; i < models.size(); i++ ) {
            vector<IndexDefinition> r = sync( *models[i] );
            result.insert( result.end() , r.begin() , r.end() );
        }
        return result;
    }

}
