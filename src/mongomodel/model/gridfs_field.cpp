// gridfs_field.cpp

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
#include "mongomodel/model/gridfs_field.h"

#include "mongomodel/client/connection.h"
#include "mongomodel/model/model_instance.h"

namespace mongomodel {

    Document BytesPayload::store( GridFS& fs ) {
        return fs.storeFile( _data.data() , _data.size() );
    }

    string BytesPayload::toString() const {
        stringstream ss;
        ss << "BytesPayload(" << _data.size() << " bytes)";
        return ss.str();
    }

    Document StreamPayload::store( GridFS& fs ) {
        istream& in = *_in;
        istream::pos_type pos = in.tellg();
        Document file = fs.storeFile( in );
        in.clear();
        in.seekg( pos );
        return file;
    }

    string StreamPayload::read() {
        istream& in = *_in;
        istream::pos_type pos = in.tellg();
        stringstream ss;
        char buf[4096];
        while ( in.good() ) {
            in.read( buf , sizeof( buf ) );
            ss.write( buf , in.gcount() );
        }
        uassert( 16130 , "error reading stream payload" , ! in.bad() );
        in.clear();
        in.seekg( pos );
        return ss.str();
    }

    Document StoredPayload::store( GridFS& fs ) {
        string data = _file.read();
        return fs.storeFile( data.data() , data.size() , _file.getFilename() , _file.getContentType() );
    }

    string StoredPayload::toString() const {
        stringstream ss;
        ss << "StoredPayload(" << _file.getId() << ")";
        return ss.str();
    }

    shared_ptr<GridFS> openGridFS( const ModelDescriptor& d , DatabaseWrapper& db ) {
        return shared_ptr<GridFS>( new GridFS( db.connection() , db.database() , d.collection() ,
                                                db.operationFlags( OP_SAVE ) ) );
    }

    PayloadPtr GridFSFieldState::get( const Fetcher& fetcher ) {
        if ( _cached )
            return _cache;
        if ( ! isStored() )
            return PayloadPtr();

        shared_ptr<GridFS> fs = fetcher();
        _cache.reset( new StoredPayload( fs->get( _oid ) ) );
        _cached = true;
        return _cache;
    }

    void GridFSFieldState::set( const PayloadPtr& p ) {
        _cache = p;
        _cached = true;
        _dirty = true;
    }

    string GridFSFieldState::toString() const {
        stringstream ss;
        ss << "{ cached: " << _cached << ", dirty: " << _dirty;
        if ( _cache )
            ss << ", cache: " << _cache->toString();
        if ( isStored() )
            ss << ", oid: " << _oid;
        ss << " }";
        return ss.str();
    }

    GridFSFieldManager::GridFSFieldManager( const ModelDescriptor& d , DatabaseWrapper& db )
        : _d( d ) , _db( db ) {
    }

    GridFS& GridFSFieldManager::gridfs() {
        if ( ! _fs )
            _fs = openGridFS( _d , _db );
        return *_fs;
    }

    void GridFSFieldManager::beforeSave( ModelInstance& inst , Document& doc , vector<OID>& obsolete ) {
        const vector<FieldDescriptor>& fields = _d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( ! f.isGridFS() )
                continue;

            GridFSFieldState& s = inst.gridfs( f.name() );
            if ( s.isDirty() ) {
                OID old = s.oid();
                PayloadPtr p = s.cache();
                if ( p ) {
                    Document file = p->store( gridfs() );
                    s.setOid( file["_id"].oid() );
                    LOG(1) << _d.name() << "." << f.name() << " stored as " << s.oid() << endl;
                }
                else {
                    s.clearOid();
                }
                if ( old.isSet() && ! f.isVersioned() )
                    obsolete.push_back( old );
                s.markClean();
            }

            if ( s.isStored() )
                doc.set( f.column() , Value( s.oid() ) );
            else
                doc.remove( f.column() );
        }
    }

    void GridFSFieldManager::afterSave( const vector<OID>& obsolete ) {
        for ( unsigned i = 0; i < obsolete.size(); i++ )
            gridfs().remove( obsolete[i] );
    }

    void GridFSFieldManager::afterLoad( ModelInstance& inst , const Document& doc ) {
        const vector<FieldDescriptor>& fields = _d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( ! f.isGridFS() )
                continue;
            Value v = doc[f.column()];
            GridFSFieldState& s = inst.gridfs( f.name() );
            if ( v.type() == jstOID )
                s.setOid( v.oid() );
            else
                s.clearOid();
        }
    }

    void GridFSFieldManager::afterDelete( const Document& doc ) {
        const vector<FieldDescriptor>& fields = _d.fields();
        for ( unsigned i = 0; i < fields.size(); i++ ) {
            const FieldDescriptor& f = fields[i];
            if ( ! f.isGridFS() || ! f.isAutodelete() )
                continue;
            Value v = doc[f.column()];
            if ( v.type() == jstOID )
                gridfs().remove( v.oid() );
        }
    }

}
