// gridfs_field.h

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

#include "mongomodel/client/gridfs.h"
#include "mongomodel/model/model_descriptor.h"

namespace mongomodel {

    class DatabaseWrapper;
    class ModelInstance;

    /**
       the value of a GridFS field.  a Value of type ModelRef wraps it so that
       instance.get( "file" ) hands back the very object that was set.
     */
    class Payload : public Referent {
    public:
        virtual ~Payload() { }

        /** writes the bytes as a new file.  @return the files document */
        virtual Document store( GridFS& fs ) = 0;

        /** all the bytes, without consuming anything */
        virtual string read() = 0;
    };

    typedef shared_ptr<Payload> PayloadPtr;

    /** bytes or text held in memory */
    class BytesPayload : public Payload {
    public:
        BytesPayload( const string& data ) : _data( data ) { }
        virtual Document store( GridFS& fs );
        virtual string read() { return _data; }
        virtual string toString() const;
    private:
        string _data;
    };

    /** an open stream.  stored from its current position, which is restored afterwards. */
    class StreamPayload : public Payload {
    public:
        StreamPayload( const shared_ptr<istream>& in ) : _in( in ) { }
        virtual Document store( GridFS& fs );
        virtual string read();
        virtual string toString() const { return "StreamPayload"; }
        istream& stream() const { return *_in; }
    private:
        shared_ptr<istream> _in;
    };

    /** a file already in GridFS, read on demand */
    class StoredPayload : public Payload {
    public:
        StoredPayload( const GridFile& file ) : _file( file ) { }
        virtual Document store( GridFS& fs );
        virtual string read() { return _file.read(); }
        virtual string toString() const;
        const GridFile& file() const { return _file; }
    private:
        GridFile _file;
    };

    /** GridFS prefix of a model is its collection, so payloads live in <collection>.files.  writes use the save flags of db. */
    shared_ptr<GridFS> openGridFS( const ModelDescriptor& d , DatabaseWrapper& db );

    /**
       per instance state of one GridFS field.

       UNSET -> CACHED by set() or by the first get() of a stored file.  the oid
       of the stored file is tracked apart from the cache, so a loaded instance
       is STORED but not CACHED until read.
     */
    class GridFSFieldState {
    public:
        typedef boost::function< shared_ptr<GridFS> () > Fetcher;

        GridFSFieldState() : _cached( false ) , _dirty( false ) { }

        /** the cache, else the stored file (which becomes the cache), else null */
        PayloadPtr get( const Fetcher& fetcher );

        /** new payload, written on the next save.  null clears the field. */
        void set( const PayloadPtr& p );

        bool isCached() const { return _cached; }
        PayloadPtr cache() const { return _cache; }

        bool isStored() const { return _oid.isSet(); }
        const OID& oid() const { return _oid; }
        void setOid( const OID& oid ) { _oid = oid; }
        void clearOid() { _oid.clear(); }

        bool isDirty() const { return _dirty; }
        void markClean() { _dirty = false; }

        string toString() const;

    private:
        PayloadPtr _cache;
        bool _cached;
        bool _dirty;
        OID _oid;
    };

    /**
       save / load / delete hooks for the GridFS fields of one model.

       the new payload is written before the record, the old one is removed only
       after the record was saved and only when versioning is off.
     */
    class GridFSFieldManager {
    public:
        GridFSFieldManager( const ModelDescriptor& d , DatabaseWrapper& db );

        /**
           writes dirty payloads and puts each field's oid (or null) into doc.
           @param obsolete gets oids to drop once the record is saved
         */
        void beforeSave( ModelInstance& inst , Document& doc , vector<OID>& obsolete );

        void afterSave( const vector<OID>& obsolete );

        /** records the stored oids.  nothing is read. */
        void afterLoad( ModelInstance& inst , const Document& doc );

        /** removes the payloads of autodelete fields referenced by a deleted record */
        void afterDelete( const Document& doc );

        GridFS& gridfs();

    private:
        const ModelDescriptor& _d;
        DatabaseWrapper& _db;
        shared_ptr<GridFS> _fs;
    };

}
