/** @file gridfs.h */

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

#include "mongomodel/client/dbclient.h"

namespace mongomodel {

    typedef unsigned long long gridfs_offset;

    class GridFS;
    class GridFile;

    class Chunk {
    public:
        Chunk( const Document& data );
        Chunk( const Value& filesId , int chunkNumber , const char * data , int len );

        int len() const {
            return (int) _data["data"].binData().size();
        }

        string data() const {
            return _data["data"].binData();
        }

    private:
        Document _data;
        friend class GridFS;
    };

    /**
       this is the main entry point into the grid fs.
       files live in <dbname>.<prefix>.files, their chunks in <dbname>.<prefix>.chunks.
     */
    class GridFS {
    public:
        /**
         * @param client - db connection
         * @param dbName - root database name
         * @param prefix - if you want your data somewhere besides <dbname>.fs
         * @param writeConcern - passed with every chunk and file write
         */
        GridFS( const shared_ptr<DBClientBase>& client , const string& dbName , const string& prefix="fs" ,
                const Document& writeConcern = Document() );
        ~GridFS();

        /**
         * @param data - the bytes to store
         * @param length - number of bytes
         * @param remoteName - filename to use in the files collection
         * @param contentType - optional MIME type for this object
         * @return the file object
         */
        Document storeFile( const char* data , size_t length , const string& remoteName = "" ,
                            const string& contentType = "" );

        /**
         * stores what is left in the stream, starting at its current position
         * @return the file object
         */
        Document storeFile( istream& in , const string& remoteName = "" , const string& contentType = "" );

        /**
         * removes every file named fileName from the db
         */
        void removeFile( const string& fileName );

        /**
         * removes the file with this id and its chunks.  no-op if there is none.
         */
        void remove( const OID& id );

        /**
         * returns a file object matching the query, the newest if there are several
         */
        GridFile findFile( const Document& query );

        /**
         * equiv to findFile( { filename : filename } )
         */
        GridFile findFile( const string& fileName );

        /**
         * equiv to findFile( { _id : id } )
         */
        GridFile findFile( const OID& id );

        /**
         * like findFile( id ) but raises MissingPayloadError if there is no such file
         */
        GridFile get( const OID& id );

        bool exists( const OID& id );

        const string& filesNS() const { return _filesNS; }
        const string& chunksNS() const { return _chunksNS; }

    private:
        Document insertFile( const string& name , const OID& id , gridfs_offset length , const string& contentType );

        shared_ptr<DBClientBase> _client;
        string _dbName;
        string _prefix;
        string _filesNS;
        string _chunksNS;
        Document _writeConcern;

        friend class GridFile;
    };

    /**
       wrapper for a file stored in the database.  holds on to the connection, so it
       can be read after the GridFS it came from is gone.
     */
    class GridFile {
    public:
        /**
         * @return whether or not this file exists
         * findFile will always return a GridFile, so need to check this
         */
        bool exists() const {
            return ! _obj.isEmpty();
        }

        OID getId() const {
            return _obj["_id"].oid();
        }

        string getFilename() const {
            return _obj["filename"].str();
        }

        int getChunkSize() const {
            return (int)(_obj["chunkSize"].number());
        }

        gridfs_offset getContentLength() const {
            return (gridfs_offset)(_obj["length"].numberLong());
        }

        string getContentType() const {
            Value v = _obj["contentType"];
            return v.eoo() ? "" : v.str();
        }

        int getNumChunks() const;

        Chunk getChunk( int n ) const;

        /**
           write the file to the output stream
         */
        gridfs_offset write( ostream & out ) const;

        /** the whole content */
        string read() const;

    private:
        GridFile( const shared_ptr<DBClientBase>& client , const string& chunksNS , const Document& obj );

        void _exists() const;

        shared_ptr<DBClientBase> _client;
        string _chunksNS;
        Document _obj;

        friend class GridFS;
    };

}
