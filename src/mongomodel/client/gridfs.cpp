// gridfs.cpp

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

#include <boost/scoped_array.hpp>

#include "mongomodel/pch.h"
#include "mongomodel/client/gridfs.h"

#include <cmath>

#include "mongomodel/db/errors.h"
#include "mongomodel/util/time_support.h"

#ifndef MIN
#define MIN(a,b) ( (a) < (b) ? (a) : (b) )
#endif

namespace mongomodel {

    const unsigned DEFAULT_CHUNK_SIZE = 256 * 1024;

    Chunk::Chunk( const Document& o ) {
        _data = o;
    }

    Chunk::Chunk( const Value& filesId , int chunkNumber , const char * data , int len ) {
        _data.append( "files_id" , filesId );
        _data.append( "n" , chunkNumber );
        _data.append( "data" , Value::createBinData( string( data , len ) ) );
    }

    GridFS::GridFS( const shared_ptr<DBClientBase>& client , const string& dbName , const string& prefix ,
                    const Document& writeConcern )
        : _client( client ) , _dbName( dbName ) , _prefix( prefix ) , _writeConcern( writeConcern ) {
        uassert( 16100 , "GridFS needs a client" , _client );
        _filesNS = dbName + "." + prefix + ".files";
        _chunksNS = dbName + "." + prefix + ".chunks";

        _client->ensureIndex( _filesNS , DOC( "filename" << 1 ) );
        _client->ensureIndex( _chunksNS , DOC( "files_id" << 1 << "n" << 1 ) );
    }

    GridFS::~GridFS() {

    }

    Document GridFS::storeFile( const char* data , size_t length , const string& remoteName , const string& contentType ) {
        massert( 10279 , "large files not yet implemented", length <= 0xffffffff);
        char const * const end = data + length;

        OID id;
        id.init();

        int chunkNumber = 0;
        while (data < end) {
            int chunkLen = MIN(DEFAULT_CHUNK_SIZE, (unsigned)(end-data));
            Chunk c( Value( id ) , chunkNumber , data , chunkLen );
            _client->insert( _chunksNS , c._data , _writeConcern );

            chunkNumber++;
            data += chunkLen;
        }

        return insertFile( remoteName , id , length , contentType );
    }

    Document GridFS::storeFile( istream& in , const string& remoteName , const string& contentType ) {
        OID id;
        id.init();

        int chunkNumber = 0;
        gridfs_offset length = 0;
        boost::scoped_array<char> buf( new char[DEFAULT_CHUNK_SIZE] );
        while ( in.good() ) {
            in.read( buf.get() , DEFAULT_CHUNK_SIZE );
            int chunkLen = (int) in.gcount();
            if ( chunkLen == 0 )
                break;

            Chunk c( Value( id ) , chunkNumber , buf.get() , chunkLen );
            _client->insert( _chunksNS , c._data , _writeConcern );

            length += chunkLen;
            chunkNumber++;
        }
        uassert( 16101 , "error reading stream for gridfs" , ! in.bad() );

        massert( 10280 , "large files not yet implemented", length <= 0xffffffff);

        return insertFile( remoteName , id , length , contentType );
    }

    Document GridFS::insertFile( const string& name , const OID& id , gridfs_offset length , const string& contentType ) {
        Document file;
        file.append( "_id" , id );
        if ( ! name.empty() )
            file.append( "filename" , name );
        file.append( "length" , (long long) length );
        file.append( "chunkSize" , (int) DEFAULT_CHUNK_SIZE );
        file.append( "uploadDate" , Value::createDate( jsTime() ) );

        if ( ! contentType.empty() )
            file.append( "contentType" , contentType );

        _client->insert( _filesNS , file , _writeConcern );

        LOG(1) << "gridfs stored " << id << " in " << _filesNS << " length: " << length << endl;
        return file;
    }

    void GridFS::removeFile( const string& fileName ) {
        auto_ptr<DBClientCursor> files = _client->query( _filesNS , QUERY( "filename" << fileName ) );
        while ( files->more() ) {
            Document file = files->next();
            Value id = file["_id"];
            _client->remove( _filesNS , QUERY( "_id" << id ) , false , _writeConcern );
            _client->remove( _chunksNS , QUERY( "files_id" << id ) , false , _writeConcern );
        }
    }

    void GridFS::remove( const OID& id ) {
        // chunks first, a file entry without chunks is never left behind
        _client->remove( _chunksNS , QUERY( "files_id" << id ) , false , _writeConcern );
        _client->remove( _filesNS , QUERY( "_id" << id ) , false , _writeConcern );
        LOG(1) << "gridfs removed " << id << " from " << _filesNS << endl;
    }

    GridFile::GridFile( const shared_ptr<DBClientBase>& client , const string& chunksNS , const Document& obj )
        : _client( client ) , _chunksNS( chunksNS ) , _obj( obj ) {
    }

    GridFile GridFS::findFile( const string& fileName ) {
        return findFile( DOC( "filename" << fileName ) );
    }

    GridFile GridFS::findFile( const OID& id ) {
        return findFile( DOC( "_id" << id ) );
    }

    GridFile GridFS::findFile( const Document& query ) {
        Query q( query );
        q.sort( "uploadDate" , -1 );
        return GridFile( _client , _chunksNS , _client->findOne( _filesNS , q ) );
    }

    GridFile GridFS::get( const OID& id ) {
        GridFile f = findFile( id );
        if ( ! f.exists() ) {
            stringstream ss;
            ss << "no file in gridfs collection " << _filesNS << " with _id " << id;
            raiseError( MissingPayloadError( ss.str() ) );
        }
        return f;
    }

    bool GridFS::exists( const OID& id ) {
        return findFile( id ).exists();
    }

    int GridFile::getNumChunks() const {
        return (int) ceil( (double)getContentLength() / (double)getChunkSize() );
    }

    Chunk GridFile::getChunk( int n ) const {
        _exists();
        Document q;
        q.append( "files_id" , _obj["_id"] );
        q.append( "n" , n );

        Document o = _client->findOne( _chunksNS , Query( q ) );
        uassert( 10014 , "chunk is empty!" , ! o.isEmpty() );
        return Chunk(o);
    }

    gridfs_offset GridFile::write( ostream & out ) const {
        _exists();

        const int num = getNumChunks();

        for ( int i=0; i<num; i++ ) {
            Chunk c = getChunk( i );
            string data = c.data();
            out.write( data.data() , data.size() );
        }

        return getContentLength();
    }

    string GridFile::read() const {
        stringstream ss;
        write( ss );
        return ss.str();
    }

    void GridFile::_exists() const {
        uassert( 10015 , "doesn't exists" , exists() );
    }

}
