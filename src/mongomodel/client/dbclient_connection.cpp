// dbclient_connection.cpp


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
#include "mongomodel/client/dbclient_connection.h"

#include "mongomodel/client/sasl_scram.h"
#include "mongomodel/db/errors.h"
#include "mongomodel/util/message.h"

namespace mongomodel {

    namespace {
        const int NamespaceNotFound = 26;

        /* OP_MSG appeared with wire version 6 */
        const int minWireVersion = 6;

        void splitNS( const string& ns , string& db , string& coll ) {
            size_t dot = ns.find( '.' );
            uassert( 16252 , string( "invalid ns: " ) + ns , dot != string::npos && dot > 0 && dot + 1 < ns.size() );
            db = ns.substr( 0 , dot );
            coll = ns.substr( dot + 1 );
        }

        string payloadOf( const Document& reply ) {
            Value p = reply["payload"];
            if ( p.type() == BinData )
                return p.binData();
            uassert( 16253 , "SASL reply without a payload" , p.type() == String );
            return p.str();
        }

        Document withField( const Document& d , const string& name , const Value& v ) {
            Document out = d;
            out.append( name , v );
            return out;
        }
    }

    DBClientConnection::DBClientConnection( const ClientOptions& options ) : DBClientBase( options ) {
    }

    DBClientConnection::~DBClientConnection() {
    }

    void DBClientConnection::connect( const string& host , int port ) {
        disconnect();

        stringstream ss;
        ss << host << ":" << port;
        _serverAddress = ss.str();

        try {
            SockAddr addr( host.c_str() , port );
            auto_ptr<Socket> s( new Socket( options().networkTimeout ) );
            if ( ! s->connect( addr ) )
                throw ConnectException( string( "couldn't connect to server " ) + _serverAddress );
            _port = s;
        }
        catch ( SocketException& e ) {
            throw ConnectException( string( "couldn't connect to server " ) + _serverAddress + " " + e.toString() );
        }

        try {
            _serverInfo = runCommand( "admin" , DOC( "isMaster" << 1 ) );
        }
        catch ( DBException& e ) {
            _port.reset();
            throw ConnectException( string( "handshake with " ) + _serverAddress + " failed: " + e.what() );
        }

        if ( _serverInfo["maxWireVersion"].numberInt() < minWireVersion ) {
            _port.reset();
            throw ConnectException( string( "server " ) + _serverAddress + " is too old, OP_MSG is not supported" );
        }

        LOG(1) << "connected to " << _serverAddress << " " << _serverInfo.toString() << endl;
    }

    bool DBClientConnection::auth( const string& dbname , const string& username , const string& pwd , string& errmsg ) {
        try {
            ScramSHA1ClientConversation conv( username , ScramSHA1ClientConversation::hashPassword( username , pwd ) );

            Document reply = runCommand( dbname , DOC( "saslStart" << 1 << "mechanism" << "SCRAM-SHA-1"
                                                       << "payload" << Value::createBinData( conv.firstMessage() )
                                                       << "autoAuthorize" << 1 ) );
            Value conversationId = reply["conversationId"];

            reply = runCommand( dbname , DOC( "saslContinue" << 1 << "conversationId" << conversationId
                                              << "payload" << Value::createBinData( conv.finalMessage( payloadOf( reply ) ) ) ) );
            conv.verifyServerFinal( payloadOf( reply ) );

            while ( ! reply["done"].trueValue() ) {
                reply = runCommand( dbname , DOC( "saslContinue" << 1 << "conversationId" << conversationId
                                                  << "payload" << Value::createBinData( "" ) ) );
            }
        }
        catch ( DBException& e ) {
            errmsg = e.what();
            LOG(1) << "auth of " << username << " on " << dbname << " failed: " << e.toString() << endl;
            return false;
        }
        LOG(1) << "authenticated " << username << " on " << dbname << endl;
        return true;
    }

    void DBClientConnection::disconnect() {
        if ( ! _port.get() )
            return;
        LOG(1) << "disconnecting from " << toString() << endl;
        _port.reset();
        resetIndexCache();
    }

    Document DBClientConnection::_call( const string& dbname , const Document& cmd ) {
        uassert( 16254 , string( "not connected to " ) + _serverAddress , isConnected() );

        Document body = withField( cmd , "$db" , dbname );
        try {
            int id = sayOpMsg( *_port , body );
            MsgHeader h;
            Document reply = recvOpMsg( *_port , &h );
            uassert( 16229 , "reply to another request" , h.responseTo == id );
            return reply;
        }
        catch ( DBException& ) {
            // the stream is out of step, nothing more can be read from it
            _port.reset();
            throw;
        }
    }

    Document DBClientConnection::_read( const string& dbname , const Document& cmd ) {
        if ( ! options().slaveOk )
            return _call( dbname , cmd );
        return _call( dbname , withField( cmd , "$readPreference" , DOC( "mode" << "secondaryPreferred" ) ) );
    }

    void DBClientConnection::_checkOk( const Document& cmd , const Document& reply ) {
        if ( reply["ok"].trueValue() )
            return;

        Value code = reply["code"];
        string errmsg = reply["errmsg"].type() == String ? reply["errmsg"].str() : reply.toString();
        string name = cmd.isEmpty() ? "" : cmd.begin()->name;

        if ( code.isNumber() && code.numberInt() == DuplicateKeyCode )
            raiseError( DuplicateKeyError( errmsg ) );
        uasserted( code.isNumber() ? code.numberInt() : 16255 , "command " + name + " failed: " + errmsg );
    }

    Document DBClientConnection::runCommand( const string& dbname , const Document& cmd ) {
        Document reply = _call( dbname , cmd );
        _checkOk( cmd , reply );
        return reply;
    }

    void DBClientConnection::_checkWriteReply( const Document& reply ) {
        Value writeErrors = reply["writeErrors"];
        if ( writeErrors.isArray() && ! writeErrors.array().empty() ) {
            const Value& first = writeErrors.array()[0];
            uassert( 16256 , "malformed write error" , first.isDocument() );
            const Document& err = first.embeddedObject();
            int code = err["code"].isNumber() ? err["code"].numberInt() : 16256;
            string errmsg = err["errmsg"].type() == String ? err["errmsg"].str() : err.toString();
            if ( code == DuplicateKeyCode )
                raiseError( DuplicateKeyError( errmsg ) );
            uasserted( code , errmsg );
        }

        Value wce = reply["writeConcernError"];
        if ( wce.isDocument() ) {
            const Document& err = wce.embeddedObject();
            int code = err["code"].isNumber() ? err["code"].numberInt() : 16257;
            uasserted( code , "write concern error: " + ( err["errmsg"].type() == String ? err["errmsg"].str() : err.toString() ) );
        }
    }

    Document DBClientConnection::translateWriteConcern( const Document& flags ) {
        Document wc;
        bool unacknowledged = false;
        for ( Document::const_iterator i = flags.begin(); i != flags.end(); ++i ) {
            if ( i->name == "safe" )
                unacknowledged = ! i->value.trueValue();
            else if ( i->name == "w" || i->name == "wtimeout" )
                wc.set( i->name , i->value );
            else if ( i->name == "fsync" ) {
                if ( i->value.trueValue() )
                    wc.set( "j" , true );
            }
            else if ( i->name == "j" )
                wc.set( "j" , i->value.trueValue() );
            else
                LOG(1) << "ignoring write flag " << i->name << endl;
        }
        if ( unacknowledged && wc.isEmpty() )
            wc.append( "w" , 0 );
        return wc;
    }

    Document DBClientConnection::_writeCommand( const string& ns , const string& command , const string& listName ,
                                                const Document& entry , const Document& writeConcern ) {
        string db , coll;
        splitNS( ns , db , coll );

        vector<Value> entries;
        entries.push_back( Value( entry ) );

        Document cmd;
        cmd.append( command , coll );
        cmd.append( listName , Value::createArray( entries ) );
        cmd.append( "ordered" , true );
        Document wc = translateWriteConcern( writeConcern );
        if ( ! wc.isEmpty() )
            cmd.append( "writeConcern" , wc );

        Document reply = runCommand( db , cmd );
        _checkWriteReply( reply );
        return reply;
    }

    vector<Document> DBClientConnection::_drainCursor( const string& dbname , const Document& reply ) {
        Value cursor = reply["cursor"];
        uassert( 16258 , "command reply without a cursor" , cursor.isDocument() );

        vector<Document> docs;
        Value batch = cursor.embeddedObject()["firstBatch"];
        long long id = cursor.embeddedObject()["id"].numberLong();
        string ns = cursor.embeddedObject()["ns"].type() == String ? cursor.embeddedObject()["ns"].str() : "";

        while ( true ) {
            uassert( 16259 , "cursor batch is not an array" , batch.isArray() );
            const vector<Value>& a = batch.array();
            for ( unsigned i = 0; i < a.size(); i++ ) {
                uassert( 16260 , "cursor batch holds a non document" , a[i].isDocument() );
                docs.push_back( a[i].embeddedObject() );
            }

            if ( id == 0 )
                break;

            string db , coll;
            splitNS( ns , db , coll );
            Document more = runCommand( dbname , DOC( "getMore" << id << "collection" << coll ) );
            Value c = more["cursor"];
            uassert( 16258 , "getMore reply without a cursor" , c.isDocument() );
            batch = c.embeddedObject()["nextBatch"];
            id = c.embeddedObject()["id"].numberLong();
        }
        return docs;
    }

    auto_ptr<DBClientCursor> DBClientConnection::query( const string& ns , Query query , int nToReturn , int nToSkip ) {
        string db , coll;
        splitNS( ns , db , coll );

        Document cmd;
        cmd.append( "find" , coll );
        cmd.append( "filter" , query.getFilter() );
        if ( ! query.getSort().isEmpty() )
            cmd.append( "sort" , query.getSort() );
        if ( nToSkip > 0 )
            cmd.append( "skip" , nToSkip );
        if ( nToReturn > 0 )
            cmd.append( "limit" , nToReturn );
        else if ( nToReturn < 0 ) {
            cmd.append( "limit" , -nToReturn );
            cmd.append( "singleBatch" , true );
        }

        Document reply = _read( db , cmd );
        _checkOk( cmd , reply );
        return auto_ptr<DBClientCursor>( new DBClientCursor( ns , _drainCursor( db , reply ) ) );
    }

    void DBClientConnection::insert( const string& ns , const Document& obj , const Document& writeConcern ) {
        _writeCommand( ns , "insert" , "documents" , obj , writeConcern );
    }

    void DBClientConnection::update( const string& ns , Query query , const Document& obj , bool upsert ,
                                     bool multi , const Document& writeConcern ) {
        _writeCommand( ns , "update" , "updates" ,
                       DOC( "q" << query.getFilter() << "u" << obj << "upsert" << upsert << "multi" << multi ) ,
                       writeConcern );
    }

    void DBClientConnection::remove( const string& ns , Query query , bool justOne , const Document& writeConcern ) {
        _writeCommand( ns , "delete" , "deletes" ,
                       DOC( "q" << query.getFilter() << "limit" << ( justOne ? 1 : 0 ) ) ,
                       writeConcern );
    }

    auto_ptr<DBClientCursor> DBClientConnection::getIndexes( const string& ns ) {
        string db , coll;
        splitNS( ns , db , coll );

        Document cmd = DOC( "listIndexes" << coll << "cursor" << Document() );
        Document reply = _read( db , cmd );
        vector<Document> result;
        if ( ! reply["ok"].trueValue() && reply["code"].isNumber() && reply["code"].numberInt() == NamespaceNotFound )
            return auto_ptr<DBClientCursor>( new DBClientCursor( ns , result ) );
        _checkOk( cmd , reply );

        vector<Document> indexes = _drainCursor( db , reply );
        for ( unsigned i = 0; i < indexes.size(); i++ ) {
            // newer servers leave ns out
            if ( indexes[i].hasField( "ns" ) )
                result.push_back( indexes[i] );
            else
                result.push_back( withField( indexes[i] , "ns" , ns ) );
        }
        return auto_ptr<DBClientCursor>( new DBClientCursor( ns , result ) );
    }

    void DBClientConnection::createIndex( const string& ns , const Document& spec ) {
        string db , coll;
        splitNS( ns , db , coll );

        Document index;
        for ( Document::const_iterator i = spec.begin(); i != spec.end(); ++i )
            if ( i->name != "ns" )
                index.append( i->name , i->value );
        if ( ! index.hasField( "name" ) && index["key"].isDocument() )
            index.append( "name" , genIndexName( index["key"].embeddedObject() ) );

        vector<Value> indexes;
        indexes.push_back( Value( index ) );
        LOG(1) << "createIndex " << ns << " " << index.toString() << endl;
        runCommand( db , DOC( "createIndexes" << coll << "indexes" << Value::createArray( indexes ) ) );
    }

    bool DBClientConnection::dropCollection( const string& ns ) {
        string db , coll;
        splitNS( ns , db , coll );
        resetIndexCache();

        Document cmd = DOC( "drop" << coll );
        Document reply = _call( db , cmd );
        if ( ! reply["ok"].trueValue() ) {
            if ( reply["code"].isNumber() && reply["code"].numberInt() == NamespaceNotFound )
                return false;
            // servers before 3.4 only say it in errmsg
            if ( reply["errmsg"].type() == String && reply["errmsg"].str() == "ns not found" )
                return false;
        }
        _checkOk( cmd , reply );
        return true;
    }

    list<string> DBClientConnection::getCollectionNames( const string& db ) {
        Document cmd = DOC( "listCollections" << 1 << "nameOnly" << true << "cursor" << Document() );
        Document reply = _read( db , cmd );
        _checkOk( cmd , reply );

        list<string> names;
        vector<Document> colls = _drainCursor( db , reply );
        for ( unsigned i = 0; i < colls.size(); i++ ) {
            string name = colls[i]["name"].str();
            if ( name.compare( 0 , 7 , "system." ) == 0 )
                continue;
            names.push_back( db + "." + name );
        }
        return names;
    }

    unsigned long long DBClientConnection::count( const string& ns , const Document& query , int limit , int skip ) {
        string db , coll;
        splitNS( ns , db , coll );

        Document cmd;
        cmd.append( "count" , coll );
        cmd.append( "query" , query );
        if ( limit > 0 )
            cmd.append( "limit" , limit );
        if ( skip > 0 )
            cmd.append( "skip" , skip );

        Document reply = _read( db , cmd );
        _checkOk( cmd , reply );
        return (unsigned long long) reply["n"].numberLong();
    }

}
