// sasl_scram.cpp


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
#include "mongomodel/client/sasl_scram.h"

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/md5.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "mongomodel/util/hex.h"

namespace mongomodel {

    namespace {
        const int hashSize = SHA_DIGEST_LENGTH;

        string sha1( const string& input ) {
            unsigned char out[SHA_DIGEST_LENGTH];
            massert( 16234 , "SHA1 failed" ,
                     SHA1( (const unsigned char *) input.data() , input.size() , out ) != NULL );
            return string( (const char *) out , hashSize );
        }

        string hmacSha1( const string& key , const string& input ) {
            unsigned char out[EVP_MAX_MD_SIZE];
            unsigned int len = 0;
            massert( 16235 , "HMAC-SHA1 failed" ,
                     HMAC( EVP_sha1() , key.data() , (int) key.size() ,
                           (const unsigned char *) input.data() , input.size() , out , &len ) != NULL );
            return string( (const char *) out , len );
        }

        string saltPassword( const string& password , const string& salt , int iterations ) {
            unsigned char out[SHA_DIGEST_LENGTH];
            massert( 16236 , "PBKDF2 failed" ,
                     PKCS5_PBKDF2_HMAC_SHA1( password.data() , (int) password.size() ,
                                             (const unsigned char *) salt.data() , (int) salt.size() ,
                                             iterations , hashSize , out ) == 1 );
            return string( (const char *) out , hashSize );
        }

        bool startsWith( const string& s , const char *prefix ) {
            return s.compare( 0 , strlen( prefix ) , prefix ) == 0;
        }

        vector<string> splitMessage( const string& msg ) {
            vector<string> parts;
            boost::split( parts , msg , boost::is_any_of( "," ) );
            vector<string> out;
            for ( unsigned i = 0; i < parts.size(); i++ )
                if ( ! parts[i].empty() )
                    out.push_back( parts[i] );
            return out;
        }
    }

    string base64Encode( const string& bytes ) {
        string out( 4 * ( ( bytes.size() + 2 ) / 3 ) + 1 , '\0' );
        int n = EVP_EncodeBlock( (unsigned char *) &out[0] , (const unsigned char *) bytes.data() , (int) bytes.size() );
        out.resize( n );
        return out;
    }

    string base64Decode( const string& s ) {
        uassert( 16237 , string( "invalid base64: " ) + s , s.size() % 4 == 0 );
        if ( s.empty() )
            return "";
        string out( 3 * s.size() / 4 + 1 , '\0' );
        int n = EVP_DecodeBlock( (unsigned char *) &out[0] , (const unsigned char *) s.data() , (int) s.size() );
        uassert( 16237 , string( "invalid base64: " ) + s , n >= 0 );
        // EVP_DecodeBlock counts the padding as data
        if ( s[s.size() - 1] == '=' )
            n--;
        if ( s[s.size() - 2] == '=' )
            n--;
        out.resize( n );
        return out;
    }

    ScramSHA1ClientConversation::ScramSHA1ClientConversation( const string& user , const string& password ,
                                                              const string& clientNonce )
        : _user( user ) , _password( password ) , _clientNonce( clientNonce ) , _step( 0 ) {
        uassert( 16238 , "empty client password provided" , ! _password.empty() );
        if ( _clientNonce.empty() ) {
            // text nonce as base64 of a blob whose length is a multiple of 3
            unsigned char binaryNonce[24];
            massert( 16239 , "can't generate a SCRAM nonce" , RAND_bytes( binaryNonce , sizeof( binaryNonce ) ) == 1 );
            _clientNonce = base64Encode( string( (const char *) binaryNonce , sizeof( binaryNonce ) ) );
        }
    }

    string ScramSHA1ClientConversation::encodeUsername( const string& user ) {
        string u = user;
        boost::replace_all( u , "=" , "=3D" );
        boost::replace_all( u , "," , "=2C" );
        return u;
    }

    string ScramSHA1ClientConversation::hashPassword( const string& user , const string& pwd ) {
        string in = user + ":mongo:" + pwd;
        unsigned char d[MD5_DIGEST_LENGTH];
        MD5( (const unsigned char *) in.data() , in.size() , d );
        return toHexLower( d , MD5_DIGEST_LENGTH );
    }

    string ScramSHA1ClientConversation::firstMessage() {
        uassert( 16240 , "SCRAM conversation already started" , _step == 0 );
        _step = 1;
        _authMessage = "n=" + encodeUsername( _user ) + ",r=" + _clientNonce;
        return "n,," + _authMessage;
    }

    string ScramSHA1ClientConversation::finalMessage( const string& serverFirst ) {
        uassert( 16241 , "SCRAM server-first-message out of order" , _step == 1 );
        _step = 2;

        uassert( 16242 , "SCRAM required extensions not supported" , ! startsWith( serverFirst , "m=" ) );
        vector<string> input = splitMessage( serverFirst );
        uassert( 16243 , string( "incorrect number of arguments for first SCRAM server message: " ) + serverFirst ,
                 input.size() >= 3 );

        uassert( 16244 , string( "incorrect SCRAM client|server nonce: " ) + input[0] ,
                 startsWith( input[0] , "r=" ) && input[0].size() > 2 );
        string nonce = input[0].substr( 2 );
        uassert( 16245 , string( "server SCRAM nonce does not match client nonce: " ) + nonce ,
                 startsWith( nonce , _clientNonce.c_str() ) );

        uassert( 16246 , string( "incorrect SCRAM salt: " ) + input[1] ,
                 startsWith( input[1] , "s=" ) && input[1].size() > 2 );
        string salt = base64Decode( input[1].substr( 2 ) );

        uassert( 16247 , string( "incorrect SCRAM iteration count: " ) + input[2] ,
                 startsWith( input[2] , "i=" ) && input[2].size() > 2 );
        char *end = 0;
        long iterations = strtol( input[2].c_str() + 2 , &end , 10 );
        uassert( 16247 , string( "incorrect SCRAM iteration count: " ) + input[2] ,
                 *end == '\0' && iterations > 0 && iterations <= INT_MAX );

        string withoutProof = "c=biws,r=" + nonce;
        _authMessage += "," + serverFirst + "," + withoutProof;

        _saltedPassword = saltPassword( _password , salt , (int) iterations );
        string clientKey = hmacSha1( _saltedPassword , "Client Key" );
        string storedKey = sha1( clientKey );
        string clientSignature = hmacSha1( storedKey , _authMessage );

        string proof = clientKey;
        for ( int i = 0; i < hashSize; i++ )
            proof[i] ^= clientSignature[i];

        return withoutProof + ",p=" + base64Encode( proof );
    }

    void ScramSHA1ClientConversation::verifyServerFinal( const string& serverFinal ) {
        uassert( 16248 , "SCRAM server-final-message out of order" , _step == 2 );
        _step = 3;

        vector<string> input = splitMessage( serverFinal );
        uassert( 16249 , "empty final SCRAM server message" , ! input.empty() && input[0].size() > 2 );

        if ( startsWith( input[0] , "e=" ) )
            uasserted( 18 , "SCRAM authentication failure: " + input[0].substr( 2 ) );

        uassert( 16250 , string( "incorrect SCRAM ServerSignature: " ) + input[0] , startsWith( input[0] , "v=" ) );

        string serverKey = hmacSha1( _saltedPassword , "Server Key" );
        string expected = hmacSha1( serverKey , _authMessage );
        uassert( 16251 , string( "client failed to verify SCRAM ServerSignature, received " ) + input[0].substr( 2 ) ,
                 base64Decode( input[0].substr( 2 ) ) == expected );
    }

}
