// sasl_scram.h


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

namespace mongomodel {

    /**
       client side of a SCRAM-SHA-1 conversation ( RFC 5802 ), no channel binding.

         ScramSHA1ClientConversation c( user , ScramSHA1ClientConversation::hashPassword( user , pwd ) );
         string first = c.firstMessage();          // to saslStart
         string final = c.finalMessage( reply1 );  // to saslContinue
         c.verifyServerFinal( reply2 );

       every step uasserts on a malformed or failed server message.
     */
    class ScramSHA1ClientConversation {
    public:
        /**
           @param password what the salted password is derived from, see hashPassword()
           @param clientNonce empty for a random one
         */
        ScramSHA1ClientConversation( const string& user , const string& password , const string& clientNonce = "" );

        /** n,,n=<user>,r=<client nonce> */
        string firstMessage();

        /** parses r=,s=,i= and answers c=biws,r=<nonce>,p=<proof> */
        string finalMessage( const string& serverFirst );

        /** v=<server signature> must match, e=<error> is a failure */
        void verifyServerFinal( const string& serverFinal );

        /** the server keeps hex( md5( user:mongo:pwd ) ), that is the SCRAM-SHA-1 password */
        static string hashPassword( const string& user , const string& pwd );

        /** RFC 5802 names: '=' becomes =3D and ',' becomes =2C */
        static string encodeUsername( const string& user );

    private:
        string _user;
        string _password;
        string _clientNonce;
        string _authMessage;
        string _saltedPassword;
        int _step;
    };

    string base64Encode( const string& bytes );

    /** uasserts if s is not base64 */
    string base64Decode( const string& s );

}
