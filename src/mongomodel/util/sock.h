// @file sock.h


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

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>

namespace mongomodel {

    /** a resolved remote end point */
    struct SockAddr {
        SockAddr() {
            addressSize = sizeof(sa);
            memset(&sa, 0, sizeof(sa));
            sa.ss_family = AF_UNSPEC;
        }

        /** resolves host, numerically first then through DNS.  uasserts if it can't. */
        SockAddr(const char *iporhost, int port);

        template <typename T> const T& as() const { return *(const T*)(&sa); }

        string toString(bool includePort=true) const;

        sa_family_t getType() const { return sa.ss_family; }
        unsigned getPort() const;
        string getAddr() const;

        const sockaddr* raw() const { return (const sockaddr*)&sa; }

        socklen_t addressSize;
    private:
        struct sockaddr_storage sa;
    };

    /** thrown by Socket */
    class SocketException : public DBException {
    public:
        const enum Type { CLOSED , RECV_ERROR , SEND_ERROR, RECV_TIMEOUT, SEND_TIMEOUT, CONNECT_ERROR } _type;

        SocketException( Type t , string server , int code = 9001 , string extra="" )
            : DBException( "socket exception" , code ) , _type(t) , _server(server), _extra(extra){ }
        virtual ~SocketException() throw() {}

        virtual string toString() const;

    private:
        string _server;
        string _extra;
    };

    /** thin wrapper around a connected stream socket.  closes it on destruction. */
    class Socket : boost::noncopyable {
    public:
        /** @param so_timeout send / receive timeout in seconds, 0 for none */
        Socket(double so_timeout = 0);
        /** takes over an already connected fd, e.g. one from accept() */
        Socket(int sock, const SockAddr& farEnd);
        ~Socket();

        /** @return false if the connection could not be made, the reason is logged */
        bool connect(const SockAddr& farEnd);
        void close();
        bool isOpen() const { return _fd >= 0; }

        /** sends all data or throws SocketException */
        void send( const char * data , int len, const char *context );

        /** receives exactly len bytes or throws SocketException */
        void recv( char * data , int len );

        string remoteString() const { return _remote.toString(); }

        long long getBytesIn() const { return _bytesIn; }
        long long getBytesOut() const { return _bytesOut; }

    private:
        int _fd;
        SockAddr _remote;
        double _timeout;

        long long _bytesIn;
        long long _bytesOut;
    };

}
