// @file sock.cpp


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
#include "mongomodel/util/sock.h"

#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/time.h>
#include <unistd.h>

namespace mongomodel {

    namespace {
        void setSockTimeouts(int sock, double secs) {
            struct timeval tv;
            tv.tv_sec = (int)secs;
            tv.tv_usec = (int)((long long)(secs*1000*1000) % (1000*1000));
            bool report = logLevel > 3;
            bool ok = setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, (char *) &tv, sizeof(tv) ) == 0;
            if( report && !ok ) log() << "unabled to set SO_RCVTIMEO" << endl;
            ok = setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, (char *) &tv, sizeof(tv) ) == 0;
            if( report && !ok ) log() << "unabled to set SO_SNDTIMEO" << endl;
        }

        void disableNagle(int sock) {
            int x = 1;
            if ( setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, (char *) &x, sizeof(x)) )
                log() << "ERROR: disableNagle failed " << errnoWithDescription() << endl;
        }
    }

    // --- SockAddr

    SockAddr::SockAddr(const char * iporhost , int port) {
        if (!strcmp(iporhost, "localhost"))
            iporhost = "127.0.0.1";

        addrinfo* addrs = NULL;
        addrinfo hints;
        memset(&hints, 0, sizeof(addrinfo));
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags |= AI_NUMERICHOST; // first pass tries w/o DNS lookup
        hints.ai_family = AF_UNSPEC;

        stringstream ss;
        ss << port;
        int ret = getaddrinfo(iporhost, ss.str().c_str(), &hints, &addrs);

#ifdef EAI_NODATA
        int nodata = (ret == EAI_NODATA);
#else
        int nodata = false;
#endif
        if (ret == EAI_NONAME || nodata) {
            // iporhost isn't an IP address, allow DNS lookup
            hints.ai_flags &= ~AI_NUMERICHOST;
            ret = getaddrinfo(iporhost, ss.str().c_str(), &hints, &addrs);
        }

        if (ret) {
            LOG(1) << "getaddrinfo(\"" << iporhost << "\") failed: " << gai_strerror(ret) << endl;
            throw SocketException( SocketException::CONNECT_ERROR , iporhost , 9001 ,
                                   string( "can't resolve host: " ) + gai_strerror(ret) );
        }

        verify(addrs->ai_addrlen <= sizeof(sa));
        memcpy(&sa, addrs->ai_addr, addrs->ai_addrlen);
        addressSize = addrs->ai_addrlen;
        freeaddrinfo(addrs);
    }

    string SockAddr::toString(bool includePort) const {
        string out = getAddr();
        if (includePort && getType() != AF_UNSPEC) {
            stringstream ss;
            ss << ':' << getPort();
            out += ss.str();
        }
        return out;
    }

    unsigned SockAddr::getPort() const {
        switch (getType()) {
        case AF_INET:  return ntohs(as<sockaddr_in>().sin_port);
        case AF_INET6: return ntohs(as<sockaddr_in6>().sin6_port);
        case AF_UNSPEC: return 0;
        default: massert(13078, "unsupported address family", false); return 0;
        }
    }

    string SockAddr::getAddr() const {
        switch (getType()) {
        case AF_INET:
        case AF_INET6: {
            const int buflen=128;
            char buffer[buflen];
            int ret = getnameinfo(raw(), addressSize, buffer, buflen, NULL, 0, NI_NUMERICHOST);
            massert(13082, gai_strerror(ret), ret == 0);
            return buffer;
        }
        case AF_UNSPEC: return "(NONE)";
        default: massert(13078, "unsupported address family", false); return "";
        }
    }

    // --------- SocketException ----------

    string SocketException::toString() const {
        stringstream ss;
        ss << _code << " socket exception [" << _type << "] ";

        if ( _server.size() )
            ss << "server [" << _server << "] ";

        if ( _extra.size() )
            ss << _extra;

        return ss.str();
    }

    // --------- Socket ----------

    Socket::Socket(double timeout) : _fd(-1), _timeout(timeout), _bytesIn(0), _bytesOut(0) {
    }

    Socket::Socket(int sock, const SockAddr& farEnd)
        : _fd(sock), _remote(farEnd), _timeout(0), _bytesIn(0), _bytesOut(0) {
    }

    Socket::~Socket() {
        close();
    }

    void Socket::close() {
        if ( _fd >= 0 ) {
            ::close(_fd);
            _fd = -1;
        }
    }

    bool Socket::connect(const SockAddr& farEnd) {
        close();
        _remote = farEnd;

        _fd = socket(farEnd.getType(), SOCK_STREAM, 0);
        if ( _fd < 0 ) {
            log() << "ERROR: connect invalid socket " << errnoWithDescription() << endl;
            return false;
        }

        if ( _timeout > 0 ) {
            setSockTimeouts( _fd, _timeout );
        }

        if ( ::connect(_fd, farEnd.raw(), farEnd.addressSize) ) {
            LOG(1) << "connect to " << farEnd.toString() << " failed " << errnoWithDescription() << endl;
            close();
            return false;
        }

        disableNagle(_fd);
        return true;
    }

    void Socket::send( const char * data , int len, const char *context ) {
        _bytesOut += len;
        while( len > 0 ) {
            int ret = ::send( _fd , data , len , MSG_NOSIGNAL );
            if ( ret == -1 ) {
                if ( ( errno == EAGAIN || errno == EWOULDBLOCK ) && _timeout != 0 ) {
                    LOG(1) << "Socket " << context << " send() timed out " << remoteString() << endl;
                    throw SocketException( SocketException::SEND_TIMEOUT , remoteString() );
                }
                LOG(1) << "Socket " << context << " send() " << errnoWithDescription() << ' ' << remoteString() << endl;
                throw SocketException( SocketException::SEND_ERROR , remoteString() );
            }
            verify( ret <= len );
            len -= ret;
            data += ret;
        }
    }

    void Socket::recv( char * buf , int len ) {
        unsigned retries = 0;
        while( len > 0 ) {
            int ret = ::recv( _fd , buf , len , 0 );
            if ( ret > 0 ) {
                verify( ret <= len );
                _bytesIn += ret;
                len -= ret;
                buf += ret;
            }
            else if ( ret == 0 ) {
                LOG(3) << "Socket recv() conn closed? " << remoteString() << endl;
                throw SocketException( SocketException::CLOSED , remoteString() );
            }
            else { /* ret < 0  */
                int e = errno;

                if( e == EINTR && ++retries == 1 ) {
                    log() << "EINTR retry" << endl;
                    continue;
                }

                if ( ( e == EAGAIN || e == EWOULDBLOCK ) && _timeout > 0 ) {
                    // this is a timeout
                    LOG(1) << "Socket recv() timeout  " << remoteString() <<endl;
                    throw SocketException( SocketException::RECV_TIMEOUT, remoteString() );
                }

                LOG(1) << "Socket recv() " << errnoWithDescription(e) << " " << remoteString() <<endl;
                throw SocketException( SocketException::RECV_ERROR , remoteString() );
            }
        }
    }

}
