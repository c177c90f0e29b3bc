/*
 * Copyright (C) 2026 Dan Arrhenius <dan@ultramarin.se>
 *
 * This file is part of rotftpd
 *
 * rotftpd is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include <rotftp/SocketConnection.hpp>
#include <rotftp/Log.hpp>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <poll.h>


//#define TRACE_DEBUG

#ifdef TRACE_DEBUG
#define TRACE(format, ...) Log::debug("%s:%s:%d: " format, __FILE__, __FUNCTION__, __LINE__, ## __VA_ARGS__)
#else
#define TRACE(format, ...)
#endif


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    SocketConnection::SocketConnection ()
        : fd {-1},
          connected {false}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    SocketConnection::~SocketConnection ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int SocketConnection::open (int domain, int type, int protocol, bool close_on_exec)
    {
        errno = 0;
        if (fd != -1)
            return 0;

        if (domain!=AF_INET && domain!=AF_INET6) {
            errno = EAFNOSUPPORT;
            return -1;
        }
        if (close_on_exec)
            type |= SOCK_CLOEXEC;

        fd = socket (domain, type, protocol);
        if (fd == -1) {
            auto errnum = errno;
            TRACE ("socket() failed: %s", strerror(errnum));
            errno = errnum;
            return -1;
        }

        // Until bound or connected, the local address
        // is the wildcard address of the socket family.
        local_addr = IpAddr (domain==AF_INET ? "0.0.0.0" : "::", 0);
        TRACE ("Opened socket %d", fd);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool SocketConnection::is_open () const
    {
        return fd != -1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void SocketConnection::close ()
    {
        if (fd < 0)
            return;

        TRACE ("Closing socket %d", fd);
        ::close (fd);
        fd = -1;
        connected = false;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void SocketConnection::update_local_addr ()
    {
        socklen_t slen = sizeof (struct sockaddr_storage);
        if (getsockname(fd, local_addr.data(), &slen)) {
            auto errnum = errno;
            Log::debug ("getsockname() failed on socket %d: %s", fd, strerror(errnum));
            errno = errnum;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int SocketConnection::bind (const IpAddr& addr)
    {
        errno = 0;
        if (fd < 0) {
            TRACE ("bind() failed: Socket not open");
            errno = EBADF;
            return -1;
        }
        if (addr.family() != local_addr.family()) {
            TRACE ("bind() failed: address family mismatch");
            errno = EINVAL;
            return -1;
        }

        TRACE ("Bind socket %d to address %s", fd, addr.to_string().c_str());
        if (::bind(fd, addr.data(), addr.size()))
            return -1;

        local_addr = addr;
        update_local_addr ();
        errno = 0;
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int SocketConnection::connect (const IpAddr& addr)
    {
        errno = 0;
        if (fd < 0) {
            TRACE ("connect() failed: Socket not open");
            errno = EBADF;
            return -1;
        }
        if (addr.family() != local_addr.family()) {
            TRACE ("connect() failed: address family mismatch");
            errno = EINVAL;
            return -1;
        }

        TRACE ("Connect socket %d to %s", fd, addr.to_string().c_str());
        if (::connect(fd, addr.data(), addr.size()))
            return -1;

        peer_addr = addr;
        connected = true;
        update_local_addr ();
        errno = 0;
        return 0;
    }


    //--------------------------------------------------------------------------
    // Return 0 when there is data to read, -1 on error or timeout.
    //--------------------------------------------------------------------------
    int SocketConnection::wait_for_rx (unsigned timeout)
    {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result;
        do {
            result = poll (&pfd, 1, timeout==(unsigned)-1 ? -1 : (int)timeout);
        }while (result<0 && errno==EINTR);

        if (result < 0)
            return -1;
        if (result == 0) {
            errno = ETIMEDOUT;
            return -1;
        }
        if (pfd.revents & POLLNVAL) {
            errno = EBADF;
            return -1;
        }
        // POLLERR is left to the following receive call to report
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t SocketConnection::read (void* buf, size_t size, unsigned timeout)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        if (!connected) {
            errno = ENOTCONN;
            return -1;
        }
        if (wait_for_rx(timeout))
            return -1;

        ssize_t result;
        do {
            result = ::recv (fd, buf, size, 0);
        }while (result<0 && errno==EINTR);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t SocketConnection::write (const void* buf, size_t size)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        if (!connected) {
            errno = ENOTCONN;
            return -1;
        }

        ssize_t result;
        do {
            result = ::send (fd, buf, size, 0);
        }while (result<0 && errno==EINTR);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t SocketConnection::recvfrom (void* buf, size_t size, IpAddr& peer, unsigned timeout)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        if (wait_for_rx(timeout))
            return -1;

        ssize_t result;
        do {
            socklen_t slen = sizeof (struct sockaddr_storage);
            result = ::recvfrom (fd, buf, size, 0, peer.data(), &slen);
        }while (result<0 && errno==EINTR);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t SocketConnection::sendto (const void* buf, size_t size, const IpAddr& peer)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }

        ssize_t result;
        do {
            result = ::sendto (fd, buf, size, 0, peer.data(), peer.size());
        }while (result<0 && errno==EINTR);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int SocketConnection::setsockopt (int optname, int value)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        return ::setsockopt (fd, SOL_SOCKET, optname, &value, sizeof(value));
    }


}
