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
#ifndef ROTFTP_SOCKETCONNECTION_HPP
#define ROTFTP_SOCKETCONNECTION_HPP

#include <rotftp/Connection.hpp>
#include <rotftp/IpAddr.hpp>
#include <atomic>
#include <sys/socket.h>


namespace rotftp {


    /**
     * A UDP socket.
     * All blocking calls wait in <code>poll()</code> so that
     * a deadline can be put on every receive operation.
     */
    class SocketConnection : public Connection {
    public:
        SocketConnection ();

        /**
         * Destructor. Closes the socket.
         */
        virtual ~SocketConnection ();

        /**
         * Open the socket.
         * @param domain AF_INET or AF_INET6.
         * @param type The socket type, normally SOCK_DGRAM.
         * @param protocol The socket protocol, 0 for default.
         * @param close_on_exec Set the close-on-exec flag.
         * @return 0 on success, -1 on failure with <code>errno</code> set.
         */
        int open (int domain, int type=SOCK_DGRAM, int protocol=0, bool close_on_exec=true);

        virtual bool is_open () const;

        virtual void close ();

        /**
         * Bind the socket to a local address.
         * When bound to port 0 the kernel assigned port
         * is available from <code>addr()</code> after the call.
         * @return 0 on success, -1 on failure with <code>errno</code> set.
         */
        int bind (const IpAddr& addr);

        /**
         * Set the default peer of the socket.
         * Datagrams from any other address are dropped by the kernel.
         * @return 0 on success, -1 on failure with <code>errno</code> set.
         */
        int connect (const IpAddr& addr);

        /**
         * Return the local address of the socket.
         */
        const IpAddr& addr () const {
            return local_addr;
        }

        /**
         * Return the peer address of a connected socket.
         */
        const IpAddr& peer () const {
            return peer_addr;
        }

        /**
         * Check if a default peer is set with <code>connect()</code>.
         */
        bool is_connected () const {
            return connected;
        }

        /**
         * Receive one datagram on a connected socket.
         * @see Connection::read
         */
        virtual ssize_t read (void* buf, size_t size, unsigned timeout=-1);

        /**
         * Send one datagram on a connected socket.
         * @see Connection::write
         */
        virtual ssize_t write (const void* buf, size_t size);

        /**
         * Receive one datagram and the address it came from.
         * @param buf Buffer for the received datagram.
         * @param size The size of the buffer.
         * @param peer Set to the address of the sender.
         * @param timeout Timeout in milliseconds, or -1 to wait forever.
         * @return The number of bytes received, or -1 on error with
         *         <code>errno</code> set, ETIMEDOUT on a timeout.
         */
        ssize_t recvfrom (void* buf, size_t size, IpAddr& peer, unsigned timeout=-1);

        /**
         * Send one datagram to an address.
         * @return The number of bytes sent, or -1 on error
         *         with <code>errno</code> set.
         */
        ssize_t sendto (const void* buf, size_t size, const IpAddr& peer);

        /**
         * Set an integer socket option at level SOL_SOCKET.
         * @return 0 on success, -1 on failure with <code>errno</code> set.
         */
        int setsockopt (int optname, int value);


    private:
        SocketConnection (const SocketConnection& c) = delete;
        SocketConnection& operator= (const SocketConnection& conn) = delete;

        int wait_for_rx (unsigned timeout);
        void update_local_addr ();

        int fd;
        std::atomic_bool connected;
        IpAddr local_addr;
        IpAddr peer_addr;
    };


}


#endif
