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
#ifndef ROTFTP_CONNECTION_HPP
#define ROTFTP_CONNECTION_HPP

#include <cstdlib>
#include <unistd.h>


namespace rotftp {


    /**
     * A datagram connection to a single peer.
     * Each read and write transfers exactly one datagram.
     */
    class Connection {
    public:
        Connection () = default;

        virtual ~Connection () = default;

        /**
         * Check if the connection is open.
         */
        virtual bool is_open () const = 0;

        /**
         * Close the connection.
         * Calling this on a closed connection has no effect.
         */
        virtual void close () = 0;

        /**
         * Receive one datagram from the peer.
         * @param buf Buffer for the received datagram.
         * @param size The size of the buffer. A longer datagram is truncated.
         * @param timeout Timeout in milliseconds, or -1 to wait forever.
         * @return The number of bytes received, or -1 on error.
         *         On error, <code>errno</code> is set. On a timeout,
         *         <code>errno</code> is set to ETIMEDOUT.
         */
        virtual ssize_t read (void* buf, size_t size, unsigned timeout=-1) = 0;

        /**
         * Send one datagram to the peer.
         * @param buf The datagram to send.
         * @param size The size of the datagram.
         * @return The number of bytes sent, or -1 on error
         *         with <code>errno</code> set.
         */
        virtual ssize_t write (const void* buf, size_t size) = 0;


    private:
        Connection (const Connection& conn) = delete;
        Connection& operator= (const Connection& c) = delete;
    };


}


#endif
