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
#ifndef ROTFTP_IPADDR_HPP
#define ROTFTP_IPADDR_HPP

#include <string>
#include <stdexcept>
#include <cstdint>
#include <sys/socket.h>
#include <netinet/in.h>


namespace rotftp {


    /**
     * An IPv4 or IPv6 socket address.
     */
    class IpAddr {
    public:
        /**
         * Default constructor.
         * Constructs the IPv4 wildcard address with port number 0.
         */
        IpAddr ();

        /**
         * Parse a string and create an IP address.
         * Accepted formats are <code>a.b.c.d[:port]</code>,
         * <code>[v6addr][:port]</code> and <code>v6addr</code>.
         * @param address The string to parse.
         * @throw std::invalid_argument on parse error.
         */
        explicit IpAddr (const std::string& address);

        /**
         * Parse a string and create an IP address with a specific port.
         * @param address The string to parse, any port number in it is replaced.
         * @param port_num A port number in host byte order.
         * @throw std::invalid_argument on parse error.
         */
        IpAddr (const std::string& address, uint16_t port_num);

        IpAddr (const IpAddr& addr) = default;
        IpAddr& operator= (const IpAddr& addr) = default;

        /**
         * Compare address family, address and port.
         */
        bool operator== (const IpAddr& rhs) const;

        bool operator!= (const IpAddr& rhs) const {
            return ! operator== (rhs);
        }

        /**
         * Parse an address from a string.
         * The object is left unchanged on failure.
         * @param address The string to parse.
         * @param parse_port If <code>true</code>,
         *                   also accept a port number in the string.
         * @return <code>true</code> on success, <code>false</code> on failure.
         */
        bool parse (const std::string& address, bool parse_port=true);

        /**
         * Return the address family, AF_INET or AF_INET6.
         */
        sa_family_t family () const;

        /**
         * Return the size of the socket address data.
         * This is the size passed to <code>bind()</code>,
         * <code>connect()</code> and <code>sendto()</code>.
         */
        socklen_t size () const;

        /**
         * Return the socket address data.
         */
        const struct sockaddr* data () const;

        /**
         * Return the socket address data for <code>recvfrom()</code>
         * and <code>getsockname()</code> to fill in.
         */
        struct sockaddr* data ();

        /**
         * Return the port number in host byte order.
         */
        uint16_t port () const;

        /**
         * Set the port number.
         * @param port_num A port number in host byte order.
         */
        void port (uint16_t port_num);

        /**
         * Return a string representation of the address,
         * optionally including the port number.
         */
        std::string to_string (bool include_port=true) const;


    private:
        struct sockaddr_storage sa;
    };


}


#endif
