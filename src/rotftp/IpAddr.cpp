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
#include <rotftp/IpAddr.hpp>
#include <sstream>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <regex>
#include <arpa/inet.h>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    IpAddr::IpAddr ()
    {
        memset (&sa, 0, sizeof(sa));
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    IpAddr::IpAddr (const std::string& address)
        : IpAddr ()
    {
        if (!parse(address, true))
            throw std::invalid_argument ("Invalid IP address");
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    IpAddr::IpAddr (const std::string& address, uint16_t port_num)
        : IpAddr ()
    {
        if (!parse(address, true))
            throw std::invalid_argument ("Invalid IP address");
        port (port_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool IpAddr::operator== (const IpAddr& rhs) const
    {
        return (this == &rhs ||
                (size()==rhs.size() && memcmp(&sa, &rhs.sa, size())==0));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool parse_port (const char* str, int& port)
    {
        static const std::regex regex_port_num ("0*(?:"
                                                "[0-9]|"
                                                "[1-9][0-9]{1,3}|"
                                                "[1-5][0-9]{4}|"
                                                "6[0-4][0-9]{3}|"
                                                "65[0-4][0-9]{2}|"
                                                "655[0-2][0-9]|"
                                                "6553[0-5]"
                                                ")");
        std::cmatch m;
        if (!regex_match(str, m, regex_port_num))
            return false;

        port = atoi (str);
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool IpAddr::parse (const std::string& address, bool also_parse_port)
    {
        std::string ip_str;
        bool try_ipv4 = true;
        bool try_ipv6 = true;
        int port_num = -1;
        struct in_addr  ipv4addr;
        struct in6_addr ipv6addr;

        if (address.empty())
            return false;

        if (address[0] == '[') {
            // Bracketed IPv6 address, optionally followed by a port
            try_ipv4 = false;
            auto pos = address.find ("]:");
            if (pos != std::string::npos) {
                ip_str = address.substr (1, pos-1);
                if (!also_parse_port || !parse_port(address.c_str()+pos+2, port_num))
                    return false;
            }
            else if (address[address.size()-1] == ']') {
                ip_str = address.substr (1, address.size()-2);
            }
            else {
                return false;
            }
        }
        else if (inet_pton(AF_INET6, address.c_str(), &ipv6addr) == 1) {
            // Plain IPv6 address, may end with a dotted IPv4 part
            try_ipv4 = false;
        }
        else {
            auto pos = address.find ('.');
            if (pos != std::string::npos) {
                // Dotted IPv4 address, optionally followed by a port
                try_ipv6 = false;
                pos = address.find (':');
                if (pos != std::string::npos) {
                    ip_str = address.substr (0, pos);
                    if (!also_parse_port || !parse_port(address.c_str()+pos+1, port_num))
                        return false;
                }
            }
        }

        const std::string& addr = ip_str.empty() ? address : ip_str;
        uint16_t old_port = port ();

        if (try_ipv4 && inet_pton(AF_INET, addr.c_str(), &ipv4addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in&)sa).sin_family = AF_INET;
            ((struct sockaddr_in&)sa).sin_addr = ipv4addr;
        }
        else if (try_ipv6 && inet_pton(AF_INET6, addr.c_str(), &ipv6addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in6&)sa).sin6_family = AF_INET6;
            ((struct sockaddr_in6&)sa).sin6_addr = ipv6addr;
        }
        else {
            return false;
        }

        port (port_num != -1 ? (uint16_t)port_num : old_port);
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    sa_family_t IpAddr::family () const
    {
        return ((const struct sockaddr&)sa).sa_family;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    socklen_t IpAddr::size () const
    {
        switch (family()) {
        case AF_INET:
            return sizeof (struct sockaddr_in);
        case AF_INET6:
            return sizeof (struct sockaddr_in6);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const struct sockaddr* IpAddr::data () const
    {
        return (const struct sockaddr*) &sa;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    struct sockaddr* IpAddr::data ()
    {
        return (struct sockaddr*) &sa;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint16_t IpAddr::port () const
    {
        switch (family()) {
        case AF_INET:
            return ntohs (((const struct sockaddr_in&)sa).sin_port);
        case AF_INET6:
            return ntohs (((const struct sockaddr_in6&)sa).sin6_port);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void IpAddr::port (uint16_t port_num)
    {
        switch (family()) {
        case AF_INET:
            ((struct sockaddr_in&)sa).sin_port = htons (port_num);
            break;
        case AF_INET6:
            ((struct sockaddr_in6&)sa).sin6_port = htons (port_num);
            break;
        default:
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string IpAddr::to_string (bool include_port) const
    {
        std::stringstream ss;

        if (family() == AF_INET) {
            char tmp[INET_ADDRSTRLEN];
            inet_ntop (AF_INET, &(((const struct sockaddr_in&)sa).sin_addr), tmp, sizeof(tmp));
            ss << tmp;
            if (include_port)
                ss << ':' << port();
        }
        else if (family() == AF_INET6) {
            char tmp[INET6_ADDRSTRLEN];
            inet_ntop (AF_INET6, &(((const struct sockaddr_in6&)sa).sin6_addr), tmp, sizeof(tmp));
            if (include_port)
                ss << '[' << tmp << "]:" << port();
            else
                ss << tmp;
        }
        else {
            ss << "[n/a]";
        }
        return ss.str ();
    }


}
