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
#ifndef ROTFTPD_OPTIONS_HPP
#define ROTFTPD_OPTIONS_HPP

#include <rotftp.hpp>
#include <string>
#include <iostream>



//------------------------------------------------------------------------------
//  T Y P E S
//------------------------------------------------------------------------------
struct appargs_t {
    appargs_t ();

    /**
     * Parse command line arguments.
     * @return 0 on success, 1 if the usage was printed on request,
     *         -1 on invalid arguments.
     */
    int parse_args (int argc, char* argv[]);
    void print_usage (std::ostream& out);

    /**
     * Server settings from the parsed arguments.
     */
    rotftp::server_config_t server_config () const;

    rotftp::IpAddr bind_addr;
    std::string filename;
    unsigned timeout;     // seconds
    unsigned retries;
    size_t max_clients;
    bool log_to_syslog;
    bool verbose;
};


#endif
