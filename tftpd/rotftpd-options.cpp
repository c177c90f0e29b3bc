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
#include "rotftpd-options.hpp"

#include <string>
#include <iostream>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <getopt.h>


static constexpr unsigned default_timeout_sec = rotftp::TransferSession::default_timeout / 1000;
static constexpr unsigned max_timeout_sec = 255;
static constexpr unsigned max_retries = 1000;


//------------------------------------------------------------------------------
// Parse a non-negative decimal number, the whole string must be consumed.
//------------------------------------------------------------------------------
static bool parse_number (const char* arg, unsigned long& value)
{
    size_t pos;
    if (!arg || !*arg || *arg=='-')
        return false;
    try {
        value = std::stoul (arg, &pos, 10);
    }
    catch (std::logic_error&) {
        return false;
    }
    return pos == strlen (arg);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void appargs_t::print_usage (std::ostream& out)
{
    out << "Read-only TFTP server, serves a single file to any requesting client." << std::endl;
    out << std::endl;
    out << "Usage: " << program_invocation_short_name << " [OPTIONS] -file <filename>" << std::endl;
    out << std::endl;
    out << "  -f, --file=<filename>          The file to serve. This option is required." << std::endl;
    out << "  -H, --host=<address>           Bind the tftp server to this address[:port]." << std::endl;
    out << "                                 Default address is 0.0.0.0:" << rotftp::tftp_default_port << " (any local IPv4 address)." << std::endl;
    out << "  -p, --port=<port>              Bind the tftp server to this port number." << std::endl;
    out << "                                 This overrides any port in option --host." << std::endl;
    out << "  -t, --timeout=<seconds>        Seconds to wait for each ACK before a block is resent." << std::endl;
    out << "                                 Default is " << default_timeout_sec << ", max value is " << max_timeout_sec << '.' << std::endl;
    out << "  -r, --retries=<num>            Number of times a block is sent before the session is aborted." << std::endl;
    out << "                                 Default is " << rotftp::TransferSession::default_retries << '.' << std::endl;
    out << "  -m, --max-clients=<num>        Maximum number of concurrent clients." << std::endl;
    out << "                                 A value of 0 means no limit. Default is 0." << std::endl;
    out << "  -s, --syslog                   Log to syslog instead of standard output." << std::endl;
    out << "  -v, --verbose                  Verbose logging." << std::endl;
    out << "  -h, --help                     Print this help message." << std::endl;
    out << std::endl;
    out << "Long options may also be given with a single dash, like -file and -port." << std::endl;
    out << std::endl;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
appargs_t::appargs_t ()
    : bind_addr ("0.0.0.0", 0),
      timeout (default_timeout_sec),
      retries (rotftp::TransferSession::default_retries),
      max_clients (0),
      log_to_syslog (false),
      verbose (false)
{
};


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int appargs_t::parse_args (int argc, char* argv[])
{
    static struct option long_options[] = {
        { "file",        required_argument, 0, 'f'},
        { "host",        required_argument, 0, 'H'},
        { "port",        required_argument, 0, 'p'},
        { "timeout",     required_argument, 0, 't'},
        { "retries",     required_argument, 0, 'r'},
        { "max-clients", required_argument, 0, 'm'},
        { "syslog",      no_argument,       0, 's'},
        { "verbose",     no_argument,       0, 'v'},
        { "help",        no_argument,       0, 'h'},
        { 0, 0, 0, 0}
    };
    static const char* arg_format = "f:H:p:t:r:m:svh";
    int bind_port = -1;
    unsigned long value;

    while (1) {
        int c = getopt_long_only (argc, argv, arg_format, long_options, NULL);
        if (c == -1)
            break;
        switch (c) {
        case 'f':
            filename = optarg;
            break;

        case 'H':
            if (!*optarg) {
                // Empty host, listen on any local IPv4 address
                bind_addr = rotftp::IpAddr ("0.0.0.0", bind_addr.port());
            }
            else if (!bind_addr.parse(optarg)) {
                std::cerr << "Error: Invalid IPv[4|6] address and/or port number to argument '--host'" << std::endl;
                return -1;
            }
            break;

        case 'p':
            if (!parse_number(optarg, value) || value==0 || value>65535) {
                std::cerr << "Error: Invalid port number to argument '--port'" << std::endl;
                return -1;
            }
            bind_port = (int) value;
            break;

        case 't':
            if (!parse_number(optarg, value) || value==0 || value>max_timeout_sec) {
                std::cerr << "Error: Invalid value to argument '--timeout'" << std::endl;
                return -1;
            }
            timeout = (unsigned) value;
            break;

        case 'r':
            if (!parse_number(optarg, value) || value==0 || value>max_retries) {
                std::cerr << "Error: Invalid value to argument '--retries'" << std::endl;
                return -1;
            }
            retries = (unsigned) value;
            break;

        case 'm':
            if (!parse_number(optarg, value)) {
                std::cerr << "Error: Invalid number of maximum clients to argument '--max-clients'" << std::endl;
                return -1;
            }
            max_clients = (size_t) value;
            break;

        case 's':
            log_to_syslog = true;
            break;

        case 'v':
            verbose = true;
            break;

        case 'h':
            print_usage (std::cout);
            return 1;

        default:
            return -1;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Invalid argument" << std::endl;
        print_usage (std::cerr);
        return -1;
    }
    if (filename.empty()) {
        std::cerr << "Error: Missing argument '--file'" << std::endl;
        return -1;
    }

    // Set port number
    //
    if (bind_port != -1)
        bind_addr.port ((uint16_t)bind_port);
    else if (!bind_addr.port())
        bind_addr.port (rotftp::tftp_default_port);

    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
rotftp::server_config_t appargs_t::server_config () const
{
    rotftp::server_config_t cfg;
    cfg.bind_addr   = bind_addr;
    cfg.timeout     = timeout * 1000;
    cfg.retries     = retries;
    cfg.max_clients = max_clients;
    return cfg;
}
