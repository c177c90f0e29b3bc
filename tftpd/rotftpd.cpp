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
#include <rotftp.hpp>
#include <iostream>
#include <memory>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <syslog.h>

#include "rotftpd-options.hpp"


namespace rot = rotftp;


static rot::Server* the_server = nullptr;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void cmd_signal_handler (int sig)
{
    // Signal the TFTP server to stop
    if (the_server)
        the_server->stop ();
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void init_signal_handler ()
{
    struct sigaction sa;
    memset (&sa, 0, sizeof(sa));
    sigemptyset (&sa.sa_mask);
    sa.sa_handler = cmd_signal_handler;
    sigaction (SIGINT, &sa, nullptr);
    sigaction (SIGTERM, &sa, nullptr);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int main (int argc, char* argv[])
{
    // Parse arguments
    //
    appargs_t opt;
    auto parse_result = opt.parse_args (argc, argv);
    if (parse_result)
        return parse_result<0 ? 1 : 0;

    // Configure logging
    //
    if (opt.log_to_syslog)
        openlog ("rotftpd", LOG_PID, LOG_DAEMON);
    else
        rot::Log::set_callback (rot::stdout_log_callback);
    rot::Log::priority (opt.verbose ? LOG_DEBUG : LOG_INFO);

    // Load the file to serve
    //
    auto payload = rot::Payload::load (opt.filename);
    if (!payload) {
        rot::Log::error ("Unable to read file '%s': %s", opt.filename.c_str(), strerror(errno));
        return 1;
    }
    rot::Log::info ("Serving file %s, %zu bytes, SHA-256 %s",
                    opt.filename.c_str(), payload->size(), payload->sha256().c_str());

    // Open the listening socket
    //
    rot::Server server (payload, opt.server_config());
    if (server.open())
        return 1;

    // Exit gracefully on CTRL-C (SIGINT) and SIGTERM
    //
    the_server = &server;
    init_signal_handler ();

    auto result = server.run ();
    the_server = nullptr;

    return result ? 1 : 0;
}
