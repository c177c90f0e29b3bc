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
#ifndef ROTFTP_SERVER_HPP
#define ROTFTP_SERVER_HPP

#include <rotftp/SocketConnection.hpp>
#include <rotftp/TransferSession.hpp>
#include <rotftp/Payload.hpp>
#include <rotftp/Packet.hpp>
#include <rotftp/IpAddr.hpp>
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <list>


namespace rotftp {


    /**
     * Server settings.
     */
    struct server_config_t {
        server_config_t ()
            : bind_addr ("0.0.0.0", tftp_default_port),
              timeout (TransferSession::default_timeout),
              retries (TransferSession::default_retries),
              max_clients (0)
        {
        }

        IpAddr   bind_addr;   /**< Address and port of the listening socket. */
        unsigned timeout;     /**< Milliseconds to wait for each ACK. */
        unsigned retries;     /**< Attempts per data block. */
        size_t   max_clients; /**< Maximum number of concurrent sessions, 0 means no limit. */
    };


    /**
     * The TFTP listener.
     *
     * Receives requests on the well-known port and starts one
     * TransferSession, in a thread of its own, for each accepted
     * read request. Every session gets a new socket connected to
     * the client. Unless <code>max_clients</code> is set, there
     * is no limit on the number of concurrent sessions.
     */
    class Server {
    public:
        Server (std::shared_ptr<const Payload> payload,
                const server_config_t& config=server_config_t());

        /**
         * Destructor.
         * Closes the listening socket and waits for
         * all running sessions to finish.
         */
        ~Server ();

        /**
         * Open the listening socket and bind it to the configured address.
         * @return 0 on success, -1 on failure with <code>errno</code> set.
         */
        int open ();

        /**
         * Receive and dispatch requests until <code>stop()</code> is called.
         * When the loop ends, waits for running sessions to finish.
         * @return 0 when stopped, -1 if the listening socket failed.
         */
        int run ();

        /**
         * Make <code>run()</code> return.
         * This only sets a flag and may be called from a signal handler.
         */
        void stop () {
            running = false;
        }

        /**
         * The local address of the listening socket.
         * After <code>open()</code> this holds the actual
         * port number when the configured port is 0.
         */
        const IpAddr& addr () const {
            return listener.addr ();
        }

        /**
         * The number of sessions currently running.
         */
        size_t num_sessions () const {
            return active_sessions;
        }

        /**
         * The total number of sessions started.
         */
        size_t sessions_started () const {
            return total_sessions;
        }


    private:
        struct session_thread_t {
            std::thread thread;
            std::atomic_bool done {false};
        };

        Server (const Server&) = delete;
        Server& operator= (const Server&) = delete;

        void handle_request (const uint8_t* buf, size_t size, const IpAddr& peer);
        void reply_error (const IpAddr& peer, errcode_t code, const std::string& msg);
        void start_session (const request_t& rq, const IpAddr& peer);
        void reap_sessions (bool wait_for_all);

        std::shared_ptr<const Payload> payload;
        server_config_t cfg;
        SocketConnection listener;
        std::atomic_bool running;
        std::atomic_size_t active_sessions;
        std::atomic_size_t total_sessions;
        std::list<std::unique_ptr<session_thread_t>> sessions;
    };


}


#endif
