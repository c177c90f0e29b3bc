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
#include <rotftp/Server.hpp>
#include <rotftp/Log.hpp>
#include <sstream>
#include <exception>
#include <system_error>
#include <cstring>
#include <cerrno>


namespace rotftp {


    // How often the receive loop checks if it should stop
    static constexpr unsigned stop_check_interval = 250; // milliseconds


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Server::Server (std::shared_ptr<const Payload> data, const server_config_t& config)
        : payload (std::move(data)),
          cfg (config),
          running {true},
          active_sessions {0},
          total_sessions {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Server::~Server ()
    {
        listener.close ();
        reap_sessions (true);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Server::open ()
    {
        if (listener.open(cfg.bind_addr.family(), SOCK_DGRAM)) {
            auto errnum = errno;
            Log::error ("Unable to open socket: %s", strerror(errnum));
            errno = errnum;
            return -1;
        }
        if (listener.setsockopt(SO_REUSEADDR, 1) || listener.bind(cfg.bind_addr)) {
            auto errnum = errno;
            Log::error ("Unable to bind socket to %s: %s",
                        cfg.bind_addr.to_string(true).c_str(), strerror(errnum));
            listener.close ();
            errno = errnum;
            return -1;
        }
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Server::run ()
    {
        int retval = 0;
        uint8_t buf[tftp_max_datagram_size];

        Log::info ("Listening on %s", listener.addr().to_string(true).c_str());

        while (running) {
            IpAddr peer;
            auto result = listener.recvfrom (buf, sizeof(buf), peer, stop_check_interval);
            if (result < 0) {
                auto errnum = errno;
                if (errnum != ETIMEDOUT) {
                    if (errnum==EBADF || errnum==ENOTSOCK) {
                        Log::error ("Listening socket failed: %s", strerror(errnum));
                        retval = -1;
                        break;
                    }
                    Log::warning ("Error waiting for client request: %s", strerror(errnum));
                }
            }else{
                handle_request (buf, result, peer);
            }
            // Join threads of sessions that have ended
            reap_sessions (false);
        }

        listener.close ();
        if (active_sessions)
            Log::info ("Waiting for %zu session(s) to finish", (size_t)active_sessions);
        reap_sessions (true);
        Log::info ("Stopped");
        return retval;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Server::reply_error (const IpAddr& peer, errcode_t code, const std::string& msg)
    {
        buffer_t pkt;
        encode_error (code, msg, pkt);
        if (listener.sendto(pkt.data(), pkt.size(), peer) < 0) {
            auto errnum = errno;
            Log::info ("Unable to send error to %s: %s",
                       peer.to_string(true).c_str(), strerror(errnum));
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Server::handle_request (const uint8_t* buf, size_t size, const IpAddr& peer)
    {
        request_t rq;
        auto err = decode_request (buf, size, rq);
        if (err != decode_err_t::none) {
            Log::info ("Invalid request from %s: %s",
                       peer.to_string(true).c_str(), decode_err_to_string(err));
            reply_error (peer, errcode_t::illegal_operation, "");
            return;
        }

        Log::info ("%s from %s - '%s', mode %s",
                   opcode_to_string(rq.op),
                   peer.to_string(true).c_str(),
                   rq.filename.c_str(),
                   rq.mode.c_str());

        if (rq.op == op_wrq) {
            Log::notice ("WRQ from %s rejected, server is read-only", peer.to_string(true).c_str());
            reply_error (peer, errcode_t::access_violation, "Write not supported");
            return;
        }

        if (cfg.max_clients>0 && active_sessions>=cfg.max_clients) {
            Log::notice ("RRQ from %s rejected - too many clients", peer.to_string(true).c_str());
            reply_error (peer, errcode_t::undefined, "Server busy");
            return;
        }

        start_session (rq, peer);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Server::start_session (const request_t& rq, const IpAddr& peer)
    {
        // Each transfer uses a new socket, locked to the client address:port
        auto sock = std::make_unique<SocketConnection> ();
        if (sock->open(peer.family(), SOCK_DGRAM) || sock->connect(peer)) {
            auto errnum = errno;
            Log::warning ("Unable to create socket for client %s: %s",
                          peer.to_string(true).c_str(), strerror(errnum));
            return;
        }

        std::stringstream ss;
        ss << sock->addr().port() << ':' << sock->peer().to_string(true);
        auto sess_id = ss.str ();

        Log::info ("RRQ session %s, file %s, %zu bytes",
                   sess_id.c_str(), rq.filename.c_str(), payload->size());

        auto sess = std::make_unique<TransferSession> (std::move(sock),
                                                       payload,
                                                       sess_id,
                                                       cfg.timeout,
                                                       cfg.retries);
        auto entry = std::make_unique<session_thread_t> ();
        auto* st = entry.get ();

        ++active_sessions;
        try {
            entry->thread = std::thread ([this, st, s = std::move(sess)]() {
                    try {
                        s->run ();
                    }
                    catch (std::exception& e) {
                        Log::error ("Session %s failed: %s", s->id().c_str(), e.what());
                    }
                    --active_sessions;
                    st->done = true;
                });
        }
        catch (std::system_error& e) {
            --active_sessions;
            Log::error ("Unable to start session %s: %s", sess_id.c_str(), e.what());
            return;
        }
        ++total_sessions;
        sessions.emplace_back (std::move(entry));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Server::reap_sessions (bool wait_for_all)
    {
        for (auto i=sessions.begin(); i!=sessions.end();) {
            auto& entry = **i;
            if (wait_for_all || entry.done) {
                if (entry.thread.joinable())
                    entry.thread.join ();
                i = sessions.erase (i);
            }else{
                ++i;
            }
        }
    }


}
