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
#ifndef ROTFTP_TRANSFERSESSION_HPP
#define ROTFTP_TRANSFERSESSION_HPP

#include <rotftp/Connection.hpp>
#include <rotftp/Payload.hpp>
#include <rotftp/Packet.hpp>
#include <string>
#include <memory>
#include <cstdint>


namespace rotftp {


    /**
     * Serves the payload to one client.
     *
     * The session sends one data block at a time and waits for it to be
     * acknowledged before the next block is sent. A block that isn't
     * acknowledged within the timeout, or that gets an acknowledgment
     * for another block number, is sent again until the retry budget
     * for the block is used up.
     *
     * A session is driven by <code>run()</code> in its own thread.
     * It is the only user of its connection and its payload cursor.
     */
    class TransferSession {
    public:
        enum class state_t {
            send_block, /**< Next block is about to be sent. */
            await_ack,  /**< Waiting for the acknowledgment of the last sent block. */
            completed,  /**< The last block is acknowledged. */
            aborted     /**< The transfer failed, see abort_reason(). */
        };

        enum class abort_reason_t {
            none,
            network_io,        /**< A send or receive failed for another reason than a timeout. */
            retries_exhausted, /**< No matching acknowledgment within the retry budget. */
            peer_error,        /**< The client sent an error packet. */
            malformed_reply    /**< The client sent something that is neither an ACK nor an error. */
        };

        static constexpr unsigned default_timeout = 5000; // milliseconds
        static constexpr unsigned default_retries = 10;

        /**
         * Constructor.
         * @param connection A connection to the client, the session takes
         *                   ownership and closes it when the session ends.
         * @param payload The data to send.
         * @param session_id A name for the session used in log messages.
         * @param timeout Milliseconds to wait for each acknowledgment.
         * @param retries The number of times a block is sent before
         *                giving up on it. A value of 0 is treated as 1.
         */
        TransferSession (std::unique_ptr<Connection> connection,
                         std::shared_ptr<const Payload> payload,
                         const std::string& session_id,
                         unsigned timeout=default_timeout,
                         unsigned retries=default_retries);

        ~TransferSession ();

        /**
         * Run the session until it is completed or aborted.
         * @return The final state.
         */
        state_t run ();

        /**
         * Make one state transition.
         * Does nothing in a terminal state.
         * @return The new state.
         */
        state_t step ();

        state_t state () const {
            return st;
        }

        bool is_done () const {
            return st==state_t::completed || st==state_t::aborted;
        }

        abort_reason_t abort_reason () const {
            return reason;
        }

        /**
         * The block number of the last sent block, 0 before the first one.
         */
        uint16_t block () const {
            return block_num;
        }

        /**
         * The number of distinct data blocks sent, retransmissions not included.
         */
        size_t blocks_sent () const {
            return num_blocks;
        }

        /**
         * The number of data packets sent, including retransmissions.
         */
        size_t packets_sent () const {
            return num_packets;
        }

        /**
         * The error packet received from the client
         * when aborted with abort_reason_t::peer_error.
         */
        const error_pkt_t& peer_error () const {
            return peer_err;
        }

        const std::string& id () const {
            return sess_id;
        }


    private:
        TransferSession (const TransferSession&) = delete;
        TransferSession& operator= (const TransferSession&) = delete;

        void send_block ();
        void await_ack ();
        bool transmit ();
        void resend_block (const char* cause);
        void end_session (state_t final_state, abort_reason_t why=abort_reason_t::none);

        std::unique_ptr<Connection> conn;
        std::shared_ptr<const Payload> payload;
        PayloadCursor cursor;
        std::string sess_id;
        unsigned timeout;
        unsigned max_attempts;

        state_t st;
        abort_reason_t reason;
        error_pkt_t peer_err;
        buffer_t pkt;
        size_t bytes_in_block;
        uint16_t block_num;
        unsigned attempts_left;
        size_t num_blocks;
        size_t num_packets;
    };


    const char* abort_reason_to_string (TransferSession::abort_reason_t reason);


}


#endif
