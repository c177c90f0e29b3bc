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
#include <rotftp/TransferSession.hpp>
#include <rotftp/Log.hpp>
#include <cstring>
#include <cerrno>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* abort_reason_to_string (TransferSession::abort_reason_t reason)
    {
        switch (reason) {
        case TransferSession::abort_reason_t::none:
            return "none";
        case TransferSession::abort_reason_t::network_io:
            return "network I/O error";
        case TransferSession::abort_reason_t::retries_exhausted:
            return "retries exhausted";
        case TransferSession::abort_reason_t::peer_error:
            return "error from peer";
        case TransferSession::abort_reason_t::malformed_reply:
            return "malformed reply";
        default:
            return "n/a";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    TransferSession::TransferSession (std::unique_ptr<Connection> connection,
                                      std::shared_ptr<const Payload> data,
                                      const std::string& session_id,
                                      unsigned timeout_ms,
                                      unsigned retries)
        : conn (std::move(connection)),
          payload (std::move(data)),
          cursor (*payload),
          sess_id (session_id),
          timeout (timeout_ms),
          max_attempts (retries ? retries : 1),
          st (state_t::send_block),
          reason (abort_reason_t::none),
          bytes_in_block (0),
          block_num (0),
          attempts_left (0),
          num_blocks (0),
          num_packets (0)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    TransferSession::~TransferSession ()
    {
        if (conn)
            conn->close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    TransferSession::state_t TransferSession::run ()
    {
        while (!is_done())
            step ();
        return st;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    TransferSession::state_t TransferSession::step ()
    {
        switch (st) {
        case state_t::send_block:
            send_block ();
            break;

        case state_t::await_ack:
            await_ack ();
            break;

        default:
            break;
        }
        return st;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void TransferSession::end_session (state_t final_state, abort_reason_t why)
    {
        st = final_state;
        reason = why;
        conn->close ();

        if (st == state_t::completed) {
            Log::info ("Session %s done, %zu blocks sent", sess_id.c_str(), num_blocks);
        }else{
            Log::info ("Session %s aborted at block #%u: %s",
                       sess_id.c_str(), (unsigned)block_num, abort_reason_to_string(why));
        }
    }


    //--------------------------------------------------------------------------
    // Send the data packet in pkt. Return false on a send error.
    //--------------------------------------------------------------------------
    bool TransferSession::transmit ()
    {
        ++num_packets;
        if (conn->write(pkt.data(), pkt.size()) < 0) {
            auto errnum = errno;
            Log::info ("Session %s, error sending block #%u: %s",
                       sess_id.c_str(), (unsigned)block_num, strerror(errnum));
            return false;
        }
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void TransferSession::send_block ()
    {
        bytes_in_block = encode_data (block_num, cursor, pkt);
        ++num_blocks;
        attempts_left = max_attempts;

        if (!transmit()) {
            end_session (state_t::aborted, abort_reason_t::network_io);
            return;
        }
        st = state_t::await_ack;
    }


    //--------------------------------------------------------------------------
    // A timeout or a wrong ACK uses up one attempt for the current block.
    //--------------------------------------------------------------------------
    void TransferSession::resend_block (const char* cause)
    {
        if (--attempts_left == 0) {
            Log::info ("Session %s, %s waiting for ACK #%u, no attempts left",
                       sess_id.c_str(), cause, (unsigned)block_num);
            end_session (state_t::aborted, abort_reason_t::retries_exhausted);
            return;
        }

        Log::debug ("Session %s, %s waiting for ACK #%u, resend block (%u attempts left)",
                    sess_id.c_str(), cause, (unsigned)block_num, attempts_left);
        if (!transmit())
            end_session (state_t::aborted, abort_reason_t::network_io);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void TransferSession::await_ack ()
    {
        uint8_t reply[tftp_max_datagram_size];

        auto result = conn->read (reply, sizeof(reply), timeout);
        if (result < 0) {
            auto errnum = errno;
            if (errnum == ETIMEDOUT) {
                resend_block ("timeout");
            }else{
                Log::info ("Session %s, error receiving ACK #%u: %s",
                           sess_id.c_str(), (unsigned)block_num, strerror(errnum));
                end_session (state_t::aborted, abort_reason_t::network_io);
            }
            return;
        }

        Packet reply_pkt;
        auto err = Packet::decode (reply, result, reply_pkt);
        if (err != decode_err_t::none) {
            Log::info ("Session %s, invalid reply received: %s",
                       sess_id.c_str(), decode_err_to_string(err));
            end_session (state_t::aborted, abort_reason_t::malformed_reply);
            return;
        }

        switch (reply_pkt.opcode()) {
        case op_ack:
            if (reply_pkt.ack().block == block_num) {
                if (bytes_in_block < tftp_block_size)
                    end_session (state_t::completed);
                else
                    st = state_t::send_block;
            }else{
                resend_block ("wrong block number");
            }
            break;

        case op_error:
            peer_err = reply_pkt.error ();
            Log::info ("Session %s, TFTP error received: %s (%s)",
                       sess_id.c_str(),
                       errcode_to_string(peer_err.code),
                       peer_err.message.c_str());
            end_session (state_t::aborted, abort_reason_t::peer_error);
            break;

        default:
            Log::info ("Session %s, unexpected %s packet received",
                       sess_id.c_str(), opcode_to_string(reply_pkt.opcode()));
            end_session (state_t::aborted, abort_reason_t::malformed_reply);
        }
    }


}
