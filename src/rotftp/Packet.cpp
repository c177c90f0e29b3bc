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
#include <rotftp/Packet.hpp>
#include <rotftp/Payload.hpp>
#include <cstring>
#include <cctype>
#include <arpa/inet.h>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static inline void put_u16 (uint8_t* dst, uint16_t value)
    {
        value = htons (value);
        memcpy (dst, &value, sizeof(value));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static inline uint16_t get_u16 (const uint8_t* src)
    {
        uint16_t value;
        memcpy (&value, src, sizeof(value));
        return ntohs (value);
    }


    //--------------------------------------------------------------------------
    // Read a null terminated string starting at offset pos.
    // On success, pos is moved past the terminator.
    //--------------------------------------------------------------------------
    static bool get_string (const uint8_t* buf, size_t size, size_t& pos, std::string& str)
    {
        if (pos >= size)
            return false;
        auto* start = buf + pos;
        auto* end = (const uint8_t*) memchr (start, '\0', size - pos);
        if (!end)
            return false;
        str.assign ((const char*)start, end - start);
        pos += (end - start) + 1;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t encode_request (const request_t& rq, buffer_t& buf)
    {
        const std::string& mode = rq.mode.empty() ? std::string(tftp_octet_mode) : rq.mode;

        buf.resize (sizeof(uint16_t) + rq.filename.size() + 1 + mode.size() + 1);
        auto* p = buf.data ();

        put_u16 (p, rq.op==op_wrq ? op_wrq : op_rrq);
        p += sizeof (uint16_t);
        memcpy (p, rq.filename.data(), rq.filename.size());
        p += rq.filename.size ();
        *p++ = '\0';
        memcpy (p, mode.data(), mode.size());
        p += mode.size ();
        *p = '\0';

        return buf.size ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    decode_err_t decode_request (const void* buf, size_t size, request_t& rq)
    {
        auto* p = (const uint8_t*) buf;

        if (size < sizeof(uint16_t))
            return decode_err_t::malformed_packet;

        auto op = get_u16 (p);
        if (op!=op_rrq && op!=op_wrq)
            return decode_err_t::malformed_packet;

        size_t pos = sizeof (uint16_t);
        std::string filename;
        if (!get_string(p, size, pos, filename) || filename.empty())
            return decode_err_t::malformed_packet;

        std::string mode;
        if (!get_string(p, size, pos, mode))
            return decode_err_t::malformed_packet;
        for (auto& c : mode)
            c = (char) tolower ((unsigned char)c);
        if (mode != tftp_octet_mode)
            return decode_err_t::unsupported_mode;

        rq.op = (opcode_t) op;
        rq.filename = std::move (filename);
        rq.mode = std::move (mode);
        return decode_err_t::none;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t encode_data (uint16_t& block, PayloadCursor& cursor, buffer_t& buf)
    {
        buf.resize (tftp_max_datagram_size);
        auto* p = buf.data ();

        ++block;
        put_u16 (p, op_data);
        put_u16 (p+sizeof(uint16_t), block);

        auto bytes = cursor.read (p+tftp_header_size, tftp_block_size);
        buf.resize (tftp_header_size + bytes);
        return bytes;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    decode_err_t decode_data (const void* buf, size_t size, data_t& dat)
    {
        auto* p = (const uint8_t*) buf;

        if (size < tftp_header_size  ||  get_u16(p) != op_data)
            return decode_err_t::malformed_packet;

        dat.block = get_u16 (p+sizeof(uint16_t));
        dat.payload = p + tftp_header_size;
        dat.size = size - tftp_header_size;
        return decode_err_t::none;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t encode_ack (uint16_t block, buffer_t& buf)
    {
        buf.resize (tftp_header_size);
        put_u16 (buf.data(), op_ack);
        put_u16 (buf.data()+sizeof(uint16_t), block);
        return buf.size ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    decode_err_t decode_ack (const void* buf, size_t size, ack_t& ack)
    {
        auto* p = (const uint8_t*) buf;

        if (size < tftp_header_size  ||  get_u16(p) != op_ack)
            return decode_err_t::malformed_packet;

        ack.block = get_u16 (p+sizeof(uint16_t));
        return decode_err_t::none;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t encode_error (errcode_t code, const std::string& message, buffer_t& buf)
    {
        // Keep the error packet within one datagram
        size_t msg_len = message.size ();
        if (msg_len > tftp_block_size - 1)
            msg_len = tftp_block_size - 1;

        buf.resize (tftp_header_size + msg_len + 1);
        auto* p = buf.data ();

        put_u16 (p, op_error);
        put_u16 (p+sizeof(uint16_t), static_cast<uint16_t>(code));
        memcpy (p+tftp_header_size, message.data(), msg_len);
        p[tftp_header_size + msg_len] = '\0';

        return buf.size ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    decode_err_t decode_error (const void* buf, size_t size, error_pkt_t& err)
    {
        auto* p = (const uint8_t*) buf;

        if (size < tftp_header_size  ||  get_u16(p) != op_error)
            return decode_err_t::malformed_packet;

        err.code = static_cast<errcode_t> (get_u16(p+sizeof(uint16_t)));

        auto* msg = (const char*) (p + tftp_header_size);
        size_t len = size - tftp_header_size;
        auto* end = (const char*) memchr (msg, '\0', len);
        err.message.assign (msg, end ? (size_t)(end - msg) : len);
        return decode_err_t::none;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Packet::Packet ()
        : op {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    decode_err_t Packet::decode (const void* buf, size_t size, Packet& pkt)
    {
        pkt.op = 0;
        if (size < sizeof(uint16_t))
            return decode_err_t::malformed_packet;

        auto op = get_u16 ((const uint8_t*)buf);
        decode_err_t result;

        switch (op) {
        case op_rrq:
        case op_wrq:
            result = decode_request (buf, size, pkt.rq);
            break;

        case op_data:
            result = decode_data (buf, size, pkt.dat);
            break;

        case op_ack:
            result = decode_ack (buf, size, pkt.ack_);
            break;

        case op_error:
            result = decode_error (buf, size, pkt.err);
            break;

        default:
            result = decode_err_t::malformed_packet;
        }

        if (result == decode_err_t::none)
            pkt.op = op;
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* opcode_to_string (uint16_t op)
    {
        switch (op) {
        case op_rrq:
            return "RRQ";
        case op_wrq:
            return "WRQ";
        case op_data:
            return "DATA";
        case op_ack:
            return "ACK";
        case op_error:
            return "ERROR";
        default:
            return "n/a";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* errcode_to_string (errcode_t code)
    {
        switch (code) {
        case errcode_t::undefined:
            return "Not defined";
        case errcode_t::file_not_found:
            return "File not found";
        case errcode_t::access_violation:
            return "Access violation";
        case errcode_t::disk_full:
            return "Disk full or allocation exceeded";
        case errcode_t::illegal_operation:
            return "Illegal TFTP operation";
        case errcode_t::unknown_transfer_id:
            return "Unknown transfer ID";
        case errcode_t::file_already_exists:
            return "File already exists";
        case errcode_t::no_such_user:
            return "No such user";
        default:
            return "Unknown error code";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* decode_err_to_string (decode_err_t err)
    {
        switch (err) {
        case decode_err_t::none:
            return "no error";
        case decode_err_t::malformed_packet:
            return "malformed packet";
        case decode_err_t::unsupported_mode:
            return "unsupported transfer mode";
        default:
            return "n/a";
        }
    }


}
