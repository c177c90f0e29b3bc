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
#ifndef ROTFTP_PACKET_HPP
#define ROTFTP_PACKET_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>


namespace rotftp {

    // Forward declaration
    class PayloadCursor;


    static constexpr size_t   tftp_block_size        = 512;
    static constexpr size_t   tftp_header_size       = sizeof(uint16_t) + sizeof(uint16_t);
    static constexpr size_t   tftp_max_datagram_size = tftp_header_size + tftp_block_size;
    static constexpr uint16_t tftp_default_port      = 69;
    static constexpr const char* tftp_octet_mode     = "octet";


    /**
     * TFTP opcodes, the first two bytes of every packet.
     */
    enum opcode_t : uint16_t {
        op_rrq   = 1,
        op_wrq   = 2,
        op_data  = 3,
        op_ack   = 4,
        op_error = 5
    };


    /**
     * TFTP error codes as defined in RFC 1350.
     */
    enum class errcode_t : uint16_t {
        undefined           = 0,
        file_not_found      = 1,
        access_violation    = 2,
        disk_full           = 3,
        illegal_operation   = 4,
        unknown_transfer_id = 5,
        file_already_exists = 6,
        no_such_user        = 7
    };


    /**
     * Result of decoding a packet.
     */
    enum class decode_err_t {
        none = 0,         /**< The packet was decoded. */
        malformed_packet, /**< Wrong opcode, truncated packet, or invalid field. */
        unsupported_mode  /**< A request for another transfer mode than octet. */
    };


    /**
     * Byte buffer holding an encoded packet.
     */
    using buffer_t = std::vector<uint8_t>;


    /**
     * A read or write request.
     */
    struct request_t {
        opcode_t    op {op_rrq};
        std::string filename;
        std::string mode;

        bool operator== (const request_t& rhs) const {
            return op==rhs.op && filename==rhs.filename && mode==rhs.mode;
        }
    };

    /**
     * A data packet.
     * When decoded, <code>payload</code> points into the decoded
     * buffer and is only valid as long as that buffer is.
     */
    struct data_t {
        uint16_t       block {0};
        const uint8_t* payload {nullptr};
        size_t         size {0};
    };

    /**
     * An acknowledgment packet.
     */
    struct ack_t {
        uint16_t block {0};
    };

    /**
     * An error packet.
     */
    struct error_pkt_t {
        errcode_t   code {errcode_t::undefined};
        std::string message;
    };


    /**
     * Encode a request.
     * The opcode is taken from the request, a request that isn't
     * a write request is encoded as a read request.
     * An empty mode is encoded as "octet".
     * @return The size of the encoded packet.
     */
    size_t encode_request (const request_t& rq, buffer_t& buf);

    /**
     * Decode a read or write request.
     * The mode is converted to lowercase before it is checked.
     */
    decode_err_t decode_request (const void* buf, size_t size, request_t& rq);

    /**
     * Encode the next data block.
     * The block number is incremented before it is written, and
     * up to <code>tftp_block_size</code> bytes are read from the cursor.
     * Reaching the end of the payload is not an error, it
     * gives a short (possibly empty) final block.
     * @param block The block number of the previous block,
     *              updated to the number of the encoded block.
     * @param cursor The payload read position.
     * @param buf Set to the encoded packet.
     * @return The number of payload bytes in the block.
     */
    size_t encode_data (uint16_t& block, PayloadCursor& cursor, buffer_t& buf);

    /**
     * Decode a data packet. No payload bytes are copied.
     */
    decode_err_t decode_data (const void* buf, size_t size, data_t& dat);

    /**
     * Encode an acknowledgment.
     * @return The size of the encoded packet, always 4.
     */
    size_t encode_ack (uint16_t block, buffer_t& buf);

    decode_err_t decode_ack (const void* buf, size_t size, ack_t& ack);

    /**
     * Encode an error packet.
     * @return The size of the encoded packet.
     */
    size_t encode_error (errcode_t code, const std::string& message, buffer_t& buf);

    /**
     * Decode an error packet.
     * A message without a null terminator ends at the end of the buffer.
     */
    decode_err_t decode_error (const void* buf, size_t size, error_pkt_t& err);


    /**
     * A decoded TFTP packet of any kind.
     * Only the member selected by <code>opcode()</code> holds
     * a decoded value, the others are left default constructed.
     */
    class Packet {
    public:
        Packet ();

        /**
         * Decode a packet of any kind, selected by its leading opcode.
         * @param buf The received datagram.
         * @param size The size of the datagram.
         * @param pkt Set to the decoded packet. On failure
         *            it is left in an undefined state.
         * @return decode_err_t::none on success.
         */
        static decode_err_t decode (const void* buf, size_t size, Packet& pkt);

        /**
         * The kind of packet, or 0 if nothing is decoded.
         */
        uint16_t opcode () const {
            return op;
        }

        bool is_request () const {
            return op==op_rrq || op==op_wrq;
        }

        const request_t& request () const {
            return rq;
        }

        const data_t& data () const {
            return dat;
        }

        const ack_t& ack () const {
            return ack_;
        }

        const error_pkt_t& error () const {
            return err;
        }


    private:
        uint16_t  op;
        request_t rq;
        data_t    dat;
        ack_t     ack_;
        error_pkt_t   err;
    };


    const char* opcode_to_string (uint16_t op);
    const char* errcode_to_string (errcode_t code);
    const char* decode_err_to_string (decode_err_t err);


}


#endif
