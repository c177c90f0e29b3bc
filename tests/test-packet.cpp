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
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace rotftp;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static buffer_t make_raw (std::initializer_list<uint8_t> head, const std::string& tail="")
{
    buffer_t buf (head);
    buf.insert (buf.end(), tail.begin(), tail.end());
    return buf;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, RequestRoundTrip)
{
    request_t rq;
    rq.op = op_rrq;
    rq.filename = "boot/pxelinux.0";
    rq.mode = "octet";

    buffer_t buf;
    auto len = encode_request (rq, buf);
    EXPECT_EQ (len, buf.size());
    EXPECT_EQ (buf.size(), 2u + rq.filename.size() + 1 + 5 + 1);
    EXPECT_EQ (buf[0], 0);
    EXPECT_EQ (buf[1], op_rrq);

    request_t decoded;
    ASSERT_EQ (decode_request(buf.data(), buf.size(), decoded), decode_err_t::none);
    EXPECT_EQ (decoded, rq);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, WriteRequestRoundTrip)
{
    request_t rq;
    rq.op = op_wrq;
    rq.filename = "upload.bin";

    buffer_t buf;
    encode_request (rq, buf);
    EXPECT_EQ (buf[1], op_wrq);

    request_t decoded;
    ASSERT_EQ (decode_request(buf.data(), buf.size(), decoded), decode_err_t::none);
    EXPECT_EQ (decoded.op, op_wrq);
    EXPECT_EQ (decoded.filename, "upload.bin");
    EXPECT_EQ (decoded.mode, "octet");
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, RequestModeIsCaseInsensitive)
{
    auto buf = make_raw ({0, 1}, std::string("file\0OcTeT\0", 11));
    request_t rq;
    ASSERT_EQ (decode_request(buf.data(), buf.size(), rq), decode_err_t::none);
    EXPECT_EQ (rq.mode, "octet");
    EXPECT_EQ (rq.filename, "file");
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, RequestUnsupportedMode)
{
    request_t rq;
    auto netascii = make_raw ({0, 1}, std::string("file\0netascii\0", 14));
    EXPECT_EQ (decode_request(netascii.data(), netascii.size(), rq), decode_err_t::unsupported_mode);

    auto mail = make_raw ({0, 1}, std::string("file\0mail\0", 10));
    EXPECT_EQ (decode_request(mail.data(), mail.size(), rq), decode_err_t::unsupported_mode);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, RequestMalformed)
{
    request_t rq;

    // Too short
    auto garbage = make_raw ({0xff, 0xfe, 0xfd});
    EXPECT_EQ (decode_request(garbage.data(), garbage.size(), rq), decode_err_t::malformed_packet);

    // Not a request opcode
    auto ack = make_raw ({0, 4}, std::string("file\0octet\0", 11));
    EXPECT_EQ (decode_request(ack.data(), ack.size(), rq), decode_err_t::malformed_packet);

    // Empty filename
    auto no_name = make_raw ({0, 1}, std::string("\0octet\0", 7));
    EXPECT_EQ (decode_request(no_name.data(), no_name.size(), rq), decode_err_t::malformed_packet);

    // Unterminated filename
    auto unterm_name = make_raw ({0, 1}, "file");
    EXPECT_EQ (decode_request(unterm_name.data(), unterm_name.size(), rq), decode_err_t::malformed_packet);

    // Unterminated mode
    auto unterm_mode = make_raw ({0, 1}, std::string("file\0octet", 10));
    EXPECT_EQ (decode_request(unterm_mode.data(), unterm_mode.size(), rq), decode_err_t::malformed_packet);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, DataBlocks)
{
    std::vector<uint8_t> bytes (600);
    for (size_t i=0; i<bytes.size(); ++i)
        bytes[i] = (uint8_t) i;
    Payload payload (bytes.data(), bytes.size());
    PayloadCursor cursor (payload);

    uint16_t block = 0;
    buffer_t buf;

    EXPECT_EQ (encode_data(block, cursor, buf), 512u);
    EXPECT_EQ (block, 1);
    ASSERT_EQ (buf.size(), tftp_max_datagram_size);

    data_t dat;
    ASSERT_EQ (decode_data(buf.data(), buf.size(), dat), decode_err_t::none);
    EXPECT_EQ (dat.block, 1);
    EXPECT_EQ (dat.size, 512u);
    EXPECT_EQ (dat.payload[0], 0);
    EXPECT_EQ (dat.payload[511], (uint8_t)511);

    EXPECT_EQ (encode_data(block, cursor, buf), 88u);
    EXPECT_EQ (block, 2);
    ASSERT_EQ (decode_data(buf.data(), buf.size(), dat), decode_err_t::none);
    EXPECT_EQ (dat.block, 2);
    EXPECT_EQ (dat.size, 88u);
    EXPECT_EQ (dat.payload[0], (uint8_t)512);
    EXPECT_EQ (cursor.remaining(), 0u);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, EmptyDataBlock)
{
    Payload payload (nullptr, 0);
    PayloadCursor cursor (payload);
    uint16_t block = 0;
    buffer_t buf;

    EXPECT_EQ (encode_data(block, cursor, buf), 0u);
    EXPECT_EQ (block, 1);
    EXPECT_EQ (buf, make_raw({0, 3, 0, 1}));
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, BlockNumberWrapsAround)
{
    std::vector<uint8_t> bytes (3 * tftp_block_size);
    Payload payload (bytes.data(), bytes.size());
    PayloadCursor cursor (payload);
    uint16_t block = 65534;
    buffer_t buf;
    data_t dat;

    encode_data (block, cursor, buf);
    EXPECT_EQ (block, 65535);
    ASSERT_EQ (decode_data(buf.data(), buf.size(), dat), decode_err_t::none);
    EXPECT_EQ (dat.block, 65535);

    encode_data (block, cursor, buf);
    EXPECT_EQ (block, 0);
    ASSERT_EQ (decode_data(buf.data(), buf.size(), dat), decode_err_t::none);
    EXPECT_EQ (dat.block, 0);
    EXPECT_EQ (buf[2], 0);
    EXPECT_EQ (buf[3], 0);

    encode_data (block, cursor, buf);
    EXPECT_EQ (block, 1);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, Ack)
{
    buffer_t buf;
    EXPECT_EQ (encode_ack(0x1234, buf), 4u);
    EXPECT_EQ (buf, make_raw({0, 4, 0x12, 0x34}));

    ack_t ack;
    ASSERT_EQ (decode_ack(buf.data(), buf.size(), ack), decode_err_t::none);
    EXPECT_EQ (ack.block, 0x1234);

    auto truncated = make_raw ({0, 4, 0});
    EXPECT_EQ (decode_ack(truncated.data(), truncated.size(), ack), decode_err_t::malformed_packet);

    auto not_ack = make_raw ({0, 3, 0, 1});
    EXPECT_EQ (decode_ack(not_ack.data(), not_ack.size(), ack), decode_err_t::malformed_packet);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, Error)
{
    buffer_t buf;
    encode_error (errcode_t::illegal_operation, "", buf);
    EXPECT_EQ (buf, make_raw({0, 5, 0, 4, 0}));

    encode_error (errcode_t::access_violation, "Write not supported", buf);
    error_pkt_t err;
    ASSERT_EQ (decode_error(buf.data(), buf.size(), err), decode_err_t::none);
    EXPECT_EQ (err.code, errcode_t::access_violation);
    EXPECT_EQ (err.message, "Write not supported");

    // A missing terminator is tolerated
    auto unterminated = make_raw ({0, 5, 0, 1}, "gone");
    ASSERT_EQ (decode_error(unterminated.data(), unterminated.size(), err), decode_err_t::none);
    EXPECT_EQ (err.code, errcode_t::file_not_found);
    EXPECT_EQ (err.message, "gone");
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, ErrorMessageIsTruncated)
{
    buffer_t buf;
    encode_error (errcode_t::undefined, std::string(2000, 'x'), buf);
    EXPECT_LE (buf.size(), tftp_max_datagram_size);
    EXPECT_EQ (buf.back(), 0);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, DecodeDispatch)
{
    Packet pkt;
    EXPECT_EQ (pkt.opcode(), 0);

    auto ack = make_raw ({0, 4, 0, 7});
    ASSERT_EQ (Packet::decode(ack.data(), ack.size(), pkt), decode_err_t::none);
    EXPECT_EQ (pkt.opcode(), op_ack);
    EXPECT_FALSE (pkt.is_request());
    EXPECT_EQ (pkt.ack().block, 7);

    auto rrq = make_raw ({0, 1}, std::string("a\0octet\0", 8));
    ASSERT_EQ (Packet::decode(rrq.data(), rrq.size(), pkt), decode_err_t::none);
    EXPECT_EQ (pkt.opcode(), op_rrq);
    EXPECT_TRUE (pkt.is_request());
    EXPECT_EQ (pkt.request().filename, "a");

    auto err = make_raw ({0, 5, 0, 2}, std::string("denied\0", 7));
    ASSERT_EQ (Packet::decode(err.data(), err.size(), pkt), decode_err_t::none);
    EXPECT_EQ (pkt.opcode(), op_error);
    EXPECT_EQ (pkt.error().code, errcode_t::access_violation);
    EXPECT_EQ (pkt.error().message, "denied");

    auto bad_op = make_raw ({0, 9, 0, 0});
    EXPECT_EQ (Packet::decode(bad_op.data(), bad_op.size(), pkt), decode_err_t::malformed_packet);
    EXPECT_EQ (pkt.opcode(), 0);

    auto one_byte = make_raw ({0});
    EXPECT_EQ (Packet::decode(one_byte.data(), one_byte.size(), pkt), decode_err_t::malformed_packet);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Packet, Names)
{
    EXPECT_STREQ (opcode_to_string(op_rrq), "RRQ");
    EXPECT_STREQ (opcode_to_string(op_error), "ERROR");
    EXPECT_STREQ (opcode_to_string(42), "n/a");
    EXPECT_STREQ (errcode_to_string(errcode_t::undefined), "Not defined");
    EXPECT_STREQ (errcode_to_string(errcode_t::access_violation), "Access violation");
    EXPECT_STREQ (errcode_to_string(errcode_t::illegal_operation), "Illegal TFTP operation");
    EXPECT_STREQ (errcode_to_string(static_cast<errcode_t>(99)), "Unknown error code");
}
