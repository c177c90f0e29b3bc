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
#include <rotftp/SocketConnection.hpp>
#include <rotftp/IpAddr.hpp>
#include <gtest/gtest.h>
#include <string>
#include <cerrno>
#include <sys/un.h>

using namespace rotftp;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void open_loopback (SocketConnection& sock)
{
    ASSERT_EQ (sock.open(AF_INET, SOCK_DGRAM), 0);
    ASSERT_EQ (sock.bind(IpAddr("127.0.0.1", 0)), 0);
    ASSERT_NE (sock.addr().port(), 0);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (SocketConnection, OpenOnlyIpFamilies)
{
    SocketConnection sock;
    EXPECT_FALSE (sock.is_open());
    EXPECT_EQ (sock.open(AF_UNIX, SOCK_DGRAM), -1);
    EXPECT_EQ (errno, EAFNOSUPPORT);
    EXPECT_FALSE (sock.is_open());

    ASSERT_EQ (sock.open(AF_INET6, SOCK_DGRAM), 0);
    EXPECT_TRUE (sock.is_open());
    EXPECT_EQ (sock.addr().family(), AF_INET6);

    // Address family must match the socket
    EXPECT_EQ (sock.bind(IpAddr("127.0.0.1", 0)), -1);
    EXPECT_EQ (errno, EINVAL);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (SocketConnection, NotConnected)
{
    SocketConnection sock;
    open_loopback (sock);
    EXPECT_FALSE (sock.is_connected());

    char buf[8];
    EXPECT_EQ (sock.read(buf, sizeof(buf), 10), -1);
    EXPECT_EQ (errno, ENOTCONN);
    EXPECT_EQ (sock.write("x", 1), -1);
    EXPECT_EQ (errno, ENOTCONN);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (SocketConnection, ConnectedExchange)
{
    SocketConnection a;
    SocketConnection b;
    open_loopback (a);
    open_loopback (b);

    ASSERT_EQ (a.connect(b.addr()), 0);
    EXPECT_TRUE (a.is_connected());
    EXPECT_TRUE (a.peer() == b.addr());

    ASSERT_EQ (a.write("ping", 4), 4);

    char buf[16];
    IpAddr from;
    ASSERT_EQ (b.recvfrom(buf, sizeof(buf), from, 1000), 4);
    EXPECT_EQ (std::string(buf, 4), "ping");
    EXPECT_TRUE (from == a.addr());

    ASSERT_EQ (b.sendto("pong", 4, from), 4);
    ASSERT_EQ (a.read(buf, sizeof(buf), 1000), 4);
    EXPECT_EQ (std::string(buf, 4), "pong");
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (SocketConnection, ReadTimeout)
{
    SocketConnection a;
    SocketConnection b;
    open_loopback (a);
    open_loopback (b);
    ASSERT_EQ (a.connect(b.addr()), 0);

    char buf[8];
    EXPECT_EQ (a.read(buf, sizeof(buf), 50), -1);
    EXPECT_EQ (errno, ETIMEDOUT);

    IpAddr from;
    EXPECT_EQ (b.recvfrom(buf, sizeof(buf), from, 50), -1);
    EXPECT_EQ (errno, ETIMEDOUT);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (SocketConnection, Close)
{
    SocketConnection a;
    SocketConnection b;
    open_loopback (a);
    open_loopback (b);
    ASSERT_EQ (a.connect(b.addr()), 0);

    a.close ();
    EXPECT_FALSE (a.is_open());
    EXPECT_FALSE (a.is_connected());

    char buf[8];
    EXPECT_EQ (a.read(buf, sizeof(buf), 10), -1);
    EXPECT_EQ (errno, EBADF);

    // Closing twice has no effect
    a.close ();
    EXPECT_FALSE (a.is_open());
}
