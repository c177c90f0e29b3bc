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
#include <rotftp/Payload.hpp>
#include <gtest/gtest.h>
#include <string>
#include <fstream>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>

using namespace rotftp;


//------------------------------------------------------------------------------
// Create a temporary file with the given content.
//------------------------------------------------------------------------------
static std::string make_temp_file (const std::string& content)
{
    char name[] = "/tmp/rotftp-payload-XXXXXX";
    int fd = mkstemp (name);
    if (fd < 0)
        return "";
    if (!content.empty())
        EXPECT_EQ (write(fd, content.data(), content.size()), (ssize_t)content.size());
    close (fd);
    return name;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Payload, LoadFile)
{
    std::string content (1500, 'a');
    content += "tail";
    auto filename = make_temp_file (content);
    ASSERT_FALSE (filename.empty());

    auto payload = Payload::load (filename);
    unlink (filename.c_str());
    ASSERT_TRUE (payload != nullptr);
    ASSERT_EQ (payload->size(), content.size());
    EXPECT_EQ (std::string((const char*)payload->data(), payload->size()), content);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Payload, LoadEmptyFile)
{
    auto filename = make_temp_file ("");
    ASSERT_FALSE (filename.empty());

    auto payload = Payload::load (filename);
    unlink (filename.c_str());
    ASSERT_TRUE (payload != nullptr);
    EXPECT_EQ (payload->size(), 0u);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Payload, LoadFailures)
{
    errno = 0;
    EXPECT_TRUE (Payload::load("/nonexistent/rotftp/file") == nullptr);
    EXPECT_EQ (errno, ENOENT);

    errno = 0;
    EXPECT_TRUE (Payload::load("") == nullptr);
    EXPECT_EQ (errno, ENOENT);

    errno = 0;
    EXPECT_TRUE (Payload::load("/tmp") == nullptr);
    EXPECT_EQ (errno, EISDIR);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Payload, Sha256)
{
    Payload empty (nullptr, 0);
    EXPECT_EQ (empty.sha256(),
               "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Payload abc ("abc", 3);
    EXPECT_EQ (abc.sha256(),
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
TEST (Payload, Cursor)
{
    Payload payload ("0123456789", 10);
    PayloadCursor cursor (payload);
    char buf[8];

    EXPECT_EQ (cursor.remaining(), 10u);
    EXPECT_EQ (cursor.read(buf, 4), 4u);
    EXPECT_EQ (std::string(buf, 4), "0123");
    EXPECT_EQ (cursor.position(), 4u);

    EXPECT_EQ (cursor.read(buf, sizeof(buf)), 6u);
    EXPECT_EQ (std::string(buf, 6), "456789");
    EXPECT_EQ (cursor.remaining(), 0u);

    EXPECT_EQ (cursor.read(buf, sizeof(buf)), 0u);
    EXPECT_EQ (cursor.position(), 10u);
}
