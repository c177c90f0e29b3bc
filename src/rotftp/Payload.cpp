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
#include <rotftp/Log.hpp>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <openssl/evp.h>
#include <openssl/err.h>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Payload::Payload (const void* buf, size_t size)
        : bytes ((const uint8_t*)buf, (const uint8_t*)buf + size)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Payload::Payload (std::vector<uint8_t>&& b)
        : bytes (std::move(b))
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<const Payload> Payload::load (const std::string& filename)
    {
        if (filename.empty()) {
            errno = ENOENT;
            return nullptr;
        }

        int fd = open (filename.c_str(), O_RDONLY|O_CLOEXEC);
        if (fd < 0)
            return nullptr;

        // Only regular files are served
        struct stat sb;
        if (fstat(fd, &sb)) {
            auto errnum = errno;
            close (fd);
            errno = errnum;
            return nullptr;
        }
        if (!S_ISREG(sb.st_mode)) {
            close (fd);
            errno = S_ISDIR(sb.st_mode) ? EISDIR : EINVAL;
            return nullptr;
        }

        std::vector<uint8_t> buf;
        buf.reserve (sb.st_size);
        uint8_t chunk[4096];
        while (true) {
            auto result = ::read (fd, chunk, sizeof(chunk));
            if (result < 0) {
                if (errno == EINTR)
                    continue;
                auto errnum = errno;
                close (fd);
                errno = errnum;
                return nullptr;
            }
            if (result == 0)
                break;
            buf.insert (buf.end(), chunk, chunk+result);
        }
        close (fd);

        errno = 0;
        return std::make_shared<const Payload> (std::move(buf));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string Payload::sha256 () const
    {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;

        ERR_clear_error ();
        if (EVP_Digest(bytes.data(), bytes.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
            const char* err_str = ERR_reason_error_string (ERR_peek_last_error());
            Log::warning ("Unable to calculate SHA-256 digest: %s",
                          err_str ? err_str : "unknown error");
            return "";
        }

        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (unsigned i=0; i<md_len; ++i)
            ss << std::setw(2) << (unsigned)md[i];
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t PayloadCursor::read (void* buf, size_t size)
    {
        size_t n = remaining ();
        if (n > size)
            n = size;
        if (n) {
            memcpy (buf, p.data()+pos, n);
            pos += n;
        }
        return n;
    }


}
