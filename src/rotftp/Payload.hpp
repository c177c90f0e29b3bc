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
#ifndef ROTFTP_PAYLOAD_HPP
#define ROTFTP_PAYLOAD_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * The file served to every client.
     * A payload is loaded once and is never modified after that,
     * so any number of threads may read it at the same time.
     * Sessions hold it through a <code>std::shared_ptr<const Payload></code>.
     */
    class Payload {
    public:
        /**
         * Create a payload from a copy of a byte buffer.
         */
        Payload (const void* buf, size_t size);

        /**
         * Create a payload by taking over a byte vector.
         */
        explicit Payload (std::vector<uint8_t>&& bytes);

        /**
         * Load a payload from a regular file.
         * @param filename The file to read.
         * @return A payload, or <code>nullptr</code> on failure
         *         with <code>errno</code> set.
         */
        static std::shared_ptr<const Payload> load (const std::string& filename);

        const uint8_t* data () const {
            return bytes.data ();
        }

        size_t size () const {
            return bytes.size ();
        }

        /**
         * Return the SHA-256 digest of the payload as a lowercase
         * hexadecimal string, or an empty string if OpenSSL failed.
         */
        std::string sha256 () const;


    private:
        std::vector<uint8_t> bytes;
    };


    /**
     * Sequential read position in a payload.
     * Each transfer session owns its own cursor.
     */
    class PayloadCursor {
    public:
        explicit PayloadCursor (const Payload& payload)
            : p {payload},
              pos {0}
        {
        }

        /**
         * Copy up to <code>size</code> bytes from the current
         * position and advance past them.
         * @return The number of bytes copied, 0 at the end of the payload.
         */
        size_t read (void* buf, size_t size);

        /**
         * Return the number of bytes not yet read.
         */
        size_t remaining () const {
            return p.size() - pos;
        }

        size_t position () const {
            return pos;
        }


    private:
        const Payload& p;
        size_t pos;
    };


}


#endif
