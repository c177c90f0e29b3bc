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
#include <rotftp/Log.hpp>
#include <iostream>
#include <vector>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <syscall.h>


namespace rotftp {


    std::mutex       Log::log_mutex;
    std::atomic_uint Log::prio_level {default_prio_level};
    log_callback_t   Log::cb         {default_log_callback};

    static constexpr size_t buf_block_size = 128;


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Log::set_callback (log_callback_t callback)
    {
        std::lock_guard<std::mutex> lock (log_mutex);
        cb = callback;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void Log::log (unsigned int priority, const char* format, va_list& args)
    {
        static std::vector<char> buf (buf_block_size);

        std::lock_guard<std::mutex> lock (log_mutex);
        if (!cb || !format)
            return;

        int    result;
        size_t buf_size;
        do {
            va_list tmp_args;
            va_copy (tmp_args, args);
            buf_size = buf.size ();
            result = vsnprintf (buf.data(), buf_size, format, tmp_args);
            va_end (tmp_args);

            if (result < 0) {
                snprintf (buf.data(), buf_size, "<invalid log message>");
                break;
            }
            else if ((unsigned)result >= buf_size) {
                // Grow the buffer in whole blocks
                buf.resize ((result+buf_block_size) -
                            ((result+buf_block_size) % buf_block_size));
            }
        }while ((unsigned)result >= buf_size);

        cb (priority, buf.data());
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* log_priority_to_string (unsigned int priority)
    {
        switch (priority) {
        case LOG_EMERG:
            return "EMERG";
        case LOG_ALERT:
            return "ALERT";
        case LOG_CRIT:
            return "CRIT";
        case LOG_ERR:
            return "ERROR";
        case LOG_WARNING:
            return "WARNING";
        case LOG_NOTICE:
            return "NOTICE";
        case LOG_INFO:
            return "INFO";
        case LOG_DEBUG:
            return "DEBUG";
        default:
            return "n/a";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void default_log_callback (unsigned int priority, const char* message)
    {
        syslog (static_cast<int>(priority), "%s", message);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void stdout_log_callback (unsigned int priority, const char* message)
    {
        std::cout << '[' << (unsigned)syscall(SYS_gettid) << "] "
                  << log_priority_to_string(priority) << ": "
                  << message << std::endl;
    }


}
