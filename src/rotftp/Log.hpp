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
#ifndef ROTFTP_LOG_HPP
#define ROTFTP_LOG_HPP

#include <functional>
#include <atomic>
#include <string>
#include <mutex>
#include <cstdarg>
#include <syslog.h>


namespace rotftp {


    /**
     * Callback for log messages.
     * Called whenever a message is logged with a method in class Log.
     *
     * <b>NOTE:</b> Do not call Log::set_callback from inside
     *              the callback since it will cause a deadlock!
     *
     * @param priority A syslog priority, LOG_EMERG .. LOG_DEBUG.
     * @param message A null terminated string containing the log message.
     */
    using log_callback_t = std::function<void (unsigned int priority,
                                               const char* message)>;


    /**
     * The default log callback.
     * Sends the message to the system logger using <code>syslog()</code>.
     * <code>openlog()</code> is not called, the daemon does that
     * before the first message is logged.
     */
    void default_log_callback (unsigned int priority, const char* message);


    /**
     * Log callback writing to standard output.
     * Each line is prefixed with the thread id of the caller and
     * the name of the priority level.
     */
    void stdout_log_callback (unsigned int priority, const char* message);


    /**
     * Return a printable name of a syslog priority.
     */
    const char* log_priority_to_string (unsigned int priority);


    /**
     * Process wide logging.
     * Messages are logged with the same priority values used by syslog.
     * Messages with a priority lower than the current
     * threshold are dropped before they are formatted.
     *
     * All methods are static and the constructor is
     * deleted to prevent instantiation of this class.
     */
    class Log {
    public:
        static constexpr unsigned int default_prio_level = LOG_INFO;

        Log () = delete;

        /**
         * Get the current log priority threshold.
         */
        static unsigned int priority () {
            return prio_level;
        }

        /**
         * Set a new log priority threshold.
         * @param priority_threshold LOG_EMERG .. LOG_DEBUG.
         */
        static void priority (unsigned int priority_threshold) {
            prio_level = priority_threshold;
        }

        /**
         * Log a message with priority LOG_ERR.
         * @param format A <code>printf</code>-style format string.
         */
        static void error (const char* format, ...) {
            if (prio_level >= LOG_ERR) {
                va_list args;
                va_start (args, format);
                log (LOG_ERR, format, args);
                va_end (args);
            }
        }

        /**
         * Log a message with priority LOG_WARNING.
         * @param format A <code>printf</code>-style format string.
         */
        static void warning (const char* format, ...) {
            if (prio_level >= LOG_WARNING) {
                va_list args;
                va_start (args, format);
                log (LOG_WARNING, format, args);
                va_end (args);
            }
        }

        /**
         * Log a message with priority LOG_NOTICE.
         * @param format A <code>printf</code>-style format string.
         */
        static void notice (const char* format, ...) {
            if (prio_level >= LOG_NOTICE) {
                va_list args;
                va_start (args, format);
                log (LOG_NOTICE, format, args);
                va_end (args);
            }
        }

        /**
         * Log a message with priority LOG_INFO.
         * @param format A <code>printf</code>-style format string.
         */
        static void info (const char* format, ...) {
            if (prio_level >= LOG_INFO) {
                va_list args;
                va_start (args, format);
                log (LOG_INFO, format, args);
                va_end (args);
            }
        }

        /**
         * Log a message with priority LOG_DEBUG.
         * @param format A <code>printf</code>-style format string.
         */
        static void debug (const char* format, ...) {
            if (prio_level >= LOG_DEBUG) {
                va_list args;
                va_start (args, format);
                log (LOG_DEBUG, format, args);
                va_end (args);
            }
        }

        /**
         * Set the callback that receives formatted log messages.
         * @param callback The new log sink. If <code>nullptr</code>,
         *                 nothing is logged.
         */
        static void set_callback (log_callback_t callback);


    private:
        static void log (unsigned int priority, const char* format, va_list& args);

        static std::mutex log_mutex;
        static std::atomic_uint prio_level;
        static log_callback_t cb;
    };

}
#endif
