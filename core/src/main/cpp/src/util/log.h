/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <sstream>
#include <string>
#include <type_traits>

#include <boost/thread/mutex.hpp>
#include <boost/thread/tss.hpp>

namespace dictstore {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // per-element decode tracing
        LOG_DEBUG,    // section layout while loading
        LOG_INFO,     // dictionaries opened and written
        LOG_WARNING,  // skipped files during scans
        LOG_ERROR,    // failures that are reported, then recovered from
        LOG_SEVERE
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Secondary sink that receives every formatted line, e.g. for tests
     * that want to inspect what was logged.
     */
    class Tee {
    public:
        virtual ~Tee() {}
        virtual void write(LogLevel level, const std::string& line) = 0;
    };

    /**
     * Per thread line buffer. A line is formatted and written to the log
     * file (stderr by default) and the tee when it is flushed.
     */
    class Logger {
    public:
        friend class LogManager;

        // nullptr restores stderr
        static void setLogFile(FILE* f);

        // nullptr removes the tee
        static void setTee(Tee* t);

        static Logger& get() {
            Logger* p = tsp.get();
            if (p == nullptr) {
                tsp.reset(p = new Logger());
            }
            return *p;
        }

        const std::string& threadName() const { return threadName_; }
        void setThreadName(const std::string& name) { threadName_ = name; }

        void begin(LogLevel l) {
            level_ = l;
            buf_.str("");
        }

        template<typename T>
        void append(const T& v) { buf_ << v; }

        void append(bool v) { buf_ << (v ? "true" : "false"); }

        void flush();

    private:
        Logger() : level_(LOG_INFO), threadName_("DICTSTORE") {}

        static boost::mutex sm;
        static FILE* logfile;
        static Tee* tee;
        static boost::thread_specific_ptr<Logger> tsp;

        std::ostringstream buf_;
        LogLevel level_;
        std::string threadName_;
    };

    extern std::atomic<int> logLevel;

    /**
     * One log statement. Holds no logger when the level is filtered out,
     * in which case every << is a no-op. Flushes when the statement ends.
     */
    class LogLine {
    public:
        explicit LogLine(Logger* logger) : logger_(logger) {}

        LogLine(LogLine&& other) noexcept : logger_(other.logger_) { other.logger_ = nullptr; }
        LogLine(const LogLine&) = delete;
        LogLine& operator=(const LogLine&) = delete;

        ~LogLine() {
            if (logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        LogLine& operator<<(const T& value) {
            if (logger_) {
                logger_->append(value);
            }
            return *this;
        }

    private:
        Logger* logger_;
    };

    inline LogLine log(LogLevel l) {
        if (l < logLevel.load(std::memory_order_relaxed)) {
            return LogLine(nullptr);
        }
        Logger& logger = Logger::get();
        logger.begin(l);
        return LogLine(&logger);
    }

    inline LogLine trace()   { return log(LOG_TRACE); }
    inline LogLine debug()   { return log(LOG_DEBUG); }
    inline LogLine info()    { return log(LOG_INFO); }
    inline LogLine warning() { return log(LOG_WARNING); }
    inline LogLine error()   { return log(LOG_ERROR); }
    inline LogLine severe()  { return log(LOG_SEVERE); }

    std::string errnoWithDescription(int x = errno);

    // Accepts level names in any case, plus WARN and FATAL. Returns false
    // and leaves the level alone for anything else.
    bool setLogLevelFromString(const std::string& level);

    // Applies LOG_LEVEL when it is set
    void initLoggingFromEnv();

}
