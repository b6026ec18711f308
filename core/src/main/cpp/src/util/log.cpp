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

#include "log.h"
#include "logmanager.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sys/time.h>

namespace dictstore {

    std::atomic<int> logLevel{LOG_WARNING};
    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    Tee* Logger::tee = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    namespace {
        struct LevelName {
            const char* name;
            LogLevel level;
        };

        const LevelName kLevelNames[] = {
            {"TRACE", LOG_TRACE},
            {"DEBUG", LOG_DEBUG},
            {"INFO", LOG_INFO},
            {"WARNING", LOG_WARNING},
            {"WARN", LOG_WARNING},
            {"ERROR", LOG_ERROR},
            {"SEVERE", LOG_SEVERE},
            {"FATAL", LOG_SEVERE},
        };

        // 2026-01-31T12:00:00.123
        std::string timestamp() {
            struct timeval tv;
            gettimeofday(&tv, nullptr);
            struct tm t;
            localtime_r(&tv.tv_sec, &t);
            char buf[40];
            size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &t);
            snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(tv.tv_usec / 1000));
            return buf;
        }
    }

    const char* logLevelToString(LogLevel l) {
        switch (l) {
        case LOG_TRACE:   return "TRACE";
        case LOG_DEBUG:   return "DEBUG";
        case LOG_INFO:    return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR:   return "ERROR";
        case LOG_SEVERE:  return "SEVERE";
        }
        return "UNKNOWN";
    }

    void Logger::flush() {
        std::string msg = buf_.str();
        buf_.str("");

        std::string line = timestamp();
        line += " [";
        line += threadName_;
        line += "] [";
        line += logLevelToString(level_);
        line += "] ";
        line += msg;
        if (line.back() != '\n') {
            line += '\n';
        }

        boost::mutex::scoped_lock lk(sm);
        if (tee) {
            tee->write(level_, line);
        }
        FILE* f = logfile ? logfile : stderr;
        if (fputs(line.c_str(), f) < 0) {
            std::cerr << "Failed to write to logfile: " << errnoWithDescription() << ": " << line;
            return;
        }
        fflush(f);
    }

    void Logger::setLogFile(FILE* f) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }

    void Logger::setTee(Tee* t) {
        boost::mutex::scoped_lock lk(sm);
        tee = t;
    }

    std::string errnoWithDescription(int x) {
        std::ostringstream s;
        s << "errno:" << x << ' ' << std::strerror(x);
        return s.str();
    }

    bool setLogLevelFromString(const std::string& level) {
        std::string upper;
        for (char c : level) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        for (const LevelName& ln : kLevelNames) {
            if (upper == ln.name) {
                logLevel.store(ln.level, std::memory_order_relaxed);
                return true;
            }
        }
        return false;
    }

    void initLoggingFromEnv() {
        const char* env = std::getenv("LOG_LEVEL");
        if (env && !setLogLevelFromString(env)) {
            std::cerr << "Warning: Invalid LOG_LEVEL '" << env
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }
}
