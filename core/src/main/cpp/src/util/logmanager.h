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

#include "log.h"

#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>

namespace dictstore {

    /**
     * Routes all log output to <logdir>/dictstore.log until destroyed.
     * Only one LogManager should be alive per process.
     */
    class LogManager {
    public:
        explicit LogManager(const std::string& logdir, bool append = true) : _append(append), _file(nullptr) {
            boost::filesystem::path dir(logdir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());
            }
            _path = (dir / "dictstore.log").string();
            if (boost::filesystem::is_directory(_path)) {
                throw std::runtime_error("log file [" + _path + "] is a directory");
            }
            open();
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        /**
         * Moves the current file aside as <path>.<utc time> and continues
         * in a fresh file at path().
         */
        void rotate() {
#ifdef POSIX_FADV_DONTNEED
            posix_fadvise(fileno(_file), 0, 0, POSIX_FADV_DONTNEED);
#endif
            std::string rotated = _path + "." + utcStamp();
            if (::rename(_path.c_str(), rotated.c_str()) != 0) {
                error() << "can't rotate " << _path << ": " << errnoWithDescription();
            }
            open();
        }

    private:
        static std::string utcStamp() {
            struct tm t;
            time_t now = time(nullptr);
            gmtime_r(&now, &t);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return buf;
        }

        void open() {
            FILE* f = fopen(_path.c_str(), _append ? "a" : "w");
            if (!f) {
                throw std::runtime_error("can't open log file " + _path + ": " + errnoWithDescription());
            }
            Logger::setLogFile(f); // no thread writes to the old file after this
            if (_file) {
                fclose(_file);
            }
            _file = f;
        }

        bool _append;
        std::string _path;
        FILE* _file;
    };
}
