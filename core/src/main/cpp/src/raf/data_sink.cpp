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

#include "data_sink.h"
#include "../dictstore_error.h"
#include "../config.h"
#include "../util/log.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace dictstore {
namespace raf {

void MemorySink::write(const void* data, size_t len) {
    if (pos_ + len > bytes_.size()) {
        bytes_.resize(pos_ + len);
    }
    if (len > 0) {
        std::memcpy(bytes_.data() + pos_, data, len);
    }
    pos_ += len;
}

void MemorySink::seek(uint64_t pos) {
    if (pos > bytes_.size()) {
        bytes_.resize(pos);
    }
    pos_ = pos;
}

FileSink::FileSink(const std::string& path)
    : path_(path), fd_(-1), pos_(0), size_(0), bufferStart_(0), flushes_(0) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw ioError("Failed to create file: " + path + ": " + std::strerror(errno));
    }
    buffer_.reserve(files::kWriteBufferSize);
}

FileSink::~FileSink() {
    if (fd_ < 0) {
        return;
    }
    try {
        flushBuffer();
    } catch (const DictionaryError& e) {
        error() << e.what();
    }
    if (::close(fd_) != 0) {
        error() << "Failed to close " << path_ << ": " << errnoWithDescription();
    }
    fd_ = -1;
}

void FileSink::flushBuffer() {
    const uint8_t* p = buffer_.data();
    size_t len = buffer_.size();
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd_, p + done, len - done, off_t(bufferStart_ + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ioError("Failed to write " + path_ + ": " + std::strerror(errno));
        }
        done += static_cast<size_t>(n);
    }
    if (len > 0) {
        ++flushes_;
    }
    buffer_.clear();
}

void FileSink::write(const void* data, size_t len) {
    if (fd_ < 0) {
        throw std::logic_error("write to closed FileSink: " + path_);
    }
    if (buffer_.empty()) {
        bufferStart_ = pos_;
    }
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), p, p + len);
    if (buffer_.size() >= files::kWriteBufferSize) {
        flushBuffer();
    }
    pos_ += len;
    if (pos_ > size_) size_ = pos_;
}

void FileSink::seek(uint64_t pos) {
    if (fd_ >= 0) {
        flushBuffer();
    }
    pos_ = pos;
}

void FileSink::close() {
    if (fd_ < 0) {
        return;
    }
    try {
        flushBuffer();
    } catch (const DictionaryError&) {
        if (::close(fd_) != 0) {
            error() << "Failed to close " << path_ << ": " << errnoWithDescription();
        }
        fd_ = -1;
        throw;
    }
    FSResult res = PlatformFS::flush_file(fd_);
    int rc = ::close(fd_);
    int close_err = errno;
    fd_ = -1;
    if (!res.ok) {
        throw ioError("Failed to sync " + path_ + ": " + std::strerror(res.err));
    }
    if (rc != 0) {
        throw ioError("Failed to close " + path_ + ": " + std::strerror(close_err));
    }
}

} // namespace raf
} // namespace dictstore
