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

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "data_source.h"

namespace dictstore {
namespace raf {

/**
 * Seekable byte sink a dictionary is written to. Writing past the current
 * end grows the sink; seeking backwards lets a writer patch a table it
 * reserved earlier.
 */
class DataSink {
public:
    virtual ~DataSink() = default;

    virtual void write(const void* data, size_t len) = 0;
    virtual uint64_t position() const = 0;
    virtual void seek(uint64_t pos) = 0;
    virtual uint64_t size() const = 0;
};

class MemorySink : public DataSink {
public:
    MemorySink() : pos_(0) {}

    void write(const void* data, size_t len) override;
    uint64_t position() const override { return pos_; }
    void seek(uint64_t pos) override;
    uint64_t size() const override { return bytes_.size(); }

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    // Snapshot of everything written so far as a readable source
    std::shared_ptr<MemorySource> toSource() const {
        return std::make_shared<MemorySource>(bytes_);
    }

private:
    std::vector<uint8_t> bytes_;
    uint64_t pos_;
};

/**
 * Writes to a file through a POSIX descriptor. The file is created or
 * truncated on construction and closed on destruction.
 *
 * Sequential writes are gathered in a buffer of files::kWriteBufferSize
 * bytes; seek(), close() and a full buffer write it out.
 */
class FileSink : public DataSink {
public:
    /**
     * @throws DictionaryError(IO) if the file cannot be created
     */
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const void* data, size_t len) override;
    uint64_t position() const override { return pos_; }
    void seek(uint64_t pos) override;
    uint64_t size() const override { return size_; }

    // fdatasync then close; errors are reported, unlike the destructor
    void close();

    const std::string& path() const { return path_; }

    // number of pwrite batches issued so far
    uint64_t flushCount() const { return flushes_; }

private:
    void flushBuffer();

    std::string path_;
    int fd_;
    uint64_t pos_;
    uint64_t size_;

    std::vector<uint8_t> buffer_;
    uint64_t bufferStart_;      // file offset of buffer_[0]
    uint64_t flushes_;
};

} // namespace raf
} // namespace dictstore
