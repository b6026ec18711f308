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
#include <string>

#include "data_source.h"
#include "data_sink.h"

namespace dictstore {
namespace raf {

/**
 * Cursor over a DataSource that decodes the wire primitives.
 *
 * A reader may be bounded by a limit below the source size; reading at or
 * past the limit is a format fault (DictionaryError CORRUPTION), never an
 * out of bounds memory access.
 */
class DataReader {
public:
    DataReader(const DataSource& source, uint64_t pos);
    DataReader(const DataSource& source, uint64_t pos, uint64_t limit);

    uint64_t position() const { return pos_; }
    uint64_t limit() const { return limit_; }
    uint64_t remaining() const { return pos_ < limit_ ? limit_ - pos_ : 0; }
    const DataSource& source() const { return source_; }

    void seek(uint64_t pos);

    int8_t readInt8();
    bool readBool();
    int16_t readInt16();
    int32_t readInt32();
    int64_t readInt64();

    // u16 length prefixed UTF-8
    std::string readUTF();
    // i32 length prefixed UTF-8, for payloads that may exceed 64KB
    std::string readLongUTF();

private:
    const uint8_t* take(size_t n);

    const DataSource& source_;
    uint64_t pos_;
    uint64_t limit_;
};

/**
 * Encodes the wire primitives onto a DataSink.
 */
class DataWriter {
public:
    explicit DataWriter(DataSink& sink) : sink_(sink) {}

    uint64_t position() const { return sink_.position(); }
    void seek(uint64_t pos) { sink_.seek(pos); }
    DataSink& sink() { return sink_; }

    void writeInt8(int8_t v);
    void writeBool(bool v);
    void writeInt16(int16_t v);
    void writeInt32(int32_t v);
    void writeInt64(int64_t v);

    // @throws std::length_error if s is longer than 65535 bytes
    void writeUTF(const std::string& s);
    void writeLongUTF(const std::string& s);

private:
    DataSink& sink_;
};

} // namespace raf
} // namespace dictstore
