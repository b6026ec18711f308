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

#include "data_io.h"
#include "../config.h"
#include "../dictstore_error.h"
#include "../util/endian.hpp"

#include <limits>

namespace dictstore {
namespace raf {

using namespace util;

DataReader::DataReader(const DataSource& source, uint64_t pos)
    : source_(source), pos_(pos), limit_(source.size()) {}

DataReader::DataReader(const DataSource& source, uint64_t pos, uint64_t limit)
    : source_(source), pos_(pos), limit_(limit < source.size() ? limit : source.size()) {}

void DataReader::seek(uint64_t pos) {
    if (pos > limit_) {
        throw corruption("Seek to " + std::to_string(pos) + " past end " +
                         std::to_string(limit_) + " of " + source_.name());
    }
    pos_ = pos;
}

const uint8_t* DataReader::take(size_t n) {
    if (pos_ > limit_ || n > limit_ - pos_) {
        throw corruption("Unexpected end of data in " + source_.name() + " reading " +
                         std::to_string(n) + " bytes at " + std::to_string(pos_));
    }
    const uint8_t* p = source_.data() + pos_;
    pos_ += n;
    return p;
}

int8_t DataReader::readInt8() {
    return static_cast<int8_t>(*take(1));
}

bool DataReader::readBool() {
    uint8_t b = *take(1);
    if (b > 1) {
        throw corruption("Invalid boolean byte " + std::to_string(b) + " at " +
                         std::to_string(pos_ - 1) + " in " + source_.name());
    }
    return b == 1;
}

int16_t DataReader::readInt16() {
    return load_be_i16(take(2));
}

int32_t DataReader::readInt32() {
    return load_be_i32(take(4));
}

int64_t DataReader::readInt64() {
    return load_be_i64(take(8));
}

std::string DataReader::readUTF() {
    uint16_t len = load_be16(take(2));
    const uint8_t* p = take(len);
    return std::string(reinterpret_cast<const char*>(p), len);
}

std::string DataReader::readLongUTF() {
    int32_t len = readInt32();
    if (len < 0) {
        throw corruption("Negative string length " + std::to_string(len) + " in " + source_.name());
    }
    const uint8_t* p = take(static_cast<size_t>(len));
    return std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
}

void DataWriter::writeInt8(int8_t v) {
    sink_.write(&v, 1);
}

void DataWriter::writeBool(bool v) {
    uint8_t b = v ? 1 : 0;
    sink_.write(&b, 1);
}

void DataWriter::writeInt16(int16_t v) {
    uint8_t buf[2];
    store_be_i16(buf, v);
    sink_.write(buf, sizeof(buf));
}

void DataWriter::writeInt32(int32_t v) {
    uint8_t buf[4];
    store_be_i32(buf, v);
    sink_.write(buf, sizeof(buf));
}

void DataWriter::writeInt64(int64_t v) {
    uint8_t buf[8];
    store_be_i64(buf, v);
    sink_.write(buf, sizeof(buf));
}

void DataWriter::writeUTF(const std::string& s) {
    if (s.size() > format::kMaxUtfBytes) {
        throw std::length_error("String of " + std::to_string(s.size()) +
                                " bytes exceeds the utf limit of 65535");
    }
    uint8_t buf[2];
    store_be16(buf, static_cast<uint16_t>(s.size()));
    sink_.write(buf, sizeof(buf));
    sink_.write(s.data(), s.size());
}

void DataWriter::writeLongUTF(const std::string& s) {
    if (s.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::length_error("String of " + std::to_string(s.size()) + " bytes is too long");
    }
    writeInt32(static_cast<int32_t>(s.size()));
    sink_.write(s.data(), s.size());
}

} // namespace raf
} // namespace dictstore
