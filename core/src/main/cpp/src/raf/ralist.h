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
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "data_io.h"
#include "random_access_list.h"
#include "../config.h"
#include "../dictstore_error.h"
#include "../util/endian.hpp"
#include "../util/log.h"

namespace dictstore {
namespace raf {

/**
 * Encodes and decodes one element type of an RAList.
 *
 * read() receives the position of the element within its list so records
 * that need to know their own position (html entries) can keep it.
 */
template<typename T>
class ListSerializer {
public:
    virtual ~ListSerializer() = default;

    virtual T read(DataReader& in, int32_t index) const = 0;
    virtual void write(DataWriter& out, const T& t) const = 0;
};

/**
 * Random access, file backed list.
 *
 * Section layout:
 *
 *   int32            count
 *   int64[count + 1] absolute offset of each element, the last entry
 *                    being the offset just past the section
 *   bytes            the elements, concatenated in order
 *
 * attach() reads the count and the section end only; element i is decoded
 * on demand from table[i] and may not read past table[i + 1]. Nothing is
 * cached here, wrap the list in a CachingList for that.
 */
template<typename T>
class RAList : public RandomAccessList<T> {
public:
    typedef std::shared_ptr<const ListSerializer<T>> SerializerPtr;

    /**
     * Attaches to a section previously produced by write().
     * @throws DictionaryError(CORRUPTION) if the header or table does not
     *         fit the source
     */
    static std::shared_ptr<RAList<T>> attach(std::shared_ptr<const DataSource> source,
                                             SerializerPtr serializer,
                                             uint64_t startOffset) {
        DataReader in(*source, startOffset);
        int32_t count = in.readInt32();
        if (count < 0) {
            throw corruption("Negative list size " + std::to_string(count) + " at offset " +
                             std::to_string(startOffset) + " in " + source->name());
        }

        const uint64_t tableOffset = in.position();
        const uint64_t tableEnd = tableOffset + (static_cast<uint64_t>(count) + 1) * format::kOffsetWidth;
        if (tableEnd > source->size()) {
            throw corruption("Offset table of " + std::to_string(count) + " entries at " +
                             std::to_string(tableOffset) + " runs past end of " + source->name());
        }

        in.seek(tableOffset + static_cast<uint64_t>(count) * format::kOffsetWidth);
        int64_t end = in.readInt64();
        if (end < 0 || static_cast<uint64_t>(end) < tableEnd ||
            static_cast<uint64_t>(end) > source->size()) {
            throw corruption("List end offset " + std::to_string(end) + " inconsistent with " +
                             source->name() + " of size " + std::to_string(source->size()));
        }

        if (count > 0) {
            in.seek(tableOffset);
            int64_t first = in.readInt64();
            if (first < 0 || static_cast<uint64_t>(first) != tableEnd) {
                throw corruption("First element offset " + std::to_string(first) +
                                 " does not follow the offset table in " + source->name());
            }
        }

        trace() << "attached list of " << count << " at " << startOffset
                << " ending at " << static_cast<uint64_t>(end);

        return std::shared_ptr<RAList<T>>(new RAList<T>(std::move(source), std::move(serializer),
                                                         tableOffset,
                                                         static_cast<uint32_t>(count),
                                                         static_cast<uint64_t>(end)));
    }

    /**
     * Writes list as a section at the writer's current position and leaves
     * the writer positioned just past it.
     */
    static void write(DataWriter& out, const RandomAccessList<T>& list,
                      const ListSerializer<T>& serializer) {
        const size_t count = list.size();
        if (count > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            throw std::length_error("List of " + std::to_string(count) + " elements is too large");
        }

        out.writeInt32(static_cast<int32_t>(count));
        const uint64_t tableOffset = out.position();
        const uint64_t dataOffset = tableOffset + (count + 1) * format::kOffsetWidth;

        std::vector<uint64_t> offsets;
        offsets.reserve(count + 1);

        out.seek(dataOffset);
        for (size_t i = 0; i < count; ++i) {
            offsets.push_back(out.position());
            serializer.write(out, list.get(i));
        }
        const uint64_t end = out.position();
        offsets.push_back(end);

        std::vector<uint8_t> table(offsets.size() * format::kOffsetWidth);
        for (size_t i = 0; i < offsets.size(); ++i) {
            util::store_be64(table.data() + i * format::kOffsetWidth, offsets[i]);
        }
        out.seek(tableOffset);
        out.sink().write(table.data(), table.size());
        out.seek(end);
    }

    static void write(DataWriter& out, const std::vector<T>& values,
                      const ListSerializer<T>& serializer) {
        write(out, VectorList<T>(values), serializer);
    }

    size_t size() const override { return count_; }

    T get(size_t i) const override {
        this->checkIndex(i);

        DataReader table(*source_, tableOffset_ + i * format::kOffsetWidth);
        int64_t start = table.readInt64();
        int64_t next = table.readInt64();
        if (start < 0 || next < start ||
            static_cast<uint64_t>(start) < dataOffset() ||
            static_cast<uint64_t>(next) > end_) {
            throw corruption("Element " + std::to_string(i) + " spans [" + std::to_string(start) +
                             ", " + std::to_string(next) + ") outside its list in " + source_->name());
        }

        DataReader in(*source_, static_cast<uint64_t>(start), static_cast<uint64_t>(next));
        return serializer_->read(in, static_cast<int32_t>(i));
    }

    // First byte after this section
    uint64_t endOffset() const { return end_; }

private:
    RAList(std::shared_ptr<const DataSource> source, SerializerPtr serializer,
           uint64_t tableOffset, uint32_t count, uint64_t end)
        : source_(std::move(source)), serializer_(std::move(serializer)),
          tableOffset_(tableOffset), count_(count), end_(end) {}

    uint64_t dataOffset() const {
        return tableOffset_ + (static_cast<uint64_t>(count_) + 1) * format::kOffsetWidth;
    }

    std::shared_ptr<const DataSource> source_;
    SerializerPtr serializer_;
    uint64_t tableOffset_;
    uint32_t count_;
    uint64_t end_;
};

/**
 * Decodes every element of list into memory.
 */
template<typename T>
std::vector<T> toVector(const RandomAccessList<T>& list) {
    std::vector<T> out;
    out.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        out.push_back(list.get(i));
    }
    return out;
}

} // namespace raf
} // namespace dictstore
