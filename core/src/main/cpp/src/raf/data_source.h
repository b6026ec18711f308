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

#include "platform_fs.h"

namespace dictstore {
namespace raf {

/**
 * Immutable, contiguous, random-access bytes a dictionary is read from.
 *
 * Implementations never change their contents after construction, so any
 * number of readers may decode from one source concurrently, each with its
 * own DataReader cursor.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual const uint8_t* data() const = 0;
    virtual size_t size() const = 0;

    // Human readable origin, used in error messages
    virtual const std::string& name() const = 0;
};

/**
 * Read-only memory mapping of a whole file. The mapping and its
 * descriptor are released when the last owner lets go.
 */
class MappedFileSource : public DataSource {
public:
    /**
     * Maps path read-only.
     * @param populate prefault the mapping (useful for small files
     *                 that will be scanned end to end)
     * @throws DictionaryError(IO) if the file cannot be opened or mapped
     */
    static std::shared_ptr<MappedFileSource> open(const std::string& path, bool populate = false);

    ~MappedFileSource() override;

    MappedFileSource(const MappedFileSource&) = delete;
    MappedFileSource& operator=(const MappedFileSource&) = delete;

    const uint8_t* data() const override { return static_cast<const uint8_t*>(region_.addr); }
    size_t size() const override { return region_.size; }
    const std::string& name() const override { return path_; }

private:
    MappedFileSource(const std::string& path, const MappedRegion& region)
        : path_(path), region_(region) {}

    std::string path_;
    MappedRegion region_;
};

/**
 * Bytes held in memory, e.g. a dictionary just written to a MemorySink.
 */
class MemorySource : public DataSource {
public:
    explicit MemorySource(std::vector<uint8_t> bytes, std::string name = "<memory>")
        : bytes_(std::move(bytes)), name_(std::move(name)) {}

    const uint8_t* data() const override { return bytes_.data(); }
    size_t size() const override { return bytes_.size(); }
    const std::string& name() const override { return name_; }

private:
    std::vector<uint8_t> bytes_;
    std::string name_;
};

} // namespace raf
} // namespace dictstore
