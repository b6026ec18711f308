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
#include <cstdlib>
#include <string>

namespace dictstore {

// Dictionary file format
namespace format {
    // Highest format version this engine reads and the version it writes.
    // 1 adds entry source links, 2 adds token counts in indices,
    // 5 adds the html entries section.
    constexpr int32_t kCurrentVersion = 6;
    constexpr int32_t kHtmlEntriesVersion = 5;

    constexpr const char* kEndOfDictionary = "END OF DICTIONARY";

    constexpr size_t kMaxUtfBytes = 0xFFFF;               // utf strings carry a u16 length
    constexpr size_t kOffsetWidth = sizeof(int64_t);      // RAList offset table entries
}

// Decode cache configuration
namespace cache {
    constexpr size_t kDefaultCacheSize = 5000;           // entries per bounded section cache
    constexpr size_t kMinCacheSize = 16;
    constexpr size_t kMaxCacheSize = 1 << 20;

    // For runtime configuration via environment
    constexpr const char* kCacheSizeEnvVar = "DICTSTORE_CACHE_SIZE";

    // Cache size from DICTSTORE_CACHE_SIZE, clamped, or the default when
    // the variable is unset or not a number.
    inline size_t cache_size_from_env() {
        const char* env = std::getenv(kCacheSizeEnvVar);
        if (!env || !*env) {
            return kDefaultCacheSize;
        }
        char* end = nullptr;
        unsigned long long v = std::strtoull(env, &end, 10);
        if (end == env || *end != '\0') {
            return kDefaultCacheSize;
        }
        if (v < kMinCacheSize) return kMinCacheSize;
        if (v > kMaxCacheSize) return kMaxCacheSize;
        return static_cast<size_t>(v);
    }
}

// File naming configuration
namespace files {
    constexpr const char* kDictionaryExtension = ".quickdic";
    constexpr const char* kTempSuffix = ".tmp";            // write target before atomic rename
    constexpr size_t kWriteBufferSize = 64 * 1024;         // FileSink batch size
}

/**
 * Options controlling how a dictionary file is opened.
 */
struct OpenOptions {
    size_t cache_size;          // capacity of each bounded section cache
    bool   populate;            // ask the kernel to prefault the whole mapping

    OpenOptions()
        : cache_size(cache::cache_size_from_env())
        , populate(false) {}
};

} // namespace dictstore
