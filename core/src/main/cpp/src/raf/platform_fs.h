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

namespace dictstore {
    namespace raf {

        // A read-only view of a whole file.
        struct MappedRegion {
            void*    addr = nullptr;     // null for empty files
            size_t   size = 0;
            intptr_t file_handle = -1;   // fd, owned by the region
        };

        // How the mapping will be read, passed on to the kernel as advice.
        enum class AccessPattern {
            Random,       // lazy lookups touching few pages
            Sequential    // full scans, prefault everything
        };

        struct FSResult {
            bool ok;
            int err;
        };

        class PlatformFS {
        public:
            // Opens and maps path read-only in one step. On success the region
            // owns the descriptor and must be released with unmap().
            static FSResult map_readonly(const std::string& path, AccessPattern pattern,
                                         MappedRegion* out);
            static FSResult unmap(const MappedRegion& rgn);

            static FSResult flush_file(intptr_t file_handle);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(tmp, final), then fsync of final's directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);
        };

    }
}
