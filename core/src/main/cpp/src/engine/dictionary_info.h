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
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dictstore {

    // Summary of one Index
    struct IndexInfo {
        std::string shortName;
        std::string longName;
        int32_t allTokenCount = 0;
        int32_t mainTokenCount = 0;

        bool operator==(const IndexInfo& o) const {
            return shortName == o.shortName && longName == o.longName &&
                   allTokenCount == o.allTokenCount && mainTokenCount == o.mainTokenCount;
        }
        bool operator!=(const IndexInfo& o) const { return !(*this == o); }
    };

    /**
     * Lightweight descriptor of a dictionary file, enough to list it in a
     * catalog without keeping the dictionary open.
     *
     * uncompressedFilename and uncompressedBytes are only filled in when the
     * descriptor was taken from a file.
     */
    struct DictionaryInfo {
        std::string uncompressedFilename;
        int64_t uncompressedBytes = 0;
        int64_t creationMillis = 0;
        std::string dictInfo;
        std::vector<IndexInfo> indexInfos;

        bool operator==(const DictionaryInfo& o) const {
            return uncompressedFilename == o.uncompressedFilename &&
                   uncompressedBytes == o.uncompressedBytes && creationMillis == o.creationMillis &&
                   dictInfo == o.dictInfo && indexInfos == o.indexInfos;
        }
        bool operator!=(const DictionaryInfo& o) const { return !(*this == o); }

        /**
         * The descriptor as a one line JSON object:
         * {"file", "bytes", "created", "info", "indices": [{"short", "long",
         * "tokens", "main_tokens"}]}
         */
        std::string toCatalogLine() const;

        // nullopt if line is not a well formed catalog line
        static std::optional<DictionaryInfo> fromCatalogLine(const std::string& line);
    };

    std::ostream& operator<<(std::ostream& out, const DictionaryInfo& info);

    /**
     * Summaries of every readable dictionary among paths, in order.
     * Unreadable, corrupt or unsupported files are logged and skipped.
     */
    std::vector<DictionaryInfo> scanDictionaries(const std::vector<std::string>& paths);

    /**
     * scanDictionaries() over the regular files of dir carrying the
     * dictionary extension, sorted by name. A missing or unreadable
     * directory yields no descriptors.
     */
    std::vector<DictionaryInfo> scanDirectory(const std::string& dir);

} // namespace dictstore
