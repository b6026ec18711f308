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

#include "entry.h"
#include "../dictstore_error.h"

#include <stdexcept>
#include <string>

namespace dictstore {

    const char* entryKindToString(EntryKind kind) {
        switch (kind) {
            case EntryKind::PAIR: return "pair";
            case EntryKind::TEXT: return "text";
            case EntryKind::HTML: return "html";
        }
        return "unknown";
    }

    int16_t readEntrySource(raf::DataReader& in, size_t numSources) {
        int16_t source = in.readInt16();
        if (source != AbstractEntry::kNoSource &&
            (source < 0 || static_cast<size_t>(source) >= numSources)) {
            throw corruption("Entry source " + std::to_string(source) + " at " +
                             std::to_string(in.position() - 2) + " out of range of " +
                             std::to_string(numSources) + " sources in " + in.source().name());
        }
        return source;
    }

    void checkEntrySource(int16_t entrySource, size_t numSources) {
        if (entrySource != AbstractEntry::kNoSource &&
            (entrySource < 0 || static_cast<size_t>(entrySource) >= numSources)) {
            throw std::out_of_range("entry source " + std::to_string(entrySource) +
                                    " is not one of the " + std::to_string(numSources) + " sources");
        }
    }

} // namespace dictstore
