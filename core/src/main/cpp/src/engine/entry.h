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
#include <memory>
#include <ostream>
#include <stdexcept>

#include "../raf/data_io.h"

namespace dictstore {

    enum class EntryKind : int8_t {
        PAIR = 0,
        TEXT = 1,
        HTML = 2
    };

    const char* entryKindToString(EntryKind kind);

    /**
     * Base of every content record stored in a dictionary section.
     *
     * Records are immutable once built and are shared between caches and
     * callers through shared_ptr<const ...>.
     */
    class AbstractEntry {
    public:
        // entrySource value of records that carry no provenance
        static constexpr int16_t kNoSource = -1;

        explicit AbstractEntry(int16_t entrySource) : entrySource_(entrySource) {}
        virtual ~AbstractEntry() = default;

        virtual EntryKind kind() const = 0;
        virtual void print(std::ostream& out) const = 0;

        // Position of the EntrySource this record came from, or kNoSource
        int16_t entrySource() const { return entrySource_; }

    protected:
        int16_t entrySource_;
    };

    typedef std::shared_ptr<const AbstractEntry> EntryPtr;

    /**
     * Reads a source position and checks it against the number of sources
     * in the dictionary.
     * @throws DictionaryError(CORRUPTION) on a dangling position
     */
    int16_t readEntrySource(raf::DataReader& in, size_t numSources);

    /**
     * @throws std::out_of_range if entrySource is neither kNoSource nor a
     *         valid source position
     */
    void checkEntrySource(int16_t entrySource, size_t numSources);

} // namespace dictstore
