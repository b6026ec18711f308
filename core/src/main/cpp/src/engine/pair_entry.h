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

#include <memory>
#include <string>
#include <vector>

#include "entry.h"
#include "../raf/ralist.h"

namespace dictstore {

    /**
     * One translation pair: text in the first language and its
     * counterpart in the second.
     */
    struct Pair {
        std::string lang1;
        std::string lang2;

        Pair() = default;
        Pair(std::string l1, std::string l2) : lang1(std::move(l1)), lang2(std::move(l2)) {}

        // Pair as seen from an index whose languages are swapped
        Pair swapped() const { return Pair(lang2, lang1); }

        bool operator==(const Pair& o) const { return lang1 == o.lang1 && lang2 == o.lang2; }
        bool operator!=(const Pair& o) const { return !(*this == o); }
    };

    /**
     * Bilingual entry: an ordered list of translation pairs.
     */
    class PairEntry : public AbstractEntry {
    public:
        PairEntry(int16_t entrySource, std::vector<Pair> pairs)
            : AbstractEntry(entrySource), pairs_(std::move(pairs)) {}

        EntryKind kind() const override { return EntryKind::PAIR; }
        void print(std::ostream& out) const override;

        const std::vector<Pair>& pairs() const { return pairs_; }
        size_t size() const { return pairs_.size(); }
        const Pair& pair(size_t i) const { return pairs_.at(i); }

        bool operator==(const PairEntry& o) const {
            return entrySource_ == o.entrySource_ && pairs_ == o.pairs_;
        }

        class Serializer : public raf::ListSerializer<std::shared_ptr<const PairEntry>> {
        public:
            // numSources bounds the entry source positions accepted on read
            explicit Serializer(size_t numSources) : numSources_(numSources) {}

            std::shared_ptr<const PairEntry> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const PairEntry>& t) const override;

        private:
            size_t numSources_;
        };

    private:
        std::vector<Pair> pairs_;
    };

    typedef std::shared_ptr<const PairEntry> PairEntryPtr;

} // namespace dictstore
