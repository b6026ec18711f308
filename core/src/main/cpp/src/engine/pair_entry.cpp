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

#include "pair_entry.h"

#include <limits>

namespace dictstore {

    void PairEntry::print(std::ostream& out) const {
        for (size_t i = 0; i < pairs_.size(); ++i) {
            if (i > 0) {
                out << "\n";
            }
            out << pairs_[i].lang1 << " :: " << pairs_[i].lang2;
        }
    }

    PairEntryPtr PairEntry::Serializer::read(raf::DataReader& in, int32_t) const {
        int16_t source = readEntrySource(in, numSources_);
        int32_t count = in.readInt32();
        // each pair needs at least two length prefixes
        if (count < 0 || static_cast<uint64_t>(count) * 4 > in.remaining()) {
            throw corruption("Bad pair count " + std::to_string(count) + " at " +
                             std::to_string(in.position() - 4) + " in " + in.source().name());
        }

        std::vector<Pair> pairs;
        pairs.reserve(count);
        for (int32_t i = 0; i < count; ++i) {
            std::string lang1 = in.readUTF();
            std::string lang2 = in.readUTF();
            pairs.emplace_back(std::move(lang1), std::move(lang2));
        }
        return std::make_shared<const PairEntry>(source, std::move(pairs));
    }

    void PairEntry::Serializer::write(raf::DataWriter& out, const PairEntryPtr& t) const {
        if (t->pairs().size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            throw std::length_error("Too many pairs in entry");
        }
        out.writeInt16(t->entrySource());
        out.writeInt32(static_cast<int32_t>(t->pairs().size()));
        for (const Pair& p : t->pairs()) {
            out.writeUTF(p.lang1);
            out.writeUTF(p.lang2);
        }
    }

} // namespace dictstore
