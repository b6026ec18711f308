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

#include "entry_source.h"

namespace dictstore {

    EntrySourcePtr EntrySource::Serializer::read(raf::DataReader& in, int32_t index) const {
        std::string name = in.readUTF();
        int32_t numEntries = in.readInt32();
        if (numEntries < 0) {
            throw corruption("Negative entry count for source '" + name + "' in " + in.source().name());
        }
        return std::make_shared<const EntrySource>(index, std::move(name), numEntries);
    }

    void EntrySource::Serializer::write(raf::DataWriter& out, const EntrySourcePtr& t) const {
        out.writeUTF(t->name());
        out.writeInt32(t->numEntries());
    }

} // namespace dictstore
