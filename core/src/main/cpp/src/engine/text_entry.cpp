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

#include "text_entry.h"

namespace dictstore {

    TextEntryPtr TextEntry::Serializer::read(raf::DataReader& in, int32_t) const {
        int16_t source = readEntrySource(in, numSources_);
        std::string text = in.readUTF();
        return std::make_shared<const TextEntry>(source, std::move(text));
    }

    void TextEntry::Serializer::write(raf::DataWriter& out, const TextEntryPtr& t) const {
        out.writeInt16(t->entrySource());
        out.writeUTF(t->text());
    }

} // namespace dictstore
