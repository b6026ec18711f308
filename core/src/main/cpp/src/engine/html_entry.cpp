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

#include "html_entry.h"

namespace dictstore {

    void HtmlEntry::print(std::ostream& out) const {
        out << title_ << " (" << html_.size() << " bytes of html)";
    }

    HtmlEntryPtr HtmlEntry::Serializer::read(raf::DataReader& in, int32_t index) const {
        int16_t source = readEntrySource(in, numSources_);
        std::string title = in.readUTF();
        std::string html = in.readLongUTF();
        return std::make_shared<const HtmlEntry>(source, std::move(title), std::move(html), index);
    }

    void HtmlEntry::Serializer::write(raf::DataWriter& out, const HtmlEntryPtr& t) const {
        out.writeInt16(t->entrySource());
        out.writeUTF(t->title());
        out.writeLongUTF(t->html());
    }

} // namespace dictstore
