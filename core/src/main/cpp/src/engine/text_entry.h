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

#include "entry.h"
#include "../raf/ralist.h"

namespace dictstore {

    /**
     * Monolingual free-form text entry.
     */
    class TextEntry : public AbstractEntry {
    public:
        TextEntry(int16_t entrySource, std::string text)
            : AbstractEntry(entrySource), text_(std::move(text)) {}

        EntryKind kind() const override { return EntryKind::TEXT; }
        void print(std::ostream& out) const override { out << text_; }

        const std::string& text() const { return text_; }

        bool operator==(const TextEntry& o) const {
            return entrySource_ == o.entrySource_ && text_ == o.text_;
        }

        class Serializer : public raf::ListSerializer<std::shared_ptr<const TextEntry>> {
        public:
            explicit Serializer(size_t numSources) : numSources_(numSources) {}

            std::shared_ptr<const TextEntry> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const TextEntry>& t) const override;

        private:
            size_t numSources_;
        };

    private:
        std::string text_;
    };

    typedef std::shared_ptr<const TextEntry> TextEntryPtr;

} // namespace dictstore
