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

    class Dictionary;

    /**
     * Rich formatted entry: a title plus an html payload.
     *
     * index() is the entry's position in the html section. It is -1 until
     * the entry has been added to a dictionary; index entries refer to html
     * entries by that position, so an unpositioned entry cannot be
     * referenced on disk.
     */
    class HtmlEntry : public AbstractEntry {
    public:
        static constexpr int32_t kUnassigned = -1;

        HtmlEntry(int16_t entrySource, std::string title, std::string html,
                  int32_t index = kUnassigned)
            : AbstractEntry(entrySource), title_(std::move(title)), html_(std::move(html)),
              index_(index) {}

        EntryKind kind() const override { return EntryKind::HTML; }
        void print(std::ostream& out) const override;

        const std::string& title() const { return title_; }
        const std::string& html() const { return html_; }
        int32_t index() const { return index_; }
        bool isPositioned() const { return index_ != kUnassigned; }

        bool operator==(const HtmlEntry& o) const {
            return entrySource_ == o.entrySource_ && title_ == o.title_ && html_ == o.html_ &&
                   index_ == o.index_;
        }

        class Serializer : public raf::ListSerializer<std::shared_ptr<const HtmlEntry>> {
        public:
            explicit Serializer(size_t numSources) : numSources_(numSources) {}

            std::shared_ptr<const HtmlEntry> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const HtmlEntry>& t) const override;

        private:
            size_t numSources_;
        };

    private:
        friend class Dictionary;

        std::string title_;
        std::string html_;
        int32_t index_;
    };

    typedef std::shared_ptr<const HtmlEntry> HtmlEntryPtr;

} // namespace dictstore
