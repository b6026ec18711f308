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
#include <string>

#include "../raf/ralist.h"

namespace dictstore {

    /**
     * Provenance of dictionary content: where entries came from and how
     * many were contributed. Used for attribution, not for lookup.
     */
    class EntrySource {
    public:
        EntrySource(int32_t index, std::string name, int32_t numEntries)
            : index_(index), name_(std::move(name)), numEntries_(numEntries) {}

        // Position within the sources section
        int32_t index() const { return index_; }
        const std::string& name() const { return name_; }
        int32_t numEntries() const { return numEntries_; }

        bool operator==(const EntrySource& o) const {
            return index_ == o.index_ && name_ == o.name_ && numEntries_ == o.numEntries_;
        }
        bool operator!=(const EntrySource& o) const { return !(*this == o); }

        class Serializer : public raf::ListSerializer<std::shared_ptr<const EntrySource>> {
        public:
            std::shared_ptr<const EntrySource> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const EntrySource>& t) const override;
        };

    private:
        int32_t index_;
        std::string name_;
        int32_t numEntries_;
    };

    typedef std::shared_ptr<const EntrySource> EntrySourcePtr;

} // namespace dictstore
