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
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "entry.h"
#include "html_entry.h"
#include "dictionary_info.h"
#include "../raf/caching_list.h"
#include "../raf/ralist.h"

namespace dictstore {

    class Dictionary;

    // Reference from an index token to a pair or text entry
    struct EntryRef {
        EntryKind kind;
        int32_t position;

        bool operator==(const EntryRef& o) const { return kind == o.kind && position == o.position; }
        bool operator!=(const EntryRef& o) const { return !(*this == o); }
    };

    /**
     * One lookup token of an Index and the entries it refers to.
     *
     * Html references are kept as HtmlEntry handles while building and are
     * persisted as HtmlEntry::index(); a decoded IndexEntry only knows the
     * positions.
     */
    class IndexEntry {
    public:
        explicit IndexEntry(std::string token) : token_(std::move(token)) {}

        IndexEntry(std::string token, std::vector<EntryRef> refs, std::vector<int32_t> htmlPositions)
            : token_(std::move(token)), refs_(std::move(refs)), htmlPositions_(std::move(htmlPositions)) {}

        const std::string& token() const { return token_; }
        const std::vector<EntryRef>& refs() const { return refs_; }

        // @throws std::invalid_argument for kinds other than PAIR and TEXT
        void addRef(EntryKind kind, int32_t position);
        void addHtmlEntry(HtmlEntryPtr entry);

        size_t htmlEntryCount() const;

        /**
         * Position of the i-th referenced html entry.
         * @throws std::out_of_range if the entry was never added to a dictionary
         */
        int32_t htmlEntryIndex(size_t i) const;

        class Serializer : public raf::ListSerializer<std::shared_ptr<const IndexEntry>> {
        public:
            // htmlAllowed is false for files without an html section
            explicit Serializer(bool htmlAllowed = true) : htmlAllowed_(htmlAllowed) {}

            std::shared_ptr<const IndexEntry> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const IndexEntry>& t) const override;

        private:
            bool htmlAllowed_;
        };

    private:
        std::string token_;
        std::vector<EntryRef> refs_;
        std::vector<HtmlEntryPtr> htmlEntries_;
        std::vector<int32_t> htmlPositions_;
    };

    typedef std::shared_ptr<const IndexEntry> IndexEntryPtr;

    /**
     * Ordered lookup tokens for one language of a dictionary.
     *
     * Tokens are kept in byte-wise order so lookups are a binary search over
     * the (lazily decoded) token list. Entry references resolve through the
     * owning Dictionary, which must outlive the Index.
     */
    class Index {
    public:
        typedef raf::RandomAccessList<IndexEntryPtr> EntryList;

        // Empty index under construction, see Dictionary::addIndex
        Index(const Dictionary* dict, std::string shortName, std::string longName,
              std::string sortLanguage, bool swapPairEntries);

        Index(const Index&) = delete;
        Index& operator=(const Index&) = delete;

        const std::string& shortName() const { return shortName_; }
        const std::string& longName() const { return longName_; }
        const std::string& sortLanguage() const { return sortLanguage_; }
        bool swapPairEntries() const { return swapPairEntries_; }

        // Explicitly set count, or all tokens when none was set
        int32_t mainTokenCount() const;
        void setMainTokenCount(int32_t count);

        size_t size() const { return entries_->size(); }
        IndexEntryPtr getIndexEntry(size_t i) const { return entries_->get(i); }
        const EntryList& sortedIndexEntries() const { return *entries_; }

        /**
         * Appends a token while building.
         * @throws std::logic_error on a decoded index
         * @throws std::invalid_argument if token order would be broken
         */
        void addIndexEntry(IndexEntryPtr entry);

        // Position of the first token not less than token
        size_t findInsertionPoint(const std::string& token) const;
        std::optional<size_t> findExact(const std::string& token) const;

        /**
         * Entries referenced by e: pair and text refs in order, then html refs.
         * @throws DictionaryError(CORRUPTION) on a dangling position
         */
        std::vector<EntryPtr> resolve(const IndexEntry& e) const;

        IndexInfo getIndexInfo() const;

        void print(std::ostream& out) const;

        class Serializer : public raf::ListSerializer<std::shared_ptr<const Index>> {
        public:
            /**
             * @param source   bytes the nested token lists are attached to
             * @param cacheSize capacity of each index's token cache
             */
            Serializer(const Dictionary* dict, std::shared_ptr<const raf::DataSource> source,
                       size_t cacheSize, bool htmlAllowed)
                : dict_(dict), source_(std::move(source)), cacheSize_(cacheSize),
                  htmlAllowed_(htmlAllowed) {}

            // Write-only serializer
            explicit Serializer(bool htmlAllowed = true)
                : dict_(nullptr), cacheSize_(0), htmlAllowed_(htmlAllowed) {}

            std::shared_ptr<const Index> read(raf::DataReader& in, int32_t index) const override;
            void write(raf::DataWriter& out, const std::shared_ptr<const Index>& t) const override;

        private:
            const Dictionary* dict_;
            std::shared_ptr<const raf::DataSource> source_;
            size_t cacheSize_;
            bool htmlAllowed_;
        };

    private:
        Index(const Dictionary* dict, std::string shortName, std::string longName,
              std::string sortLanguage, bool swapPairEntries, int32_t mainTokenCount,
              std::shared_ptr<const EntryList> entries);

        const Dictionary* dict_;
        std::string shortName_;
        std::string longName_;
        std::string sortLanguage_;
        bool swapPairEntries_;
        int32_t mainTokenCount_;

        std::shared_ptr<const EntryList> entries_;
        std::shared_ptr<raf::VectorList<IndexEntryPtr>> building_;   // null once decoded
    };

    typedef std::shared_ptr<const Index> IndexPtr;

} // namespace dictstore
