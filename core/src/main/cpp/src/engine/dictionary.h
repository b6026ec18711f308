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

#include "dictionary_info.h"
#include "entry_source.h"
#include "html_entry.h"
#include "index.h"
#include "pair_entry.h"
#include "text_entry.h"
#include "../config.h"
#include "../raf/data_sink.h"
#include "../raf/data_source.h"
#include "../raf/random_access_list.h"

namespace dictstore {

    /**
     * A versioned dictionary file: entry sources, pair, text and html
     * entries, and the indices that cross-reference them.
     *
     * A Dictionary is either fresh (built in memory through the add*
     * methods, then written once) or opened (read-only, every section
     * decoded lazily from the underlying DataSource). Indices keep a
     * pointer back to their Dictionary, so it can be neither copied nor
     * moved.
     *
     * File layout:
     *
     *   int32   format version
     *   int64   creation time, millis since the epoch
     *   utf     description
     *   list    entry sources
     *   list    pair entries
     *   list    text entries
     *   list    html entries (format version 5 and up)
     *   list    indices
     *   utf     "END OF DICTIONARY"
     */
    class Dictionary {
    public:
        template<typename T> using Section = raf::RandomAccessList<T>;

        explicit Dictionary(const std::string& description,
                            int32_t formatVersion = format::kCurrentVersion);
        ~Dictionary();

        Dictionary(const Dictionary&) = delete;
        Dictionary& operator=(const Dictionary&) = delete;

        /**
         * Opens a dictionary from bytes.
         * @throws DictionaryError(UNSUPPORTED_VERSION) before anything but
         *         the version is parsed
         * @throws DictionaryError for any fault while loading the sections,
         *         with the original exception as cause
         */
        static std::unique_ptr<Dictionary> open(std::shared_ptr<const raf::DataSource> source,
                                                const OpenOptions& options = OpenOptions());

        // Maps path read-only and opens it. @throws DictionaryError(IO) if it cannot be mapped
        static std::unique_ptr<Dictionary> open(const std::string& path,
                                                const OpenOptions& options = OpenOptions());

        void write(raf::DataSink& sink) const;

        // Writes path + ".tmp" and renames it over path
        void write(const std::string& path) const;

        int32_t formatVersion() const { return version_; }
        int64_t creationMillis() const { return creationMillis_; }
        const std::string& description() const { return description_; }
        bool isReadOnly() const { return !build_; }

        const Section<EntrySourcePtr>& sources() const { return *sources_; }
        const Section<PairEntryPtr>& pairEntries() const { return *pairEntries_; }
        const Section<TextEntryPtr>& textEntries() const { return *textEntries_; }

        // Empty when the file predates html entries
        const Section<HtmlEntryPtr>& htmlEntries() const;
        bool hasHtmlEntries() const { return htmlEntries_.has_value(); }

        const Section<IndexPtr>& indices() const { return *indices_; }

        // nullptr when there is no index with that short name
        IndexPtr findIndex(const std::string& shortName) const;

        /*
         * Build API, fresh dictionaries only; @throws std::logic_error otherwise
         */

        // @throws std::invalid_argument if numEntries is negative
        EntrySourcePtr addSource(const std::string& name, int32_t numEntries);

        // @throws std::out_of_range if entrySource is not a known source
        PairEntryPtr addPairEntry(int16_t entrySource, std::vector<Pair> pairs);
        TextEntryPtr addTextEntry(int16_t entrySource, const std::string& text);

        // Assigns entry its position in the html section
        HtmlEntryPtr addHtmlEntry(std::shared_ptr<HtmlEntry> entry);
        HtmlEntryPtr addHtmlEntry(int16_t entrySource, const std::string& title, const std::string& html);

        std::shared_ptr<Index> addIndex(const std::string& shortName, const std::string& longName,
                                        const std::string& sortLanguage, bool swapPairEntries = false);

        DictionaryInfo getDictionaryInfo() const;

        /**
         * Best effort summary of the dictionary at path, filled in with the
         * file name and size. Faults are logged and yield nullopt.
         */
        static std::optional<DictionaryInfo> getDictionaryInfo(const std::string& path);

        // How getDictionaryInfo(path) opens files: no prefaulting, minimal caches
        static OpenOptions summaryOptions();

        void print(std::ostream& out) const;

    private:
        struct BuildState;

        Dictionary(int32_t version, int64_t creationMillis, std::string description);

        void load(const std::shared_ptr<const raf::DataSource>& source, raf::DataReader& in,
                  const OpenOptions& options);
        BuildState& building(const char* op);

        int32_t version_;
        int64_t creationMillis_;
        std::string description_;

        std::shared_ptr<const Section<EntrySourcePtr>> sources_;
        std::shared_ptr<const Section<PairEntryPtr>> pairEntries_;
        std::shared_ptr<const Section<TextEntryPtr>> textEntries_;
        std::optional<std::shared_ptr<const Section<HtmlEntryPtr>>> htmlEntries_;
        std::shared_ptr<const Section<IndexPtr>> indices_;

        std::unique_ptr<BuildState> build_;         // null when opened from a file
    };

} // namespace dictstore
