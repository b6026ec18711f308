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

#include "dictionary.h"
#include "../dictstore_error.h"
#include "../raf/caching_list.h"
#include "../raf/data_io.h"
#include "../raf/platform_fs.h"
#include "../raf/ralist.h"
#include "../util/log.h"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace dictstore {

    using raf::CachingList;
    using raf::RAList;
    using raf::VectorList;

    struct Dictionary::BuildState {
        std::shared_ptr<VectorList<EntrySourcePtr>> sources = std::make_shared<VectorList<EntrySourcePtr>>();
        std::shared_ptr<VectorList<PairEntryPtr>> pairEntries = std::make_shared<VectorList<PairEntryPtr>>();
        std::shared_ptr<VectorList<TextEntryPtr>> textEntries = std::make_shared<VectorList<TextEntryPtr>>();
        std::shared_ptr<VectorList<HtmlEntryPtr>> htmlEntries = std::make_shared<VectorList<HtmlEntryPtr>>();
        std::shared_ptr<VectorList<IndexPtr>> indices = std::make_shared<VectorList<IndexPtr>>();
    };

    static int64_t currentTimeMillis() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    Dictionary::Dictionary(const std::string& description, int32_t formatVersion)
        : version_(formatVersion), creationMillis_(currentTimeMillis()), description_(description),
          build_(new BuildState()) {
        if (formatVersion < 0 || formatVersion > format::kCurrentVersion) {
            throw std::invalid_argument("cannot build dictionary format version " + std::to_string(formatVersion));
        }
        sources_ = build_->sources;
        pairEntries_ = build_->pairEntries;
        textEntries_ = build_->textEntries;
        if (version_ >= format::kHtmlEntriesVersion) {
            htmlEntries_ = std::shared_ptr<const Section<HtmlEntryPtr>>(build_->htmlEntries);
        }
        indices_ = build_->indices;
    }

    Dictionary::Dictionary(int32_t version, int64_t creationMillis, std::string description)
        : version_(version), creationMillis_(creationMillis), description_(std::move(description)) {}

    Dictionary::~Dictionary() = default;

    std::unique_ptr<Dictionary> Dictionary::open(std::shared_ptr<const raf::DataSource> source,
                                                 const OpenOptions& options) {
        if (!source) {
            throw std::invalid_argument("Dictionary::open requires a source");
        }
        if (options.cache_size == 0) {
            throw std::invalid_argument("Dictionary::open requires a positive cache size");
        }

        raf::DataReader in(*source, 0);
        const int32_t version = in.readInt32();
        if (version < 0 || version > format::kCurrentVersion) {
            throw DictionaryError(ErrorKind::UNSUPPORTED_VERSION,
                                  "Unsupported dictionary version " + std::to_string(version) + " in " +
                                  source->name() + ", this engine reads up to version " +
                                  std::to_string(format::kCurrentVersion));
        }

        std::unique_ptr<Dictionary> dict;
        try {
            int64_t creationMillis = in.readInt64();
            std::string description = in.readUTF();
            dict.reset(new Dictionary(version, creationMillis, std::move(description)));

            dict->load(source, in, options);

            std::string end = in.readUTF();
            if (end != format::kEndOfDictionary) {
                throw corruption("Dictionary seems corrupt, found '" + end + "' instead of the end marker");
            }
        } catch (const DictionaryError& e) {
            throw DictionaryError(e.kind(), "Error loading dictionary " + source->name() + ": " + e.what(),
                                  std::current_exception());
        } catch (const std::exception& e) {
            throw DictionaryError(ErrorKind::CORRUPTION,
                                  "Error loading dictionary " + source->name() + ": " + e.what(),
                                  std::current_exception());
        }

        debug() << "opened " << source->name() << " version " << version << ", "
                << dict->pairEntries().size() << " pairs, " << dict->textEntries().size() << " texts, "
                << dict->htmlEntries().size() << " html, " << dict->indices().size() << " indices";
        return dict;
    }

    std::unique_ptr<Dictionary> Dictionary::open(const std::string& path, const OpenOptions& options) {
        return open(raf::MappedFileSource::open(path, options.populate), options);
    }

    void Dictionary::load(const std::shared_ptr<const raf::DataSource>& source, raf::DataReader& in,
                          const OpenOptions& options) {
        // Sources are small and needed to validate every entry, read them up front
        auto sources = RAList<EntrySourcePtr>::attach(source, std::make_shared<const EntrySource::Serializer>(),
                                                      in.position());
        sources_ = std::make_shared<const VectorList<EntrySourcePtr>>(raf::toVector(*sources));
        in.seek(sources->endOffset());
        const size_t numSources = sources_->size();

        auto pairs = RAList<PairEntryPtr>::attach(source, std::make_shared<const PairEntry::Serializer>(numSources),
                                                  in.position());
        pairEntries_ = CachingList<PairEntryPtr>::create(pairs, options.cache_size);
        in.seek(pairs->endOffset());

        auto texts = RAList<TextEntryPtr>::attach(source, std::make_shared<const TextEntry::Serializer>(numSources),
                                                  in.position());
        textEntries_ = CachingList<TextEntryPtr>::create(texts, options.cache_size);
        in.seek(texts->endOffset());

        if (version_ >= format::kHtmlEntriesVersion) {
            auto html = RAList<HtmlEntryPtr>::attach(source, std::make_shared<const HtmlEntry::Serializer>(numSources),
                                                     in.position());
            htmlEntries_ = std::shared_ptr<const Section<HtmlEntryPtr>>(
                    CachingList<HtmlEntryPtr>::create(html, options.cache_size));
            in.seek(html->endOffset());
        } else {
            htmlEntries_.reset();
        }

        auto indices = RAList<IndexPtr>::attach(
                source,
                std::make_shared<const Index::Serializer>(this, source, options.cache_size, hasHtmlEntries()),
                in.position());
        indices_ = CachingList<IndexPtr>::createFullyCached(indices);
        in.seek(indices->endOffset());
    }

    void Dictionary::write(raf::DataSink& sink) const {
        raf::DataWriter out(sink);
        out.writeInt32(version_);
        out.writeInt64(creationMillis_);
        out.writeUTF(description_);

        const size_t numSources = sources_->size();
        RAList<EntrySourcePtr>::write(out, *sources_, EntrySource::Serializer());
        RAList<PairEntryPtr>::write(out, *pairEntries_, PairEntry::Serializer(numSources));
        RAList<TextEntryPtr>::write(out, *textEntries_, TextEntry::Serializer(numSources));
        if (version_ >= format::kHtmlEntriesVersion) {
            RAList<HtmlEntryPtr>::write(out, htmlEntries(), HtmlEntry::Serializer(numSources));
        }
        RAList<IndexPtr>::write(out, *indices_, Index::Serializer(hasHtmlEntries()));

        out.writeUTF(format::kEndOfDictionary);
    }

    void Dictionary::write(const std::string& path) const {
        const std::string tmp = path + files::kTempSuffix;
        try {
            raf::FileSink sink(tmp);
            write(sink);
            sink.close();
        } catch (...) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw;
        }

        raf::FSResult r = raf::PlatformFS::atomic_replace(tmp, path);
        if (!r.ok) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw ioError("Failed to move " + tmp + " to " + path + ": " + std::strerror(r.err));
        }
        info() << "wrote dictionary " << path;
    }

    const Dictionary::Section<HtmlEntryPtr>& Dictionary::htmlEntries() const {
        static const raf::EmptyList<HtmlEntryPtr> none;
        return htmlEntries_ ? **htmlEntries_ : none;
    }

    IndexPtr Dictionary::findIndex(const std::string& shortName) const {
        for (size_t i = 0; i < indices_->size(); ++i) {
            IndexPtr index = indices_->get(i);
            if (index->shortName() == shortName) {
                return index;
            }
        }
        return nullptr;
    }

    Dictionary::BuildState& Dictionary::building(const char* op) {
        if (!build_) {
            throw std::logic_error(std::string(op) + " on read-only dictionary " + description_);
        }
        return *build_;
    }

    EntrySourcePtr Dictionary::addSource(const std::string& name, int32_t numEntries) {
        BuildState& b = building("addSource");
        if (numEntries < 0) {
            throw std::invalid_argument("negative entry count " + std::to_string(numEntries) +
                                        " for source '" + name + "'");
        }
        if (b.sources->size() >= static_cast<size_t>(std::numeric_limits<int16_t>::max())) {
            throw std::length_error("too many entry sources");
        }
        auto source = std::make_shared<const EntrySource>(static_cast<int32_t>(b.sources->size()), name, numEntries);
        b.sources->add(source);
        return source;
    }

    PairEntryPtr Dictionary::addPairEntry(int16_t entrySource, std::vector<Pair> pairs) {
        BuildState& b = building("addPairEntry");
        checkEntrySource(entrySource, b.sources->size());
        auto entry = std::make_shared<const PairEntry>(entrySource, std::move(pairs));
        b.pairEntries->add(entry);
        return entry;
    }

    TextEntryPtr Dictionary::addTextEntry(int16_t entrySource, const std::string& text) {
        BuildState& b = building("addTextEntry");
        checkEntrySource(entrySource, b.sources->size());
        auto entry = std::make_shared<const TextEntry>(entrySource, text);
        b.textEntries->add(entry);
        return entry;
    }

    HtmlEntryPtr Dictionary::addHtmlEntry(std::shared_ptr<HtmlEntry> entry) {
        BuildState& b = building("addHtmlEntry");
        if (version_ < format::kHtmlEntriesVersion) {
            throw std::logic_error("format version " + std::to_string(version_) + " has no html entries");
        }
        if (!entry) {
            throw std::invalid_argument("null html entry");
        }
        if (entry->isPositioned()) {
            throw std::logic_error("html entry '" + entry->title() + "' already has position " +
                                   std::to_string(entry->index()));
        }
        checkEntrySource(entry->entrySource(), b.sources->size());
        entry->index_ = static_cast<int32_t>(b.htmlEntries->size());
        b.htmlEntries->add(entry);
        return entry;
    }

    HtmlEntryPtr Dictionary::addHtmlEntry(int16_t entrySource, const std::string& title, const std::string& html) {
        return addHtmlEntry(std::make_shared<HtmlEntry>(entrySource, title, html));
    }

    std::shared_ptr<Index> Dictionary::addIndex(const std::string& shortName, const std::string& longName,
                                                const std::string& sortLanguage, bool swapPairEntries) {
        BuildState& b = building("addIndex");
        auto index = std::make_shared<Index>(this, shortName, longName, sortLanguage, swapPairEntries);
        b.indices->add(index);
        return index;
    }

    DictionaryInfo Dictionary::getDictionaryInfo() const {
        DictionaryInfo result;
        result.creationMillis = creationMillis_;
        result.dictInfo = description_;
        for (size_t i = 0; i < indices_->size(); ++i) {
            result.indexInfos.push_back(indices_->get(i)->getIndexInfo());
        }
        return result;
    }

    OpenOptions Dictionary::summaryOptions() {
        OpenOptions options;
        options.populate = false;
        options.cache_size = cache::kMinCacheSize;
        return options;
    }

    std::optional<DictionaryInfo> Dictionary::getDictionaryInfo(const std::string& path) {
        try {
            std::unique_ptr<Dictionary> dict = open(path, summaryOptions());
            DictionaryInfo result = dict->getDictionaryInfo();
            result.uncompressedFilename = std::filesystem::path(path).filename().string();
            result.uncompressedBytes = static_cast<int64_t>(std::filesystem::file_size(path));
            return result;
        } catch (const DictionaryError& e) {
            warning() << "Skipping " << path << " [" << errorKindToString(e.kind()) << "]: " << e.what();
        } catch (const std::exception& e) {
            warning() << "Skipping " << path << ": " << e.what();
        }
        return std::nullopt;
    }

    void Dictionary::print(std::ostream& out) const {
        out << "dictInfo=" << description_ << "\n";
        out << "version=" << version_ << " created=" << creationMillis_ << "\n";
        for (size_t i = 0; i < sources_->size(); ++i) {
            EntrySourcePtr s = sources_->get(i);
            out << "EntrySource: " << s->name() << " " << s->numEntries() << "\n";
        }
        out << "pairs=" << pairEntries_->size() << " texts=" << textEntries_->size()
            << " html=" << htmlEntries().size() << "\n";
        for (size_t i = 0; i < indices_->size(); ++i) {
            out << "\n";
            indices_->get(i)->print(out);
        }
    }

} // namespace dictstore
