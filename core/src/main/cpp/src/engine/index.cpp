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

#include "index.h"
#include "dictionary.h"
#include "pair_entry.h"
#include "text_entry.h"

#include <limits>
#include <stdexcept>

namespace dictstore {

    /*
     * IndexEntry
     */

    void IndexEntry::addRef(EntryKind kind, int32_t position) {
        if (kind != EntryKind::PAIR && kind != EntryKind::TEXT) {
            throw std::invalid_argument(std::string("index entries refer to html entries by handle, not ") +
                                        entryKindToString(kind) + " position");
        }
        if (position < 0) {
            throw std::out_of_range("negative entry position " + std::to_string(position));
        }
        refs_.push_back(EntryRef{kind, position});
    }

    void IndexEntry::addHtmlEntry(HtmlEntryPtr entry) {
        if (!entry) {
            throw std::invalid_argument("null html entry");
        }
        htmlEntries_.push_back(std::move(entry));
    }

    size_t IndexEntry::htmlEntryCount() const {
        return htmlEntries_.empty() ? htmlPositions_.size() : htmlEntries_.size();
    }

    int32_t IndexEntry::htmlEntryIndex(size_t i) const {
        if (htmlEntries_.empty()) {
            return htmlPositions_.at(i);
        }
        const HtmlEntryPtr& e = htmlEntries_.at(i);
        if (!e->isPositioned()) {
            throw std::out_of_range("html entry '" + e->title() + "' referenced by token '" + token_ +
                                    "' has not been added to a dictionary");
        }
        return e->index();
    }

    IndexEntryPtr IndexEntry::Serializer::read(raf::DataReader& in, int32_t) const {
        std::string token = in.readUTF();

        int32_t refCount = in.readInt32();
        if (refCount < 0 || static_cast<uint64_t>(refCount) * 5 > in.remaining()) {
            throw corruption("Bad reference count " + std::to_string(refCount) + " for token '" +
                             token + "' in " + in.source().name());
        }
        std::vector<EntryRef> refs;
        refs.reserve(refCount);
        for (int32_t i = 0; i < refCount; ++i) {
            int8_t kind = in.readInt8();
            if (kind != static_cast<int8_t>(EntryKind::PAIR) && kind != static_cast<int8_t>(EntryKind::TEXT)) {
                throw corruption("Unknown entry kind " + std::to_string(kind) + " for token '" + token +
                                 "' in " + in.source().name());
            }
            int32_t position = in.readInt32();
            if (position < 0) {
                throw corruption("Negative entry position for token '" + token + "' in " + in.source().name());
            }
            refs.push_back(EntryRef{static_cast<EntryKind>(kind), position});
        }

        int32_t htmlCount = in.readInt32();
        if (htmlCount < 0 || static_cast<uint64_t>(htmlCount) * 4 > in.remaining()) {
            throw corruption("Bad html reference count " + std::to_string(htmlCount) + " for token '" +
                             token + "' in " + in.source().name());
        }
        if (htmlCount > 0 && !htmlAllowed_) {
            throw corruption("Token '" + token + "' refers to html entries in a file without any");
        }
        std::vector<int32_t> html;
        html.reserve(htmlCount);
        for (int32_t i = 0; i < htmlCount; ++i) {
            int32_t position = in.readInt32();
            if (position < 0) {
                throw corruption("Negative html entry position for token '" + token + "' in " +
                                 in.source().name());
            }
            html.push_back(position);
        }

        return std::make_shared<const IndexEntry>(std::move(token), std::move(refs), std::move(html));
    }

    void IndexEntry::Serializer::write(raf::DataWriter& out, const IndexEntryPtr& t) const {
        out.writeUTF(t->token());
        out.writeInt32(static_cast<int32_t>(t->refs().size()));
        for (const EntryRef& r : t->refs()) {
            out.writeInt8(static_cast<int8_t>(r.kind));
            out.writeInt32(r.position);
        }
        const size_t htmlCount = t->htmlEntryCount();
        if (htmlCount > 0 && !htmlAllowed_) {
            throw std::logic_error("Token '" + t->token() + "' refers to html entries, which this format version cannot store");
        }
        out.writeInt32(static_cast<int32_t>(htmlCount));
        for (size_t i = 0; i < htmlCount; ++i) {
            out.writeInt32(t->htmlEntryIndex(i));
        }
    }

    /*
     * Index
     */

    Index::Index(const Dictionary* dict, std::string shortName, std::string longName,
                 std::string sortLanguage, bool swapPairEntries)
        : dict_(dict), shortName_(std::move(shortName)), longName_(std::move(longName)),
          sortLanguage_(std::move(sortLanguage)), swapPairEntries_(swapPairEntries),
          mainTokenCount_(-1), building_(std::make_shared<raf::VectorList<IndexEntryPtr>>()) {
        entries_ = building_;
    }

    Index::Index(const Dictionary* dict, std::string shortName, std::string longName,
                 std::string sortLanguage, bool swapPairEntries, int32_t mainTokenCount,
                 std::shared_ptr<const EntryList> entries)
        : dict_(dict), shortName_(std::move(shortName)), longName_(std::move(longName)),
          sortLanguage_(std::move(sortLanguage)), swapPairEntries_(swapPairEntries),
          mainTokenCount_(mainTokenCount), entries_(std::move(entries)) {}

    int32_t Index::mainTokenCount() const {
        return mainTokenCount_ >= 0 ? mainTokenCount_ : static_cast<int32_t>(size());
    }

    void Index::setMainTokenCount(int32_t count) {
        if (!building_) {
            throw std::logic_error("Index " + shortName_ + " is read-only");
        }
        if (count < 0) {
            throw std::invalid_argument("negative main token count");
        }
        mainTokenCount_ = count;
    }

    void Index::addIndexEntry(IndexEntryPtr entry) {
        if (!building_) {
            throw std::logic_error("Index " + shortName_ + " is read-only");
        }
        if (!entry) {
            throw std::invalid_argument("null index entry");
        }
        if (!building_->empty() && entry->token() < building_->values().back()->token()) {
            throw std::invalid_argument("token '" + entry->token() + "' added after '" +
                                        building_->values().back()->token() + "' in index " + shortName_);
        }
        building_->add(std::move(entry));
    }

    size_t Index::findInsertionPoint(const std::string& token) const {
        size_t lo = 0;
        size_t hi = entries_->size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (entries_->get(mid)->token() < token) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        return lo;
    }

    std::optional<size_t> Index::findExact(const std::string& token) const {
        size_t pos = findInsertionPoint(token);
        if (pos < entries_->size() && entries_->get(pos)->token() == token) {
            return pos;
        }
        return std::nullopt;
    }

    namespace {
        template<typename T>
        EntryPtr resolveIn(const raf::RandomAccessList<T>& section, int32_t position,
                           const char* what, const std::string& token) {
            if (position < 0 || static_cast<size_t>(position) >= section.size()) {
                throw corruption("Token '" + token + "' refers to " + what + " entry " +
                                 std::to_string(position) + " of " + std::to_string(section.size()));
            }
            return section.get(static_cast<size_t>(position));
        }
    }

    std::vector<EntryPtr> Index::resolve(const IndexEntry& e) const {
        if (!dict_) {
            throw std::logic_error("Index " + shortName_ + " is not attached to a dictionary");
        }
        std::vector<EntryPtr> result;
        result.reserve(e.refs().size() + e.htmlEntryCount());
        for (const EntryRef& r : e.refs()) {
            if (r.kind == EntryKind::PAIR) {
                result.push_back(resolveIn(dict_->pairEntries(), r.position, "pair", e.token()));
            } else {
                result.push_back(resolveIn(dict_->textEntries(), r.position, "text", e.token()));
            }
        }
        for (size_t i = 0; i < e.htmlEntryCount(); ++i) {
            result.push_back(resolveIn(dict_->htmlEntries(), e.htmlEntryIndex(i), "html", e.token()));
        }
        return result;
    }

    IndexInfo Index::getIndexInfo() const {
        IndexInfo info;
        info.shortName = shortName_;
        info.longName = longName_;
        info.allTokenCount = static_cast<int32_t>(size());
        info.mainTokenCount = mainTokenCount();
        return info;
    }

    void Index::print(std::ostream& out) const {
        out << "Index " << shortName_ << " (" << longName_ << ", sort " << sortLanguage_
            << (swapPairEntries_ ? ", swapped" : "") << "): " << size() << " tokens, "
            << mainTokenCount() << " main\n";
        for (size_t i = 0; i < size(); ++i) {
            IndexEntryPtr e = getIndexEntry(i);
            out << "  " << e->token() << "\n";
            if (!dict_) {
                continue;
            }
            for (const EntryPtr& entry : resolve(*e)) {
                out << "    [" << entryKindToString(entry->kind()) << "] ";
                auto pair = std::dynamic_pointer_cast<const PairEntry>(entry);
                if (pair && swapPairEntries_) {
                    for (size_t p = 0; p < pair->size(); ++p) {
                        out << (p ? "; " : "") << pair->pair(p).swapped().lang1 << " :: "
                            << pair->pair(p).swapped().lang2;
                    }
                } else {
                    entry->print(out);
                }
                out << "\n";
            }
        }
    }

    IndexPtr Index::Serializer::read(raf::DataReader& in, int32_t) const {
        if (!source_) {
            throw std::logic_error("Index serializer has no source to read from");
        }
        std::string shortName = in.readUTF();
        std::string longName = in.readUTF();
        std::string sortLanguage = in.readUTF();
        bool swap = in.readBool();
        int32_t mainTokenCount = in.readInt32();
        if (mainTokenCount < 0) {
            throw corruption("Negative main token count in index " + shortName + " of " + in.source().name());
        }

        auto tokens = raf::RAList<IndexEntryPtr>::attach(
                source_, std::make_shared<const IndexEntry::Serializer>(htmlAllowed_), in.position());
        if (tokens->endOffset() > in.limit()) {
            throw corruption("Token list of index " + shortName + " runs past its index in " + in.source().name());
        }
        in.seek(tokens->endOffset());

        debug() << "index " << shortName << ": " << tokens->size() << " tokens";

        auto cached = raf::CachingList<IndexEntryPtr>::create(tokens, cacheSize_);
        return IndexPtr(new Index(dict_, std::move(shortName), std::move(longName), std::move(sortLanguage),
                                  swap, mainTokenCount, cached));
    }

    void Index::Serializer::write(raf::DataWriter& out, const IndexPtr& t) const {
        out.writeUTF(t->shortName());
        out.writeUTF(t->longName());
        out.writeUTF(t->sortLanguage());
        out.writeBool(t->swapPairEntries());
        out.writeInt32(t->mainTokenCount());
        raf::RAList<IndexEntryPtr>::write(out, t->sortedIndexEntries(), IndexEntry::Serializer(htmlAllowed_));
    }

} // namespace dictstore
