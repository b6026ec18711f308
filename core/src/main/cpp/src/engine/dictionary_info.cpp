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

#include "dictionary_info.h"
#include "dictionary.h"
#include "../config.h"
#include "../util/log.h"

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace dictstore {

    namespace {

        bool getString(const rapidjson::Value& obj, const char* key, std::string& out) {
            auto it = obj.FindMember(key);
            if (it == obj.MemberEnd() || !it->value.IsString()) {
                return false;
            }
            out.assign(it->value.GetString(), it->value.GetStringLength());
            return true;
        }

        bool getInt64(const rapidjson::Value& obj, const char* key, int64_t& out) {
            auto it = obj.FindMember(key);
            if (it == obj.MemberEnd() || !it->value.IsInt64()) {
                return false;
            }
            out = it->value.GetInt64();
            return true;
        }

        bool getInt32(const rapidjson::Value& obj, const char* key, int32_t& out) {
            auto it = obj.FindMember(key);
            if (it == obj.MemberEnd() || !it->value.IsInt()) {
                return false;
            }
            out = it->value.GetInt();
            return true;
        }

    } // namespace

    std::string DictionaryInfo::toCatalogLine() const {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

        writer.StartObject();
        writer.Key("file");
        writer.String(uncompressedFilename.c_str(), static_cast<rapidjson::SizeType>(uncompressedFilename.size()));
        writer.Key("bytes");
        writer.Int64(uncompressedBytes);
        writer.Key("created");
        writer.Int64(creationMillis);
        writer.Key("info");
        writer.String(dictInfo.c_str(), static_cast<rapidjson::SizeType>(dictInfo.size()));

        writer.Key("indices");
        writer.StartArray();
        for (const IndexInfo& ii : indexInfos) {
            writer.StartObject();
            writer.Key("short");
            writer.String(ii.shortName.c_str(), static_cast<rapidjson::SizeType>(ii.shortName.size()));
            writer.Key("long");
            writer.String(ii.longName.c_str(), static_cast<rapidjson::SizeType>(ii.longName.size()));
            writer.Key("tokens");
            writer.Int(ii.allTokenCount);
            writer.Key("main_tokens");
            writer.Int(ii.mainTokenCount);
            writer.EndObject();
        }
        writer.EndArray();
        writer.EndObject();

        // Writer escapes control characters, so the record stays on one line
        return buffer.GetString();
    }

    std::optional<DictionaryInfo> DictionaryInfo::fromCatalogLine(const std::string& line) {
        rapidjson::Document doc;
        doc.Parse(line.c_str(), line.size());
        if (doc.HasParseError()) {
            debug() << "bad catalog line at offset " << doc.GetErrorOffset()
                    << ": " << rapidjson::GetParseError_En(doc.GetParseError());
            return std::nullopt;
        }
        if (!doc.IsObject()) {
            return std::nullopt;
        }

        DictionaryInfo info;
        if (!getString(doc, "file", info.uncompressedFilename) ||
            !getInt64(doc, "bytes", info.uncompressedBytes) ||
            !getInt64(doc, "created", info.creationMillis) ||
            !getString(doc, "info", info.dictInfo)) {
            return std::nullopt;
        }

        auto indices = doc.FindMember("indices");
        if (indices == doc.MemberEnd() || !indices->value.IsArray()) {
            return std::nullopt;
        }
        for (const rapidjson::Value& v : indices->value.GetArray()) {
            IndexInfo ii;
            if (!v.IsObject() ||
                !getString(v, "short", ii.shortName) ||
                !getString(v, "long", ii.longName) ||
                !getInt32(v, "tokens", ii.allTokenCount) ||
                !getInt32(v, "main_tokens", ii.mainTokenCount)) {
                return std::nullopt;
            }
            info.indexInfos.push_back(std::move(ii));
        }
        return info;
    }

    std::ostream& operator<<(std::ostream& out, const DictionaryInfo& info) {
        if (!info.uncompressedFilename.empty()) {
            out << info.uncompressedFilename << " (" << info.uncompressedBytes << " bytes)\n";
        }
        out << "  created: " << info.creationMillis << "\n";
        out << "  info:    " << info.dictInfo << "\n";
        for (const IndexInfo& ii : info.indexInfos) {
            out << "  index " << ii.shortName << " (" << ii.longName << "): "
                << ii.allTokenCount << " tokens, " << ii.mainTokenCount << " main\n";
        }
        return out;
    }

    std::vector<DictionaryInfo> scanDictionaries(const std::vector<std::string>& paths) {
        std::vector<DictionaryInfo> result;
        for (const std::string& path : paths) {
            std::optional<DictionaryInfo> summary = Dictionary::getDictionaryInfo(path);
            if (summary) {
                result.push_back(std::move(*summary));
            }
        }
        info() << "scanned " << paths.size() << " files, " << result.size() << " dictionaries";
        return result;
    }

    std::vector<DictionaryInfo> scanDirectory(const std::string& dir) {
        namespace fs = std::filesystem;

        std::vector<std::string> paths;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            warning() << "cannot list " << dir << ": " << ec.message();
            return {};
        }
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                warning() << "error listing " << dir << ": " << ec.message();
                break;
            }
            std::error_code sec;
            if (it->is_regular_file(sec) && it->path().extension() == files::kDictionaryExtension) {
                paths.push_back(it->path().string());
            }
        }
        std::sort(paths.begin(), paths.end());
        return scanDictionaries(paths);
    }

} // namespace dictstore
