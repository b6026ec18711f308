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
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "engine/dictionary.h"
#include "raf/data_sink.h"
#include "raf/data_source.h"

namespace dictstore { namespace test {

// Create a unique temporary directory
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    // Generate random suffix
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Corrupt a file at a specific offset
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::vector<uint8_t> garbage(len, 0xFF);
    file.write(reinterpret_cast<char*>(garbage.data()), len);
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

inline std::shared_ptr<raf::MemorySource> to_source(const raf::MemorySink& sink) {
    return sink.toSource();
}

inline std::shared_ptr<raf::MemorySource> to_source(std::vector<uint8_t> bytes) {
    return std::make_shared<raf::MemorySource>(std::move(bytes));
}

inline std::vector<uint8_t> to_bytes(const Dictionary& dict) {
    raf::MemorySink sink;
    dict.write(sink);
    return sink.bytes();
}

/**
 * Small dictionary touching every section:
 *   sources  "wiktionary" (2), "manual" (1)
 *   pairs    run/laufen, walk/gehen (+ go/gehen)
 *   text     "irregular verb"
 *   html     "laufen" page
 *   indices  "en" (go, run, walk), "de" (gehen, laufen)
 */
inline std::unique_ptr<Dictionary> make_sample_dictionary() {
    auto dict = std::make_unique<Dictionary>("sample EN-DE dictionary");

    auto wikt = dict->addSource("wiktionary", 2);
    auto manual = dict->addSource("manual", 1);
    const int16_t wiktIdx = static_cast<int16_t>(wikt->index());
    const int16_t manualIdx = static_cast<int16_t>(manual->index());

    dict->addPairEntry(wiktIdx, {Pair("run", "laufen")});
    dict->addPairEntry(wiktIdx, {Pair("walk", "gehen"), Pair("go", "gehen")});
    dict->addTextEntry(manualIdx, "irregular verb");
    auto page = dict->addHtmlEntry(manualIdx, "laufen", "<p>laufen, lief, gelaufen</p>");

    auto en = dict->addIndex("en", "English", "en", false);
    auto go = std::make_shared<IndexEntry>("go");
    go->addRef(EntryKind::PAIR, 1);
    auto run = std::make_shared<IndexEntry>("run");
    run->addRef(EntryKind::PAIR, 0);
    run->addRef(EntryKind::TEXT, 0);
    auto walk = std::make_shared<IndexEntry>("walk");
    walk->addRef(EntryKind::PAIR, 1);
    en->addIndexEntry(go);
    en->addIndexEntry(run);
    en->addIndexEntry(walk);
    en->setMainTokenCount(2);

    auto de = dict->addIndex("de", "German", "de", true);
    auto gehen = std::make_shared<IndexEntry>("gehen");
    gehen->addRef(EntryKind::PAIR, 1);
    auto laufen = std::make_shared<IndexEntry>("laufen");
    laufen->addRef(EntryKind::PAIR, 0);
    laufen->addHtmlEntry(page);
    de->addIndexEntry(gehen);
    de->addIndexEntry(laufen);

    return dict;
}

}} // namespace dictstore::test
