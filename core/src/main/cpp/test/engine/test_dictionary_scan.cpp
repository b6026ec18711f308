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

#include <gtest/gtest.h>
#include "engine/dictionary.h"
#include "engine/dictionary_info.h"
#include "util/log.h"
#include "config.h"
#include "../test_helpers.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

using namespace dictstore;

namespace {

class WarningCounter : public Tee {
public:
    void write(LogLevel level, const std::string& str) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LOG_WARNING) {
            warnings_.push_back(str);
        }
    }

    std::vector<std::string> warnings() {
        std::lock_guard<std::mutex> lock(mutex_);
        return warnings_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> warnings_;
};

}

class DictionaryScanTest : public ::testing::Test {
protected:
    std::string dir;
    std::string valid, truncated, badVersion;
    WarningCounter tee;
    int original_log_level;

    void SetUp() override {
        original_log_level = logLevel;
        logLevel = LOG_WARNING;
        Logger::setTee(&tee);

        dir = test::create_temp_dir("dictstore_scan");
        valid = dir + "/a_valid" + files::kDictionaryExtension;
        truncated = dir + "/b_truncated" + files::kDictionaryExtension;
        badVersion = dir + "/c_future" + files::kDictionaryExtension;

        auto dict = test::make_sample_dictionary();
        dict->write(valid);
        dict->write(truncated);
        test::truncate_file(truncated, std::filesystem::file_size(truncated) - 5);

        std::vector<uint8_t> bytes = test::to_bytes(*dict);
        bytes[3] = static_cast<uint8_t>(format::kCurrentVersion + 1);
        test::write_file(badVersion, bytes);
    }

    void TearDown() override {
        Logger::setTee(nullptr);
        logLevel = original_log_level;
        std::filesystem::remove_all(dir);
    }
};

TEST_F(DictionaryScanTest, OnlyReadableDictionariesAreReported) {
    std::vector<DictionaryInfo> infos;
    ASSERT_NO_THROW(infos = scanDictionaries({valid, truncated, badVersion}));

    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].uncompressedFilename, "a_valid.quickdic");
    EXPECT_EQ(infos[0].dictInfo, "sample EN-DE dictionary");
    EXPECT_EQ(infos[0].indexInfos.size(), 2u);

    // One warning per skipped file
    auto warnings = tee.warnings();
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("b_truncated"), std::string::npos);
    EXPECT_NE(warnings[0].find("corruption"), std::string::npos);
    EXPECT_NE(warnings[1].find("c_future"), std::string::npos);
    EXPECT_NE(warnings[1].find("unsupported-version"), std::string::npos);
}

TEST_F(DictionaryScanTest, MissingFilesAreSkipped) {
    auto infos = scanDictionaries({dir + "/nope.quickdic", valid});
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].uncompressedFilename, "a_valid.quickdic");
}

TEST_F(DictionaryScanTest, ScanDirectory) {
    // Files without the dictionary extension are not considered
    test::write_file(dir + "/notes.txt", {'h', 'i'});
    std::filesystem::create_directories(dir + "/sub" + files::kDictionaryExtension);

    auto infos = scanDirectory(dir);
    ASSERT_EQ(infos.size(), 1u);
    EXPECT_EQ(infos[0].uncompressedBytes, static_cast<int64_t>(std::filesystem::file_size(valid)));

    EXPECT_TRUE(scanDirectory(dir + "/does-not-exist").empty());
}

TEST(DictionaryInfoTest, CatalogLine) {
    DictionaryInfo info;
    info.uncompressedFilename = "EN-DE.quickdic";
    info.uncompressedBytes = 123456;
    info.creationMillis = 1700000000000LL;
    info.dictInfo = "line one\nline\ttwo \\ end";
    info.indexInfos.push_back(IndexInfo{"en", "English", 300, 250});
    info.indexInfos.push_back(IndexInfo{"de", "German", 200, 200});

    std::string line = info.toCatalogLine();
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(line.find('\t'), std::string::npos);
    EXPECT_NE(line.find("\"file\":\"EN-DE.quickdic\""), std::string::npos);

    auto parsed = DictionaryInfo::fromCatalogLine(line);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, info);
}

TEST(DictionaryInfoTest, MalformedCatalogLines) {
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine("").has_value());
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine("{\"file\":\"a\"").has_value());
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine("[1,2,3]").has_value());
    // missing indices
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\"}").has_value());
    // wrong types
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":\"1\",\"created\":2,\"info\":\"x\",\"indices\":[]}").has_value());
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":[7]}").has_value());
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":{}}").has_value());

    EXPECT_TRUE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":[]}").has_value());
}

TEST(DictionaryInfoTest, CatalogLineRejectsOversizedCounts) {
    // a huge index count with nothing behind it
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine("a\t1\t2\t4611686018427387904\tinfo").has_value());
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":4611686018427387904}").has_value());

    // token counts must fit in 32 bits
    EXPECT_FALSE(DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":"
        "[{\"short\":\"en\",\"long\":\"English\",\"tokens\":4294967296,\"main_tokens\":1}]}").has_value());

    auto ok = DictionaryInfo::fromCatalogLine(
        "{\"file\":\"a\",\"bytes\":1,\"created\":2,\"info\":\"x\",\"indices\":"
        "[{\"short\":\"en\",\"long\":\"English\",\"tokens\":3,\"main_tokens\":2}]}");
    ASSERT_TRUE(ok.has_value());
    ASSERT_EQ(ok->indexInfos.size(), 1u);
    EXPECT_EQ(ok->indexInfos[0], (IndexInfo{"en", "English", 3, 2}));
}
