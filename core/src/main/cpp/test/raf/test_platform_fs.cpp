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
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <vector>
#include "raf/platform_fs.h"
#include "test_helpers.h"

using namespace dictstore::raf;

class PlatformFSTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = dictstore::test::create_temp_dir("dictstore_platform_fs");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string createFile(const std::string& name, size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; i++) {
            data[i] = static_cast<uint8_t>(i % 251);
        }
        std::string path = test_dir + "/" + name;
        dictstore::test::write_file(path, data);
        return path;
    }
};

TEST_F(PlatformFSTest, MapReadOnlyWholeFile) {
    std::string path = createFile("dict.quickdic", 10000);

    MappedRegion region;
    FSResult result = PlatformFS::map_readonly(path, AccessPattern::Random, &region);
    ASSERT_TRUE(result.ok) << std::strerror(result.err);
    ASSERT_NE(region.addr, nullptr);
    EXPECT_EQ(region.size, 10000u);
    EXPECT_GE(region.file_handle, 0);

    const uint8_t* bytes = static_cast<const uint8_t*>(region.addr);
    EXPECT_EQ(bytes[0], 0);
    EXPECT_EQ(bytes[9999], 9999 % 251);

    EXPECT_TRUE(PlatformFS::unmap(region).ok);
}

TEST_F(PlatformFSTest, SequentialPatternPrefaults) {
    std::string path = createFile("scan.quickdic", 3 * 4096 + 7);

    MappedRegion region;
    ASSERT_TRUE(PlatformFS::map_readonly(path, AccessPattern::Sequential, &region).ok);
    EXPECT_EQ(region.size, 3u * 4096 + 7);

    const uint8_t* bytes = static_cast<const uint8_t*>(region.addr);
    uint64_t sum = 0;
    for (size_t i = 0; i < region.size; i++) {
        sum += bytes[i];
    }
    EXPECT_GT(sum, 0u);
    EXPECT_TRUE(PlatformFS::unmap(region).ok);
}

TEST_F(PlatformFSTest, EmptyFileMapsToNullRegion) {
    std::string path = createFile("empty.quickdic", 0);

    MappedRegion region;
    ASSERT_TRUE(PlatformFS::map_readonly(path, AccessPattern::Random, &region).ok);
    EXPECT_EQ(region.addr, nullptr);
    EXPECT_EQ(region.size, 0u);
    EXPECT_TRUE(PlatformFS::unmap(region).ok);
}

TEST_F(PlatformFSTest, MissingFileReportsErrno) {
    MappedRegion region;
    FSResult result = PlatformFS::map_readonly(test_dir + "/nope.quickdic", AccessPattern::Random, &region);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.err, ENOENT);
}

TEST_F(PlatformFSTest, DirectoryIsRejected) {
    MappedRegion region;
    FSResult result = PlatformFS::map_readonly(test_dir, AccessPattern::Random, &region);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.err, EISDIR);
}

TEST_F(PlatformFSTest, AtomicReplaceSwapsContents) {
    std::string target = createFile("dict.quickdic", 16);
    std::string tmp = createFile("dict.quickdic.tmp", 32);

    FSResult result = PlatformFS::atomic_replace(tmp, target);
    ASSERT_TRUE(result.ok) << std::strerror(result.err);

    EXPECT_FALSE(std::filesystem::exists(tmp));
    EXPECT_EQ(std::filesystem::file_size(target), 32u);
}

TEST_F(PlatformFSTest, AtomicReplaceMissingSource) {
    std::string target = createFile("dict.quickdic", 16);
    FSResult result = PlatformFS::atomic_replace(test_dir + "/missing.tmp", target);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.err, ENOENT);
    EXPECT_EQ(std::filesystem::file_size(target), 16u);
}

TEST_F(PlatformFSTest, FsyncDirectory) {
    EXPECT_TRUE(PlatformFS::fsync_directory(test_dir).ok);
    EXPECT_FALSE(PlatformFS::fsync_directory(test_dir + "/missing").ok);
}
