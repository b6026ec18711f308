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
#include "util/endian.hpp"
#include <cstdint>
#include <cstring>
#include <vector>

using namespace dictstore::util;

class EndianTest : public ::testing::Test {
protected:
    // Test data buffers
    uint8_t buffer[16];

    void SetUp() override {
        std::memset(buffer, 0, sizeof(buffer));
    }
};

// Test 16-bit conversions
TEST_F(EndianTest, Store16BitBigEndian) {
    uint16_t value = 0x1234;
    store_be16(buffer, value);

    // Big-endian format: most significant byte first
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[1], 0x34);
}

TEST_F(EndianTest, Load16BitBigEndian) {
    buffer[0] = 0x12;
    buffer[1] = 0x34;

    EXPECT_EQ(load_be16(buffer), 0x1234);
}

// Test 32-bit conversions
TEST_F(EndianTest, Store32BitBigEndian) {
    store_be32(buffer, 0x12345678);

    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[1], 0x34);
    EXPECT_EQ(buffer[2], 0x56);
    EXPECT_EQ(buffer[3], 0x78);
}

TEST_F(EndianTest, Load32BitBigEndian) {
    buffer[0] = 0x78;
    buffer[1] = 0x56;
    buffer[2] = 0x34;
    buffer[3] = 0x12;

    EXPECT_EQ(load_be32(buffer), 0x78563412u);
}

// Test 64-bit conversions
TEST_F(EndianTest, Store64BitBigEndian) {
    store_be64(buffer, 0x123456789ABCDEF0ULL);

    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[1], 0x34);
    EXPECT_EQ(buffer[2], 0x56);
    EXPECT_EQ(buffer[3], 0x78);
    EXPECT_EQ(buffer[4], 0x9A);
    EXPECT_EQ(buffer[5], 0xBC);
    EXPECT_EQ(buffer[6], 0xDE);
    EXPECT_EQ(buffer[7], 0xF0);
}

TEST_F(EndianTest, RoundTrip64Bit) {
    std::vector<uint64_t> test_values = {
        0x0000000000000000ULL, 0x0000000000000001ULL, 0x00000000FFFFFFFFULL,
        0xFFFFFFFF00000000ULL, 0xFFFFFFFFFFFFFFFFULL, 0x8000000000000000ULL,
        0x7FFFFFFFFFFFFFFFULL
    };

    for (uint64_t val : test_values) {
        store_be64(buffer, val);
        EXPECT_EQ(load_be64(buffer), val) << "Failed for value: 0x" << std::hex << val;
    }
}

// Signed helpers keep two's complement bit patterns
TEST_F(EndianTest, SignedValues) {
    store_be_i16(buffer, -1);
    EXPECT_EQ(buffer[0], 0xFF);
    EXPECT_EQ(buffer[1], 0xFF);
    EXPECT_EQ(load_be_i16(buffer), -1);

    store_be_i32(buffer, -2);
    EXPECT_EQ(buffer[0], 0xFF);
    EXPECT_EQ(buffer[3], 0xFE);
    EXPECT_EQ(load_be_i32(buffer), -2);

    store_be_i64(buffer, INT64_MIN);
    EXPECT_EQ(buffer[0], 0x80);
    EXPECT_EQ(buffer[7], 0x00);
    EXPECT_EQ(load_be_i64(buffer), INT64_MIN);
}

// Unaligned access must work, offset tables are packed after a 4 byte count
TEST_F(EndianTest, UnalignedAccess) {
    store_be64(buffer + 4, 0x0102030405060708ULL);
    EXPECT_EQ(buffer[4], 0x01);
    EXPECT_EQ(buffer[11], 0x08);
    EXPECT_EQ(load_be64(buffer + 4), 0x0102030405060708ULL);

    store_be32(buffer + 1, 0xCAFEBABE);
    EXPECT_EQ(load_be32(buffer + 1), 0xCAFEBABEu);
}
