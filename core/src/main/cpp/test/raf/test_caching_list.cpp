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
#include "raf/caching_list.h"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace dictstore;
using namespace dictstore::raf;

namespace {

typedef std::shared_ptr<const std::string> StringPtr;

// Decodes "value<i>" on every call and counts the calls
class CountingList : public RandomAccessList<StringPtr> {
public:
    explicit CountingList(size_t n) : n_(n), decodes_(0) {}

    size_t size() const override { return n_; }

    StringPtr get(size_t i) const override {
        checkIndex(i);
        decodes_.fetch_add(1);
        return std::make_shared<const std::string>("value" + std::to_string(i));
    }

    size_t decodes() const { return decodes_.load(); }

private:
    size_t n_;
    mutable std::atomic<size_t> decodes_;
};

}

class CachingListTest : public ::testing::Test {
protected:
    std::shared_ptr<CountingList> backing = std::make_shared<CountingList>(100);
};

TEST_F(CachingListTest, HitsDoNotDecodeAgain) {
    auto list = CachingList<StringPtr>::create(backing, 10);
    EXPECT_EQ(list->size(), 100u);
    EXPECT_EQ(*list->get(3), "value3");
    EXPECT_EQ(*list->get(3), "value3");
    EXPECT_EQ(*list->get(4), "value4");

    EXPECT_EQ(backing->decodes(), 2u);
    CacheStats s = list->stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 2u);
    EXPECT_EQ(s.evictions, 0u);
    EXPECT_EQ(s.size, 2u);
}

TEST_F(CachingListTest, EvictsLeastRecentlyUsed) {
    auto list = CachingList<StringPtr>::create(backing, 2);
    list->get(0);
    list->get(1);
    list->get(0);       // 1 is now least recently used
    list->get(2);       // evicts 1

    CacheStats s = list->stats();
    EXPECT_EQ(s.evictions, 1u);
    EXPECT_EQ(s.size, 2u);

    size_t before = backing->decodes();
    list->get(0);
    EXPECT_EQ(backing->decodes(), before);
    list->get(1);
    EXPECT_EQ(backing->decodes(), before + 1);
}

TEST_F(CachingListTest, NeverExceedsCapacity) {
    auto list = CachingList<StringPtr>::create(backing, 16);
    for (size_t i = 0; i < 100; i++) {
        EXPECT_EQ(*list->get(i), "value" + std::to_string(i));
        EXPECT_LE(list->stats().size, 16u);
    }
    EXPECT_EQ(list->stats().evictions, 100u - 16u);
}

TEST_F(CachingListTest, FullyCachedNeverEvicts) {
    auto list = CachingList<StringPtr>::createFullyCached(backing);
    EXPECT_TRUE(list->isFullyCached());
    EXPECT_EQ(list->capacity(), 0u);

    for (int round = 0; round < 3; round++) {
        for (size_t i = 0; i < 100; i++) {
            list->get(i);
        }
    }
    EXPECT_EQ(backing->decodes(), 100u);
    EXPECT_EQ(list->stats().evictions, 0u);
    EXPECT_EQ(list->stats().size, 100u);
}

TEST_F(CachingListTest, CachedValueIsTheSameObject) {
    auto list = CachingList<StringPtr>::create(backing, 4);
    StringPtr a = list->get(7);
    StringPtr b = list->get(7);
    EXPECT_EQ(a.get(), b.get());
}

TEST_F(CachingListTest, ClearDropsEntries) {
    auto list = CachingList<StringPtr>::create(backing, 4);
    list->get(1);
    list->clear();
    EXPECT_EQ(list->stats().size, 0u);
    list->get(1);
    EXPECT_EQ(backing->decodes(), 2u);
}

TEST_F(CachingListTest, InvalidArguments) {
    EXPECT_THROW(CachingList<StringPtr>::create(backing, 0), std::invalid_argument);
    EXPECT_THROW(CachingList<StringPtr>::create(nullptr, 4), std::invalid_argument);
}

TEST_F(CachingListTest, OutOfRangeIsNotCached) {
    auto list = CachingList<StringPtr>::create(backing, 4);
    EXPECT_THROW(list->get(100), std::out_of_range);
    EXPECT_EQ(list->stats().size, 0u);
}

TEST_F(CachingListTest, ConcurrentReadersBounded) {
    auto list = CachingList<StringPtr>::create(backing, 32);
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int round = 0; round < 20; round++) {
                for (size_t i = 0; i < 100; i++) {
                    size_t idx = (i * 7 + t) % 100;
                    if (*list->get(idx) != "value" + std::to_string(idx)) {
                        mismatches++;
                    }
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    CacheStats s = list->stats();
    EXPECT_LE(s.size, 32u);
    EXPECT_EQ(s.hits + s.misses, 8u * 20u * 100u);
}

TEST_F(CachingListTest, ConcurrentReadersAgreeOnFirstCachedValue) {
    auto list = CachingList<StringPtr>::createFullyCached(backing);
    const int num_threads = 8;
    std::vector<std::vector<StringPtr>> seen(num_threads);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t] {
            for (size_t i = 0; i < 100; i++) {
                seen[t].push_back(list->get(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    // Every reader got the object that won the race into the cache
    for (size_t i = 0; i < 100; i++) {
        StringPtr cached = list->get(i);
        for (int t = 0; t < num_threads; t++) {
            EXPECT_EQ(seen[t][i].get(), cached.get()) << "index " << i << " thread " << t;
        }
    }
    EXPECT_EQ(list->stats().size, 100u);
}
