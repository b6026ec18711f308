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
#include <mutex>
#include <stdexcept>

#include "random_access_list.h"
#include "../lru.h"

namespace dictstore {
namespace raf {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    size_t   size = 0;       // elements currently resident
};

/**
 * Memoizing decorator over a RandomAccessList.
 *
 * Bounded lists keep at most capacity() decoded elements and evict the
 * least recently used one; fully cached lists never evict and are meant
 * for small hot sections only. Either way the cache is a pure memoization:
 * the backing list is immutable, so a value decoded twice compares equal.
 *
 * Safe for concurrent readers. Decoding happens outside the lock; when two
 * readers race on the same element the first one cached wins and both get
 * equal values.
 */
template<typename T>
class CachingList : public RandomAccessList<T> {
public:
    typedef std::shared_ptr<const RandomAccessList<T>> SourcePtr;

    static std::shared_ptr<CachingList<T>> create(SourcePtr source, size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("CachingList capacity must be positive");
        }
        return std::shared_ptr<CachingList<T>>(new CachingList<T>(std::move(source), capacity));
    }

    static std::shared_ptr<CachingList<T>> createFullyCached(SourcePtr source) {
        return std::shared_ptr<CachingList<T>>(new CachingList<T>(std::move(source), 0));
    }

    size_t size() const override { return source_->size(); }

    T get(size_t i) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (T* cached = cache_.get(i)) {
                ++stats_.hits;
                return *cached;
            }
            ++stats_.misses;
        }

        T value = source_->get(i);

        std::lock_guard<std::mutex> lock(mutex_);
        if (T* cached = cache_.get(i)) {
            return *cached;
        }
        cache_.add(i, value);
        while (capacity_ != 0 && cache_.size() > capacity_) {
            cache_.removeOne();
            ++stats_.evictions;
        }
        return value;
    }

    bool isFullyCached() const { return capacity_ == 0; }

    // 0 for fully cached lists
    size_t capacity() const { return capacity_; }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s = stats_;
        s.size = cache_.size();
        return s;
    }

private:
    CachingList(SourcePtr source, size_t capacity)
        : source_(std::move(source)), capacity_(capacity) {
        if (!source_) {
            throw std::invalid_argument("CachingList requires a source list");
        }
    }

    SourcePtr source_;
    size_t capacity_;

    mutable std::mutex mutex_;
    mutable LRUCache<T, size_t> cache_;
    mutable CacheStats stats_;
};

} // namespace raf
} // namespace dictstore
