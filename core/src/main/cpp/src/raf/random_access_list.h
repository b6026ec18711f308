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

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dictstore {
namespace raf {

/**
 * Read interface shared by every dictionary section, whether it lives in
 * memory (build path) or is decoded lazily from a file (read path).
 *
 * get() returns by value; section element types are shared_ptr to const
 * records so a returned value is cheap to copy and never changes.
 */
template<typename T>
class RandomAccessList {
public:
    typedef T value_type;

    virtual ~RandomAccessList() = default;

    virtual size_t size() const = 0;

    // @throws std::out_of_range if i >= size()
    virtual T get(size_t i) const = 0;

    bool empty() const { return size() == 0; }

protected:
    void checkIndex(size_t i) const {
        if (i >= size()) {
            throw std::out_of_range("index " + std::to_string(i) +
                                    " out of range for list of size " + std::to_string(size()));
        }
    }
};

/**
 * In-memory list used while a dictionary is being built.
 */
template<typename T>
class VectorList : public RandomAccessList<T> {
public:
    VectorList() = default;
    explicit VectorList(std::vector<T> values) : values_(std::move(values)) {}

    size_t size() const override { return values_.size(); }

    T get(size_t i) const override {
        this->checkIndex(i);
        return values_[i];
    }

    void add(T value) { values_.push_back(std::move(value)); }

    const std::vector<T>& values() const { return values_; }

private:
    std::vector<T> values_;
};

/**
 * A section that holds no elements, e.g. one absent from an older file.
 */
template<typename T>
class EmptyList : public RandomAccessList<T> {
public:
    size_t size() const override { return 0; }

    T get(size_t i) const override {
        this->checkIndex(i);
        return T();
    }
};

} // namespace raf
} // namespace dictstore
