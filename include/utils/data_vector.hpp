#pragma once
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::utils {
//---------------------------------------------------------------------------
/// Growable buffer for raw wire data that never initializes on append
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    constexpr DataVector() : _capacity(0), _size(0) {}

    /// Constructor with size
    explicit DataVector(uint64_t size) : _capacity(0), _size(0) {
        resize(size);
    }

    /// Constructor from a range
    DataVector(const T* start, const T* end) : _capacity(0), _size(0) {
        assert(end - start >= 0);
        append(start, static_cast<uint64_t>(end - start));
    }

    /// Get the data
    [[nodiscard]] T* data() { return _data.get(); }
    /// Get the data
    [[nodiscard]] const T* cdata() const { return _data.get(); }
    /// Get the size
    [[nodiscard]] uint64_t size() const { return _size; }
    /// Get the capacity
    [[nodiscard]] uint64_t capacity() const { return _capacity; }
    /// Empty?
    [[nodiscard]] bool empty() const { return !_size; }

    /// Clear the size, keeps the capacity
    void clear() { _size = 0; }

    /// Increase the capacity
    void reserve(uint64_t cap) {
        if (_capacity >= cap)
            return;
        auto swap = std::unique_ptr<T[]>(new T[cap]);
        if (_size)
            std::memcpy(swap.get(), _data.get(), _size * sizeof(T));
        _data.swap(swap);
        _capacity = cap;
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity)
            reserve(size);
        _size = size;
    }

    /// Append elements, grows by at least half of the current capacity
    void append(const T* ptr, uint64_t length) {
        if (_size + length > _capacity)
            reserve(std::max(_size + length, _capacity + _capacity / 2));
        if (length)
            std::memcpy(_data.get() + _size, ptr, length * sizeof(T));
        _size += length;
    }

    /// View as characters
    [[nodiscard]] std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(_data.get()), _size * sizeof(T));
    }
};
//---------------------------------------------------------------------------
} // namespace nodelog::utils
