#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog {
namespace utils {
//---------------------------------------------------------------------------
/// A bounded multi-producer multi-consumer ring buffer
template <typename T>
class RingBuffer {
    public:
    /// A simple spin mutex
    class SpinMutex {
        std::atomic<bool> bit;

        public:
        /// The constructor
        SpinMutex() : bit() {}

        /// Lock
        void lock() {
            auto expected = false;
            while (!bit.compare_exchange_weak(expected, true, std::memory_order_acq_rel)) {
                expected = false;
            }
        }
        /// Unlock
        void unlock() { bit.store(false, std::memory_order_release); }
    };

    /// Returned by insert if the buffer is full
    static constexpr uint64_t full = ~0ull;

    private:
    /// The slots
    std::unique_ptr<T[]> _buffer;
    /// The number of slots
    uint64_t _size;
    /// The producer side, aligned to its own cache line
    struct alignas(64) {
        /// Reserved positions
        std::atomic<uint64_t> pending;
        /// Positions visible to consumers
        std::atomic<uint64_t> commited;
        /// Serializes producers
        SpinMutex mutex;
    } _insert;
    /// The consumer side, aligned to its own cache line
    struct alignas(64) {
        /// Reserved positions
        std::atomic<uint64_t> pending;
        /// Positions released back to producers
        std::atomic<uint64_t> commited;
        /// Serializes consumers
        SpinMutex mutex;
    } _seen;

    public:
    /// The constructor
    explicit RingBuffer(uint64_t size) : _buffer(new T[size]()), _size(size) {}

    /// Insert an element, returns its position or full
    uint64_t insert(T element) {
        std::unique_lock lock(_insert.mutex);
        auto seenHead = _seen.commited.load(std::memory_order_acquire);
        auto curInsert = _insert.pending.load(std::memory_order_acquire);
        if (curInsert - seenHead >= _size)
            return full;
        _insert.pending.fetch_add(1, std::memory_order_release);
        _buffer[curInsert % _size] = std::move(element);
        _insert.commited.fetch_add(1, std::memory_order_release);
        return curInsert;
    }

    /// Take the oldest element if there is one
    std::optional<T> consume() {
        std::unique_lock lock(_seen.mutex);
        auto curInsert = _insert.commited.load(std::memory_order_acquire);
        auto curSeen = _seen.pending.load(std::memory_order_acquire);
        if (curInsert <= curSeen)
            return std::nullopt;
        _seen.pending.fetch_add(1, std::memory_order_release);
        T val = std::move(_buffer[curSeen % _size]);
        _buffer[curSeen % _size] = T();
        _seen.commited.fetch_add(1, std::memory_order_release);
        return val;
    }

    /// Number of queued elements
    uint64_t size() const {
        return _insert.commited.load(std::memory_order_acquire) - _seen.commited.load(std::memory_order_acquire);
    }
    /// The number of slots
    uint64_t capacity() const { return _size; }
    /// Check if empty
    bool empty() const { return !size(); }
};
//---------------------------------------------------------------------------
} // namespace utils
} // namespace nodelog
