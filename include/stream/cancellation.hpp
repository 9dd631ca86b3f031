#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::stream {
//---------------------------------------------------------------------------
/// The cancellation signal of a download or view session.
/// Once cancelled it stays cancelled.
class CancellationToken {
    /// The flag
    std::atomic<bool> _cancelled;
    /// Mutex for the condition variable
    std::mutex _mutex;
    /// Wakes sleeping pollers
    std::condition_variable _cv;

    public:
    /// The constructor
    CancellationToken() : _cancelled(false), _mutex(), _cv() {}

    /// Cancel and wake all waiters
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _cancelled.store(true, std::memory_order_release);
        }
        _cv.notify_all();
    }
    /// Is the session cancelled
    [[nodiscard]] bool cancelled() const { return _cancelled.load(std::memory_order_acquire); }
    /// Sleep for the duration unless cancelled earlier, returns true if cancelled
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, duration, [this] { return cancelled(); });
    }
};
//---------------------------------------------------------------------------
} // namespace nodelog::stream
