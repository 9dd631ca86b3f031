#pragma once
#include "network/config.hpp"
#include "network/remote_request.hpp"
#include "utils/ring_buffer.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog {
namespace network {
//---------------------------------------------------------------------------
/// Hands requests from consumers to a dispatcher.
/// Shared state plumbing only: no retries, no parsing.
class RequestBridge {
    /// The submission ringbuffer
    utils::RingBuffer<std::shared_ptr<RemoteRequest>> _submissions;
    /// Condition variable to stop wasting wait cycles of idle dispatchers
    std::condition_variable _cv;
    /// Mutex for condition variable
    std::mutex _mutex;

    public:
    /// The constructor
    explicit RequestBridge(uint64_t capacity = Config::defaultSubmissionCapacity);

    /// Creates and enqueues a request, nullptr if the queue is full
    [[nodiscard]] std::shared_ptr<RemoteRequest> submit(std::string target);
    /// Takes the next submitted request, nullptr if none
    [[nodiscard]] std::shared_ptr<RemoteRequest> consume();
    /// Takes the next submitted request, waits up to timeout for one
    [[nodiscard]] std::shared_ptr<RemoteRequest> consume(std::chrono::milliseconds timeout);
    /// Number of requests not yet taken by a dispatcher
    [[nodiscard]] uint64_t pending() const { return _submissions.size(); }

    /// Consistent copy of the request state
    [[nodiscard]] static RequestSnapshot snapshot(const RemoteRequest& request) { return request.snapshot(); }
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
