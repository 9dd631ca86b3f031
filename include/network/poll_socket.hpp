#pragma once
#include "network/socket.hpp"
#include <chrono>
#include <unordered_map>
#include <vector>
#include <sys/poll.h>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::network {
//---------------------------------------------------------------------------
/// This class exchanges messages with the poll interface acting as a fallback.
/// It matches the IOUringSockets behavior: results are lengths or -errno.
class PollSocket : public Socket {
    private:
    /// The request infos with timeout and message flags
    struct RequestInfo {
        /// The real request
        Request* request;
        /// The deadline
        std::chrono::time_point<std::chrono::steady_clock> timeout;
        /// The flags
        int32_t flags;
    };
    /// The ready request vector
    std::vector<Request*> _ready;
    /// The fd to request mapping
    std::unordered_map<int, RequestInfo> _fdToRequest;
    /// The pollfd vector
    std::vector<pollfd> _pollfds;
    /// The submitted requests since last invocation
    int32_t _submitted = 0;
    /// The number of fds with events from the last poll
    int _readyFds = 0;

    public:
    /// The destructor
    ~PollSocket() noexcept override = default;

    /// Prepare a submission send
    bool send(Request& req, int32_t msg_flags = 0) override;
    /// Prepare a submission recv
    bool recv(Request& req, int32_t msg_flags = 0) override;

    /// Get a completion event and mark it as seen; return the Request
    [[nodiscard]] Request* complete() override;
    /// Submit the request to the kernel
    int32_t submit() override;

    private:
    /// Implement the fd into our submission queue
    void enqueue(int fd, short events, RequestInfo req);
    /// The deadline of a request
    static std::chrono::time_point<std::chrono::steady_clock> deadline(const Request& req);
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
