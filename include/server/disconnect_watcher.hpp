#pragma once
#include <atomic>
#include <chrono>
#include <thread>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog {
namespace stream {
class CancellationToken;
} // namespace stream
namespace server {
//---------------------------------------------------------------------------
/// Cancels the session of a client socket as soon as the client hangs up.
/// The socket is only polled, pending request bytes stay unread.
class DisconnectWatcher {
    /// The client socket
    int _fd;
    /// The token of the session
    stream::CancellationToken& _cancellation;
    /// The poll timeout, bounds how long stop waits
    std::chrono::milliseconds _interval;
    /// Stop watching
    std::atomic<bool> _stop;
    /// The watching thread
    std::thread _thread;

    public:
    /// Default poll timeout
    static constexpr std::chrono::milliseconds defaultInterval{50};

    /// The constructor, starts watching
    DisconnectWatcher(int fd, stream::CancellationToken& cancellation, std::chrono::milliseconds interval = defaultInterval);
    /// The destructor, stops watching
    ~DisconnectWatcher();
    /// Delete copy
    DisconnectWatcher(const DisconnectWatcher&) = delete;
    /// Delete copy assignment
    DisconnectWatcher& operator=(const DisconnectWatcher&) = delete;

    /// Stop watching and join, must happen before the socket is closed
    void stop();

    private:
    /// The poll loop
    void watch();
};
//---------------------------------------------------------------------------
} // namespace server
} // namespace nodelog
