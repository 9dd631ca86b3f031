#include "server/disconnect_watcher.hpp"
#include "stream/cancellation.hpp"
#include <cerrno>
#include <poll.h>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::server {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
DisconnectWatcher::DisconnectWatcher(int fd, stream::CancellationToken& cancellation, chrono::milliseconds interval) : _fd(fd), _cancellation(cancellation), _interval(interval), _stop(false), _thread()
// The constructor
{
    _thread = thread(&DisconnectWatcher::watch, this);
}
//---------------------------------------------------------------------------
DisconnectWatcher::~DisconnectWatcher()
// The destructor
{
    stop();
}
//---------------------------------------------------------------------------
void DisconnectWatcher::stop()
// Stop and join
{
    _stop = true;
    if (_thread.joinable())
        _thread.join();
}
//---------------------------------------------------------------------------
void DisconnectWatcher::watch()
// Polls for a hang up of the peer
{
    pollfd entry = {};
    entry.fd = _fd;
    // Hang ups and errors are reported without asking
    entry.events = POLLRDHUP;
    while (!_stop) {
        entry.revents = 0;
        auto result = poll(&entry, 1, static_cast<int>(_interval.count()));
        if (result < 0) {
            if (errno == EINTR)
                continue;
            return;
        }
        if (!result)
            continue;
        if (entry.revents & POLLNVAL)
            return;
        if (entry.revents & (POLLRDHUP | POLLHUP | POLLERR)) {
            _cancellation.cancel();
            return;
        }
    }
}
//---------------------------------------------------------------------------
} // namespace nodelog::server
