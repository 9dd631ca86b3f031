#include "network/poll_socket.hpp"
#include <cerrno>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
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
using namespace std;
//---------------------------------------------------------------------------
chrono::time_point<chrono::steady_clock> PollSocket::deadline(const Request& req)
// The deadline of a request
{
    return req.timeout.has_value() ? chrono::steady_clock::now() + *req.timeout : chrono::time_point<chrono::steady_clock>::max();
}
//---------------------------------------------------------------------------
bool PollSocket::send(Request& req, int32_t msg_flags)
// Prepare a submission send
{
    if (req.event != EventType::write) return false;
    enqueue(req.fd, POLLOUT, RequestInfo{.request = &req, .timeout = deadline(req), .flags = msg_flags});
    return true;
}
//---------------------------------------------------------------------------
bool PollSocket::recv(Request& req, int32_t msg_flags)
// Prepare a submission recv
{
    if (req.event != EventType::read) return false;
    enqueue(req.fd, POLLIN, RequestInfo{.request = &req, .timeout = deadline(req), .flags = msg_flags});
    return true;
}
//---------------------------------------------------------------------------
PollSocket::Request* PollSocket::complete()
// Get a completion event and mark it as seen; return the Request
{
    if (_ready.empty() && _pollfds.empty())
        throw runtime_error("No outstanding socket requests!");
    while (_ready.empty()) {
        // Actively poll here as well to match io_uring because we have to check for new arrivals
        if (_readyFds <= 0) {
            // Poll wait up to 1ms
            _readyFds = ::poll(_pollfds.data(), _pollfds.size(), 1);
        }

        // Check for completed events, timeouts are checked even without events
        auto currentTime = chrono::steady_clock::now();
        for (auto pit = _pollfds.begin(); pit != _pollfds.end();) {
            auto it = _fdToRequest.find(pit->fd);
            if (it == _fdToRequest.end())
                throw runtime_error("couldn't find request");
            auto& req = it->second;
            if (pit->revents & (POLLIN | POLLOUT)) {
                // Active pollfd
                if (req.request->event == EventType::read) {
                    req.request->length = ::recv(it->first, req.request->data.data, static_cast<size_t>(req.request->length), req.flags | MSG_DONTWAIT);
                } else {
                    req.request->length = ::send(it->first, req.request->data.cdata, static_cast<size_t>(req.request->length), req.flags | MSG_DONTWAIT | MSG_NOSIGNAL);
                }

                // Simulate io uring by returning -errno
                if (req.request->length == -1)
                    req.request->length = -errno;
            } else if (pit->revents & (POLLERR | POLLHUP | POLLNVAL)) {
                // Simulate io uring by returning -error
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(it->first, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err) {
                    req.request->length = -err;
                } else if (pit->revents & POLLHUP) {
                    // Orderly shutdown of the peer
                    req.request->length = 0;
                } else {
                    req.request->length = -EIO;
                }
            } else if (req.timeout < currentTime) {
                // Implement timeout
                req.request->length = -ETIMEDOUT;
            } else {
                ++pit;
                continue;
            }
            _ready.push_back(req.request);
            _fdToRequest.erase(it);
            pit = _pollfds.erase(pit);
        }
        _readyFds = 0;
    }
    auto req = _ready.back();
    _ready.pop_back();
    return req;
}
//---------------------------------------------------------------------------
void PollSocket::enqueue(int fd, short events, RequestInfo req)
// Implement the fd into our submission queue
{
    _pollfds.push_back(pollfd{.fd = fd, .events = events, .revents = 0});
    _fdToRequest.emplace(fd, req);
    ++_submitted;
}
//---------------------------------------------------------------------------
int32_t PollSocket::submit()
// Submit requests
{
    auto sub = _submitted;
    _submitted = 0;
    // Do the poll here, but don't wait or work on the results
    _readyFds = ::poll(_pollfds.data(), _pollfds.size(), 0);
    return sub;
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
