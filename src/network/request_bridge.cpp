#include "network/request_bridge.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
RequestBridge::RequestBridge(uint64_t capacity) : _submissions(capacity), _cv(), _mutex()
// The constructor
{
}
//---------------------------------------------------------------------------
shared_ptr<RemoteRequest> RequestBridge::submit(string target)
// Adds a request to the submission queue
{
    auto request = make_shared<RemoteRequest>(move(target));
    if (_submissions.insert(request) == utils::RingBuffer<shared_ptr<RemoteRequest>>::full)
        return nullptr;
    {
        // Pairs with the predicate check in consume
        lock_guard<mutex> lock(_mutex);
    }
    _cv.notify_one();
    return request;
}
//---------------------------------------------------------------------------
shared_ptr<RemoteRequest> RequestBridge::consume()
// Takes the next request
{
    auto val = _submissions.consume();
    if (val.has_value())
        return move(*val);
    return nullptr;
}
//---------------------------------------------------------------------------
shared_ptr<RemoteRequest> RequestBridge::consume(chrono::milliseconds timeout)
// Takes the next request, waits for one
{
    if (auto request = consume())
        return request;
    unique_lock<mutex> lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return !_submissions.empty(); });
    lock.unlock();
    return consume();
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
