#include "network/node_dispatcher.hpp"
#include "network/remote_request.hpp"
#include "network/request_bridge.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
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
NodeDispatcher::NodeDispatcher(RequestBridge& bridge, TransportFactory factory, Config config, ResponseCheck check) : _bridge(bridge), _factory(move(factory)), _check(move(check)), _config(config), _threads(), _running(false)
// The constructor
{
}
//---------------------------------------------------------------------------
NodeDispatcher::~NodeDispatcher()
// The destructor
{
    stop();
}
//---------------------------------------------------------------------------
void NodeDispatcher::start()
// Start the worker threads
{
    if (_running.exchange(true))
        return;
    auto threads = _config.dispatcherThreads ? _config.dispatcherThreads : 1u;
    for (auto i = 0u; i < threads; i++)
        _threads.emplace_back(&NodeDispatcher::work, this);
}
//---------------------------------------------------------------------------
void NodeDispatcher::stop()
// Stop and join the worker threads
{
    _running = false;
    for (auto& thread : _threads)
        if (thread.joinable())
            thread.join();
    _threads.clear();
}
//---------------------------------------------------------------------------
void NodeDispatcher::process(RemoteRequest& request, NodeTransport& transport) const
// Run all attempts of a request
{
    auto ceiling = _config.retryCeiling ? _config.retryCeiling : 1u;
    for (auto attempt = 1u; attempt <= ceiling; attempt++) {
        RequestOutcome outcome;
        try {
            outcome = transport.execute(request.getTarget());
        } catch (const exception& e) {
            outcome = RequestOutcome::failure(e.what());
        }
        outcome.attempt = attempt;
        auto error = outcome.error;
        // A malformed answer is published as it is and attempted again
        if (error.empty() && _check)
            error = _check(request.getTarget(), outcome.payload);
        if (!error.empty())
            cerr << "request " << request.getTarget() << " failed in attempt " << attempt << "/" << ceiling << ": " << error << endl;
        request.publish(move(outcome));
        if (error.empty())
            return;
    }
}
//---------------------------------------------------------------------------
void NodeDispatcher::work()
// The worker loop
{
    unique_ptr<NodeTransport> transport;
    try {
        transport = _factory();
    } catch (const exception& e) {
        cerr << "dispatcher could not create a node transport: " << e.what() << endl;
    }
    while (_running) {
        auto request = _bridge.consume(chrono::milliseconds(100));
        if (!request)
            continue;
        if (!transport) {
            request->publish(RequestOutcome::failure("no node transport available", _config.retryCeiling));
            continue;
        }
        process(*request, *transport);
    }
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
