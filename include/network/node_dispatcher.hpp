#pragma once
#include "network/config.hpp"
#include "network/node_client.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
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
class RemoteRequest;
class RequestBridge;
//---------------------------------------------------------------------------
/// Drains the bridge with worker threads and performs the remote calls.
/// Every request gets up to retryCeiling immediate attempts; each attempt
/// publishes its outcome, the first accepted success ends the request.
class NodeDispatcher {
    public:
    /// Creates one transport per worker thread
    using TransportFactory = std::function<std::unique_ptr<NodeTransport>()>;
    /// Returns why a successful response has to be attempted again, empty to accept it
    using ResponseCheck = std::function<std::string(const std::string& target, const std::shared_ptr<const std::string>& payload)>;

    private:
    /// The bridge
    RequestBridge& _bridge;
    /// The transport factory
    TransportFactory _factory;
    /// The response check, may be empty
    ResponseCheck _check;
    /// The config
    Config _config;
    /// The workers
    std::vector<std::thread> _threads;
    /// Keep running
    std::atomic<bool> _running;

    public:
    /// The constructor
    NodeDispatcher(RequestBridge& bridge, TransportFactory factory, Config config = {}, ResponseCheck check = {});
    /// The destructor, stops the workers
    ~NodeDispatcher();

    /// Start the worker threads
    void start();
    /// Stop and join the worker threads
    void stop();
    /// Is the dispatcher running
    [[nodiscard]] bool running() const { return _running; }

    /// Run all attempts of a request on the calling thread
    void process(RemoteRequest& request, NodeTransport& transport) const;

    private:
    /// The worker loop
    void work();
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
