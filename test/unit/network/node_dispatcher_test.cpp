#include "network/node_client.hpp"
#include "network/node_dispatcher.hpp"
#include "network/remote_request.hpp"
#include "network/request_bridge.hpp"
#include "protocol/log_response.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Answers requests with a callback and counts the calls
class ScriptedTransport : public NodeTransport {
    /// The handler
    function<RequestOutcome(const string&, unsigned)> _handler;
    /// The calls
    atomic<unsigned>& _calls;

    public:
    /// The constructor
    ScriptedTransport(function<RequestOutcome(const string&, unsigned)> handler, atomic<unsigned>& calls) : _handler(move(handler)), _calls(calls) {}

    /// Answer with the handler
    RequestOutcome execute(const string& target) override { return _handler(target, ++_calls); }
};
//---------------------------------------------------------------------------
RequestSnapshot waitServed(RemoteRequest& request)
// Poll until the request is served
{
    for (auto i = 0; i < 5000; i++) {
        auto snapshot = request.snapshot();
        if (snapshot.served)
            return snapshot;
        this_thread::sleep_for(chrono::milliseconds(1));
    }
    return request.snapshot();
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_success") {
    RequestBridge bridge;
    atomic<unsigned> calls = 0;
    ScriptedTransport transport([](const string&, unsigned) { return RequestOutcome::success("SUCCESS\nerigon.log | 10\n"); }, calls);
    NodeDispatcher dispatcher(bridge, {});

    RemoteRequest request("/logs/list");
    dispatcher.process(request, transport);
    REQUIRE(calls.load() == 1);
    auto snapshot = request.snapshot();
    REQUIRE(snapshot.served);
    REQUIRE(snapshot.attemptCount == 1);
    REQUIRE(snapshot.view() == "SUCCESS\nerigon.log | 10\n");
}
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_ceiling") {
    RequestBridge bridge;
    Config config;
    config.retryCeiling = 3;
    atomic<unsigned> calls = 0;
    ScriptedTransport transport([](const string&, unsigned call) -> RequestOutcome {
        if (call == 2)
            throw runtime_error("Connection closed before the response was complete");
        return RequestOutcome::failure("node answered with 503 Service Unavailable");
    },
                                calls);
    NodeDispatcher dispatcher(bridge, {}, config);

    RemoteRequest request("/logs/list");
    dispatcher.process(request, transport);
    REQUIRE(calls.load() == 3);
    auto snapshot = request.snapshot();
    REQUIRE(snapshot.attemptCount == 3);
    REQUIRE(snapshot.errorText == "node answered with 503 Service Unavailable");
    REQUIRE(RetryOutcome::evaluate(snapshot, snapshot.errorText, config.retryCeiling).done);
}
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_transport_exception") {
    RequestBridge bridge;
    Config config;
    config.retryCeiling = 1;
    atomic<unsigned> calls = 0;
    ScriptedTransport transport([](const string&, unsigned) -> RequestOutcome { throw runtime_error("Send error: Broken pipe"); }, calls);
    NodeDispatcher dispatcher(bridge, {}, config);

    RemoteRequest request("/logs/list");
    dispatcher.process(request, transport);
    auto snapshot = request.snapshot();
    REQUIRE(snapshot.served);
    REQUIRE(snapshot.errorText == "Send error: Broken pipe");
    REQUIRE(snapshot.attemptCount == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_response_check") {
    RequestBridge bridge;
    Config config;
    config.retryCeiling = 4;
    atomic<unsigned> calls = 0;
    // The first two answers start at the wrong offset
    ScriptedTransport transport([](const string&, unsigned call) {
        if (call < 3)
            return RequestOutcome::success("SUCCESS: 6-10/10\nWXYZ");
        return RequestOutcome::success("SUCCESS: 0-4/10\nABCD");
    },
                                calls);
    NodeDispatcher dispatcher(bridge, {}, config, &protocol::checkChunkResponse);

    RemoteRequest request(protocol::LogRequests::read("erigon.log", 0));
    dispatcher.process(request, transport);
    REQUIRE(calls.load() == 3);
    auto snapshot = request.snapshot();
    REQUIRE(snapshot.attemptCount == 3);
    REQUIRE(snapshot.view() == "SUCCESS: 0-4/10\nABCD");

    // Other targets are not checked
    calls = 0;
    RemoteRequest list(protocol::LogRequests::list());
    dispatcher.process(list, transport);
    REQUIRE(calls.load() == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_threads") {
    RequestBridge bridge;
    Config config;
    config.dispatcherThreads = 2;
    atomic<unsigned> calls = 0;
    NodeDispatcher dispatcher(bridge, [&calls]() { return make_unique<ScriptedTransport>([](const string& target, unsigned) { return RequestOutcome::success("SUCCESS\n" + target); }, calls); }, config);
    dispatcher.start();
    REQUIRE(dispatcher.running());

    auto first = bridge.submit("/logs/head?file=a.log&size=10");
    auto second = bridge.submit("/logs/tail?file=a.log&size=10");
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(waitServed(*first).view() == "SUCCESS\n/logs/head?file=a.log&size=10");
    REQUIRE(waitServed(*second).view() == "SUCCESS\n/logs/tail?file=a.log&size=10");

    dispatcher.stop();
    REQUIRE(!dispatcher.running());
    REQUIRE(calls.load() == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("node_dispatcher_without_transport") {
    RequestBridge bridge;
    Config config;
    config.dispatcherThreads = 1;
    NodeDispatcher dispatcher(bridge, []() -> unique_ptr<NodeTransport> { throw runtime_error("no route to node"); }, config);
    dispatcher.start();

    auto request = bridge.submit("/logs/list");
    REQUIRE(request);
    auto snapshot = waitServed(*request);
    REQUIRE(snapshot.served);
    REQUIRE(!snapshot.errorText.empty());
    REQUIRE(RetryOutcome::evaluate(snapshot, snapshot.errorText, config.retryCeiling).done);
}
//---------------------------------------------------------------------------
TEST_CASE("node_endpoint") {
    auto endpoint = NodeEndpoint::parse("http://10.0.0.7:6060");
    REQUIRE(endpoint.host == "10.0.0.7");
    REQUIRE(endpoint.port == 6060);
    REQUIRE(!endpoint.https);
    REQUIRE(endpoint.basePath.empty());

    endpoint = NodeEndpoint::parse("https://node.example.org/diag/");
    REQUIRE(endpoint.host == "node.example.org");
    REQUIRE(endpoint.port == 443);
    REQUIRE(endpoint.https);
    REQUIRE(endpoint.basePath == "/diag");

    REQUIRE(NodeEndpoint::parse("http://node").port == 80);
    REQUIRE_THROWS_AS(NodeEndpoint::parse("ftp://node"), runtime_error);
    REQUIRE_THROWS_AS(NodeEndpoint::parse("http://node:0"), runtime_error);
    REQUIRE_THROWS_AS(NodeEndpoint::parse("http://node:http"), runtime_error);
    REQUIRE_THROWS_AS(NodeEndpoint::parse("http://:80"), runtime_error);
}
//---------------------------------------------------------------------------
} // namespace nodelog::network::test
