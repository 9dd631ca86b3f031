#include "network/http_request.hpp"
#include "network/node_client.hpp"
#include "network/node_dispatcher.hpp"
#include "network/request_bridge.hpp"
#include "protocol/log_response.hpp"
#include "server/log_download.hpp"
#include "server/log_session.hpp"
#include "server/response_writer.hpp"
#include "stream/cancellation.hpp"
#include "stream/log_reader.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::server::test {
//---------------------------------------------------------------------------
using namespace std;
using Code = network::HttpResponse::Code;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// A node with one log file that answers every request kind
class FakeNode : public network::NodeTransport {
    /// The file name
    string _filename;
    /// The file content
    string _content;
    /// The maximum chunk size
    uint64_t _chunkSize;

    public:
    /// The constructor
    FakeNode(string filename, string content, uint64_t chunkSize) : _filename(move(filename)), _content(move(content)), _chunkSize(chunkSize) {}

    /// Answer a target
    network::RequestOutcome execute(const string& target) override {
        network::HttpRequest request;
        request.setTarget(target);
        if (request.path == "/logs/list")
            return network::RequestOutcome::success("SUCCESS\n" + _filename + " | " + to_string(_content.size()) + "\n");
        if (request.getQuery("file") != _filename)
            return network::RequestOutcome::failure("open " + string(request.getQuery("file")) + ": no such file or directory");
        if (request.path == "/logs/head" || request.path == "/logs/tail") {
            auto size = min<uint64_t>(utils::parseUnsigned(request.getQuery("size")).value_or(0), _content.size());
            auto part = request.path == "/logs/head" ? _content.substr(0, size) : _content.substr(_content.size() - size);
            return network::RequestOutcome::success("SUCCESS\n" + part);
        }
        auto offset = utils::parseUnsigned(request.getQuery("offset"));
        if (request.path != "/logs/read" || !offset || *offset > _content.size())
            return network::RequestOutcome::failure("bad request " + target);
        auto end = min<uint64_t>(*offset + _chunkSize, _content.size());
        return network::RequestOutcome::success("SUCCESS: " + to_string(*offset) + "-" + to_string(end) + "/" + to_string(_content.size()) + "\n" + _content.substr(*offset, end - *offset));
    }
};
//---------------------------------------------------------------------------
/// A node reached through a running dispatcher
struct TestNode {
    /// The config
    network::Config config;
    /// The bridge
    network::RequestBridge bridge;
    /// The dispatcher
    network::NodeDispatcher dispatcher;

    /// The constructor
    explicit TestNode(network::Config c, string content = "line one\nline two\nline three\n") : config(c), bridge(c.submissionCapacity), dispatcher(bridge, [content] { return make_unique<FakeNode>("erigon.log", content, 8); }, c, &protocol::checkChunkResponse) { dispatcher.start(); }
};
//---------------------------------------------------------------------------
network::Config testConfig()
// Fast polling, few attempts
{
    network::Config config;
    config.pollInterval = chrono::milliseconds(1);
    config.retryCeiling = 2;
    config.dispatcherThreads = 1;
    config.copyBufferSize = 5;
    return config;
}
//---------------------------------------------------------------------------
network::HttpRequest downloadRequest(string range = {})
// A download request
{
    network::HttpRequest request;
    request.setTarget("/logs/download?file=erigon.log&size=10");
    if (!range.empty())
        request.headers.emplace("Range", move(range));
    return request;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("log_download_not_allocated") {
    stream::CancellationToken cancellation;
    StringResponseWriter writer;
    REQUIRE(!LogDownload::transmit(downloadRequest(), writer, "node", "erigon.log", 10, nullptr, cancellation));
    REQUIRE(writer.getCode() == Code::OK_200);
    REQUIRE(writer.getHeader("Content-Type") == "text/plain; charset=utf-8");
    REQUIRE(writer.getHeader("Content-Disposition").empty());
    REQUIRE(writer.body() == "ERROR: Node is not allocated\n");
}
//---------------------------------------------------------------------------
TEST_CASE("log_download") {
    TestNode node(testConfig(), "0123456789");
    stream::CancellationToken cancellation;
    StringResponseWriter writer;
    REQUIRE(LogDownload::transmit(downloadRequest(), writer, "node", "erigon.log", 10, &node.bridge, cancellation, node.config));
    REQUIRE(writer.getCode() == Code::OK_200);
    REQUIRE(writer.body() == "0123456789");
    REQUIRE(writer.getHeader("Content-Disposition") == "attachment; filename=node_erigon.log");
    REQUIRE(writer.getHeader("Content-Type") == "application/octet-stream");
    REQUIRE(writer.getHeader("Content-Length") == "10");
    REQUIRE(!writer.getHeader("Last-Modified").empty());
}
//---------------------------------------------------------------------------
TEST_CASE("log_download_range") {
    TestNode node(testConfig(), "0123456789");
    stream::CancellationToken cancellation;
    StringResponseWriter writer;
    REQUIRE(LogDownload::transmit(downloadRequest("bytes=4-"), writer, "node", "erigon.log", 10, &node.bridge, cancellation, node.config));
    REQUIRE(writer.getCode() == Code::PARTIAL_CONTENT_206);
    REQUIRE(writer.body() == "456789");
    REQUIRE(writer.getHeader("Content-Range") == "bytes 4-9/10");
}
//---------------------------------------------------------------------------
TEST_CASE("log_download_interrupted") {
    TestNode node(testConfig(), "0123456789");
    stream::CancellationToken cancellation;
    cancellation.cancel();
    StringResponseWriter writer;
    REQUIRE(!LogDownload::transmit(downloadRequest(), writer, "node", "erigon.log", 10, &node.bridge, cancellation, node.config));
    REQUIRE(writer.getCode() == Code::INTERNAL_SERVER_ERROR_500);
    REQUIRE(writer.body() == "interrupted\n");
    REQUIRE(writer.getHeader("Content-Disposition").empty());
}
//---------------------------------------------------------------------------
TEST_CASE("log_session_not_allocated") {
    stream::CancellationToken cancellation;
    LogSession session("node", nullptr, cancellation);
    REQUIRE(session.getName() == "node");
    REQUIRE(!session.getBridge());

    auto list = session.list();
    REQUIRE(!list.success);
    REQUIRE(list.error == "Node is not allocated");
    REQUIRE(list.sessionName == "node");
    REQUIRE(session.head("erigon.log").error == "Node is not allocated");
    REQUIRE(!session.open("erigon.log"));
}
//---------------------------------------------------------------------------
TEST_CASE("log_session") {
    TestNode node(testConfig());
    stream::CancellationToken cancellation;
    LogSession session("node", &node.bridge, cancellation, node.config);

    auto list = session.list();
    REQUIRE(list.success);
    REQUIRE(list.entries.size() == 1);
    REQUIRE(list.entries[0].filename == "erigon.log");
    REQUIRE(list.entries[0].size == 29);
    REQUIRE(list.entries[0].printedSize == "29B");

    auto head = session.head("erigon.log", 9);
    REQUIRE(head.success);
    REQUIRE(head.lines == vector<string>{"line one", ""});

    auto tail = session.tail("erigon.log");
    REQUIRE(tail.success);
    REQUIRE(tail.lines == vector<string>{"line one", "line two", "line three", ""});

    auto missing = session.head("missing.log");
    REQUIRE(!missing.success);
    REQUIRE(missing.error == "open missing.log: no such file or directory");

    auto reader = session.open("erigon.log", list.entries[0].size);
    REQUIRE(reader);
    REQUIRE(reader->seek(-6, stream::Whence::End) == 23);
    uint8_t buffer[16];
    auto result = reader->read(buffer, sizeof(buffer));
    REQUIRE(result.ok());
    REQUIRE(string(reinterpret_cast<char*>(buffer), result.copied) == "three\n");
    REQUIRE(result.eof);
}
//---------------------------------------------------------------------------
TEST_CASE("log_session_interrupted") {
    network::RequestBridge bridge;
    stream::CancellationToken cancellation;
    cancellation.cancel();
    LogSession session("node", &bridge, cancellation);
    auto result = session.fetch(protocol::LogRequests::list());
    REQUIRE(!result.success);
    REQUIRE(result.text == "interrupted");
}
//---------------------------------------------------------------------------
TEST_CASE("log_session_queue_full") {
    network::RequestBridge bridge(1);
    REQUIRE(bridge.submit(protocol::LogRequests::list()));
    stream::CancellationToken cancellation;
    LogSession session("node", &bridge, cancellation);
    auto list = session.list();
    REQUIRE(!list.success);
    REQUIRE(list.error == "submission queue is full");
}
//---------------------------------------------------------------------------
} // namespace nodelog::server::test
