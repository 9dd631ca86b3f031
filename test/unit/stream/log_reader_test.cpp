#include "network/http_request.hpp"
#include "network/node_client.hpp"
#include "network/node_dispatcher.hpp"
#include "network/request_bridge.hpp"
#include "protocol/log_response.hpp"
#include "stream/cancellation.hpp"
#include "stream/log_reader.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::stream::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Serves one in-memory log file in chunks
class FileNode : public network::NodeTransport {
    /// The file content
    string _content;
    /// The maximum chunk size
    uint64_t _chunkSize;
    /// Added to the reported start offset
    uint64_t _shift;

    public:
    /// The constructor
    FileNode(string content, uint64_t chunkSize, uint64_t shift = 0) : _content(move(content)), _chunkSize(chunkSize), _shift(shift) {}

    /// Answer a read target
    network::RequestOutcome execute(const string& target) override {
        network::HttpRequest request;
        request.setTarget(target);
        auto offset = utils::parseUnsigned(request.getQuery("offset"));
        if (request.path != "/logs/read" || !offset || *offset > _content.size())
            return network::RequestOutcome::failure("bad request " + target);
        auto end = min<uint64_t>(*offset + _chunkSize, _content.size());
        return network::RequestOutcome::success("SUCCESS: " + to_string(*offset + _shift) + "-" + to_string(end) + "/" + to_string(_content.size()) + "\n" + _content.substr(*offset, end - *offset));
    }
};
//---------------------------------------------------------------------------
network::Config testConfig(uint32_t ceiling = 16)
// Fast polling, one dispatcher thread
{
    network::Config config;
    config.pollInterval = chrono::milliseconds(1);
    config.retryCeiling = ceiling;
    config.dispatcherThreads = 1;
    return config;
}
//---------------------------------------------------------------------------
string toString(const uint8_t* data, uint64_t length) { return string(reinterpret_cast<const char*>(data), length); }
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("log_reader") {
    auto config = testConfig();
    network::RequestBridge bridge;
    network::NodeDispatcher dispatcher(bridge, [] { return make_unique<FileNode>("0123456789", 4); }, config, &protocol::checkChunkResponse);
    dispatcher.start();
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    REQUIRE(reader.getFilename() == "erigon.log");
    REQUIRE(reader.getState() == ReadState::Idle);

    uint8_t buffer[16];
    auto result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.ok());
    REQUIRE(result.copied == 4);
    REQUIRE(!result.eof);
    REQUIRE(toString(buffer, result.copied) == "0123");
    REQUIRE(reader.offset() == 4);
    REQUIRE(reader.size() == 10);
    REQUIRE(reader.getState() == ReadState::Delivered);

    // A small buffer takes the front of the chunk
    result = reader.read(buffer, 2);
    REQUIRE(result.copied == 2);
    REQUIRE(toString(buffer, 2) == "45");
    REQUIRE(reader.offset() == 6);

    result = reader.read(buffer, sizeof(buffer));
    REQUIRE(toString(buffer, result.copied) == "6789");
    REQUIRE(result.eof);
    REQUIRE(reader.offset() == 10);

    // At the end the node answers with an empty chunk
    result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.ok());
    REQUIRE(result.copied == 0);
    REQUIRE(result.eof);
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_offset_mismatch") {
    auto config = testConfig(3);
    network::RequestBridge bridge;
    network::NodeDispatcher dispatcher(bridge, [] { return make_unique<FileNode>("0123456789", 4, 1); }, config, &protocol::checkChunkResponse);
    dispatcher.start();
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    uint8_t buffer[16];
    auto result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.state == ReadState::Failed);
    REQUIRE(result.error == "unexpected from offset 1, wanted 0");
    REQUIRE(result.copied == 0);
    REQUIRE(reader.offset() == 0);
    REQUIRE(reader.getState() == ReadState::Failed);
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_node_failure") {
    auto config = testConfig(2);
    network::RequestBridge bridge;
    network::NodeDispatcher dispatcher(bridge, [] { return make_unique<FileNode>("0123456789", 4); }, config);
    dispatcher.start();
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    reader.seek(20, Whence::Start);
    uint8_t buffer[16];
    auto result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.state == ReadState::Failed);
    REQUIRE(result.error == "bad request /logs/read?file=erigon.log&offset=20");
    REQUIRE(reader.offset() == 20);
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_cancelled") {
    auto config = testConfig();
    network::RequestBridge bridge;
    CancellationToken cancellation;
    cancellation.cancel();

    // Nobody serves the bridge
    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    uint8_t buffer[16];
    auto result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.state == ReadState::Cancelled);
    REQUIRE(result.error == "interrupted");
    REQUIRE(result.copied == 0);
    REQUIRE(reader.getState() == ReadState::Cancelled);
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_cancelled_while_polling") {
    auto config = testConfig();
    config.pollInterval = chrono::milliseconds(100);
    network::RequestBridge bridge;
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    thread canceller([&cancellation] {
        this_thread::sleep_for(chrono::milliseconds(20));
        cancellation.cancel();
    });
    uint8_t buffer[16];
    auto start = chrono::steady_clock::now();
    auto result = reader.read(buffer, sizeof(buffer));
    auto elapsed = chrono::steady_clock::now() - start;
    canceller.join();
    REQUIRE(result.state == ReadState::Cancelled);
    REQUIRE(cancellation.cancelled());
    // The poll wait is interrupted instead of running out
    REQUIRE(elapsed < config.pollInterval);
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_queue_full") {
    auto config = testConfig();
    network::RequestBridge bridge(1);
    REQUIRE(bridge.submit("/logs/list"));
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    uint8_t buffer[16];
    auto result = reader.read(buffer, sizeof(buffer));
    REQUIRE(result.state == ReadState::Failed);
    REQUIRE(result.error == "submission queue is full");
}
//---------------------------------------------------------------------------
TEST_CASE("log_reader_seek") {
    auto config = testConfig();
    network::RequestBridge bridge;
    network::NodeDispatcher dispatcher(bridge, [] { return make_unique<FileNode>(string(5000, 'x'), 1000); }, config);
    dispatcher.start();
    CancellationToken cancellation;

    LogReader reader("erigon.log", bridge, cancellation, 0, config);
    // The size is unknown before the first read
    REQUIRE(reader.seek(-100, Whence::End) == 0);
    REQUIRE(reader.seek(0, Whence::End) == 0);

    uint8_t buffer[16];
    REQUIRE(reader.read(buffer, sizeof(buffer)).copied == 16);
    REQUIRE(reader.size() == 5000);
    REQUIRE(reader.seek(-100, Whence::End) == 4900);
    REQUIRE(reader.seek(50, Whence::Current) == 4950);
    REQUIRE(reader.seek(-950, Whence::Current) == 4000);
    REQUIRE(reader.seek(10, Whence::Start) == 10);

    // A size known from the listing
    LogReader seeded("erigon.log", bridge, cancellation, 5000, config);
    REQUIRE(seeded.seek(0, Whence::End) == 5000);
}
//---------------------------------------------------------------------------
} // namespace nodelog::stream::test
