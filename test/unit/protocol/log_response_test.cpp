#include "network/remote_request.hpp"
#include "protocol/log_response.hpp"
#include <catch2/catch.hpp>
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
namespace nodelog::protocol::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
network::RequestSnapshot served(string payload, uint32_t attempts = 1)
// A snapshot of a successful attempt
{
    network::RequestSnapshot snapshot;
    snapshot.served = true;
    snapshot.attemptCount = attempts;
    snapshot.payload = make_shared<const string>(move(payload));
    return snapshot;
}
//---------------------------------------------------------------------------
network::RequestSnapshot failed(string error, uint32_t attempts)
// A snapshot of a failed attempt
{
    network::RequestSnapshot snapshot;
    snapshot.served = true;
    snapshot.attemptCount = attempts;
    snapshot.errorText = move(error);
    return snapshot;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("format_byte_count") {
    REQUIRE(formatByteCount(0) == "0B");
    REQUIRE(formatByteCount(1023) == "1023B");
    REQUIRE(formatByteCount(1024) == "1.0KB");
    REQUIRE(formatByteCount(1536) == "1.5KB");
    REQUIRE(formatByteCount(2047) == "2.0KB");
    REQUIRE(formatByteCount(1024 * 1024 + 512 * 1024) == "1.5MB");
    REQUIRE(formatByteCount(5ull << 30) == "5.0GB");

    auto [value, exp] = scaleBytes(3 * 1024 * 1024);
    REQUIRE(value == 3.0);
    REQUIRE(exp == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("log_list") {
    auto list = LogList::decode(true, "SUCCESS\nerigon.log | 1536\n\nrpc.log | 12\n", "node-1");
    REQUIRE(list.success);
    REQUIRE(list.error.empty());
    REQUIRE(list.sessionName == "node-1");
    REQUIRE(list.entries.size() == 2);
    REQUIRE(list.entries[0].filename == "erigon.log");
    REQUIRE(list.entries[0].size == 1536);
    REQUIRE(list.entries[0].printedSize == "1.5KB");
    REQUIRE(list.entries[1].filename == "rpc.log");
    REQUIRE(list.entries[1].printedSize == "12B");

    // A listing without files
    list = LogList::decode(true, "SUCCESS\n");
    REQUIRE(list.success);
    REQUIRE(list.entries.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("log_list_errors") {
    auto list = LogList::decode(false, "Node is not allocated");
    REQUIRE(!list.success);
    REQUIRE(list.error == "Node is not allocated");

    list = LogList::decode(true, "SUCCESS");
    REQUIRE(!list.success);
    REQUIRE(list.error == "incorrect response (length of lines should be at least 2): [SUCCESS]");

    list = LogList::decode(true, "FAILURE\nerigon.log | 10");
    REQUIRE(!list.success);
    REQUIRE(list.error == "incorrect response (first line needs to be SUCCESS): [FAILURE erigon.log | 10]");

    list = LogList::decode(true, "SUCCESS\nerigon.log | 10\nbroken line\n");
    REQUIRE(!list.success);
    REQUIRE(list.entries.empty());
    REQUIRE(list.error == "incorrect response line (need to have 2 terms divided by |): broken line");

    list = LogList::decode(true, "SUCCESS\na | b | 10\n");
    REQUIRE(list.error == "incorrect response line (need to have 2 terms divided by |): a | b | 10");

    list = LogList::decode(true, "SUCCESS\nerigon.log | -5\n");
    REQUIRE(!list.success);
    REQUIRE(list.error == "incorrect size: -5 in line: erigon.log | -5");
}
//---------------------------------------------------------------------------
TEST_CASE("log_part") {
    auto part = LogPart::decode(true, "SUCCESS\nfirst\nsecond");
    REQUIRE(part.success);
    REQUIRE(part.lines == vector<string>{"first", "second"});

    // A trailing newline gives an empty last line
    part = LogPart::decode(true, "SUCCESS\nfirst\n");
    REQUIRE(part.lines == vector<string>{"first", ""});

    part = LogPart::decode(true, "SUCCESS");
    REQUIRE(part.success);
    REQUIRE(part.lines.empty());

    // Without the marker every line is content
    part = LogPart::decode(true, "plain");
    REQUIRE(part.lines == vector<string>{"plain"});

    part = LogPart::decode(false, "file not found");
    REQUIRE(!part.success);
    REQUIRE(part.error == "file not found");
    REQUIRE(part.lines.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("decode_chunk") {
    auto chunk = decodeChunk(served("SUCCESS: 0-4/10\nABCD"), 0);
    REQUIRE(chunk.success());
    REQUIRE(chunk.payload == "ABCD");
    REQUIRE(chunk.to == 4);
    REQUIRE(chunk.total == 10);
    REQUIRE(chunk.data);

    chunk = decodeChunk(served("SUCCESS: 6-10/10\nWXYZ"), 6);
    REQUIRE(chunk.success());
    REQUIRE(chunk.payload == "WXYZ");
    REQUIRE(chunk.total == 10);

    // An empty chunk at the end of the file
    chunk = decodeChunk(served("SUCCESS: 10-10/10\n"), 10);
    REQUIRE(chunk.success());
    REQUIRE(chunk.payload.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("decode_chunk_pending") {
    network::RequestSnapshot snapshot;
    auto chunk = decodeChunk(snapshot, 0);
    REQUIRE(!chunk.clear);
    REQUIRE(chunk.error.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("decode_chunk_errors") {
    // Below the ceiling errors keep the consumer polling
    auto chunk = decodeChunk(served("SUCCESS: 6-10/10\nWXYZ", 3), 0, 16);
    REQUIRE(!chunk.clear);
    REQUIRE(chunk.error == "unexpected from offset 6, wanted 0");

    chunk = decodeChunk(served("SUCCESS: 6-10/10\nWXYZ", 16), 0, 16);
    REQUIRE(chunk.clear);
    REQUIRE(!chunk.success());
    REQUIRE(chunk.error == "unexpected from offset 6, wanted 0");

    chunk = decodeChunk(served("SUCCESS: 0-4/10"), 0, 1);
    REQUIRE(chunk.error == "could not find first line in log part response");

    chunk = decodeChunk(served("SUCCESS 0-4/10\nABCD"), 0, 1);
    REQUIRE(chunk.error == "first line needs to have format SUCCESS: from-to/total, was [SUCCESS 0-4/10]");

    chunk = decodeChunk(served("SUCCESS: 0-4\nABCD"), 0, 1);
    REQUIRE(chunk.error.starts_with("first line needs to have format"));

    chunk = decodeChunk(served("SUCCESS: 0-x/10\nABCD"), 0, 1);
    REQUIRE(chunk.error.starts_with("first line needs to have format"));

    chunk = decodeChunk(served("SUCCESS: 99999999999999999999-4/10\nABCD"), 0, 1);
    REQUIRE(chunk.error == "parsing from: value out of range: 99999999999999999999");

    chunk = decodeChunk(failed("connection refused", 1), 0, 1);
    REQUIRE(chunk.clear);
    REQUIRE(chunk.error == "connection refused");

    chunk = decodeChunk(failed("connection refused", 1), 0, 2);
    REQUIRE(!chunk.clear);
}
//---------------------------------------------------------------------------
TEST_CASE("check_chunk_response") {
    auto good = make_shared<const string>("SUCCESS: 0-4/10\nABCD");
    auto shifted = make_shared<const string>("SUCCESS: 6-10/10\nWXYZ");
    REQUIRE(checkChunkResponse(LogRequests::read("erigon.log", 0), good).empty());
    REQUIRE(checkChunkResponse(LogRequests::read("erigon.log", 0), shifted) == "unexpected from offset 6, wanted 0");
    REQUIRE(checkChunkResponse(LogRequests::read("erigon.log", 6), shifted).empty());
    REQUIRE(checkChunkResponse(LogRequests::list(), shifted).empty());
    REQUIRE(!checkChunkResponse("/logs/read?file=erigon.log", good).empty());
}
//---------------------------------------------------------------------------
TEST_CASE("log_requests") {
    REQUIRE(LogRequests::list() == "/logs/list");
    REQUIRE(LogRequests::read("erigon.log", 4096) == "/logs/read?file=erigon.log&offset=4096");
    REQUIRE(LogRequests::read("my node.log", 0) == "/logs/read?file=my%20node.log&offset=0");
    REQUIRE(LogRequests::head("erigon.log", 16384) == "/logs/head?file=erigon.log&size=16384");
    REQUIRE(LogRequests::tail("a&b.log", 10) == "/logs/tail?file=a%26b.log&size=10");
}
//---------------------------------------------------------------------------
} // namespace nodelog::protocol::test
