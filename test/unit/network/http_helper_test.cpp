#include "network/http_helper.hpp"
#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <memory>
#include <stdexcept>
#include <string>
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
static const uint8_t* bytes(const string& s) { return reinterpret_cast<const uint8_t*>(s.data()); }
//---------------------------------------------------------------------------
TEST_CASE("http_response") {
    HttpResponse response;
    response.code = HttpResponse::Code::PARTIAL_CONTENT_206;
    response.headers.emplace("Content-Range", "bytes 0-3/10");
    response.headers.emplace("Content-Length", "4");

    auto serialize = HttpResponse::serialize(response);
    REQUIRE(serialize->view() == "HTTP/1.1 206 Partial Content\r\nContent-Length: 4\r\nContent-Range: bytes 0-3/10\r\n\r\n");

    auto deserialized = HttpResponse::deserialize(serialize->view());
    REQUIRE(deserialized.code == HttpResponse::Code::PARTIAL_CONTENT_206);
    REQUIRE(deserialized.headers["Content-Range"] == "bytes 0-3/10");
    REQUIRE(HttpResponse::checkSuccess(deserialized.code));
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_codes") {
    REQUIRE(HttpResponse::deserialize("HTTP/1.0 404 Nope\r\n\r\n").code == HttpResponse::Code::NOT_FOUND_404);
    REQUIRE(HttpResponse::deserialize("HTTP/1.1 503 Service Unavailable\r\n\r\n").code == HttpResponse::Code::SERVICE_UNAVAILABLE_503);
    REQUIRE(HttpResponse::deserialize("HTTP/1.1 302 Found\r\n\r\n").code == HttpResponse::Code::UNKNOWN);
    REQUIRE(!HttpResponse::checkSuccess(HttpResponse::Code::INTERNAL_SERVER_ERROR_500));
    REQUIRE_THROWS_AS(HttpResponse::deserialize("SPDY 200 OK\r\n\r\n"), runtime_error);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\n"), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_content_length") {
    string message = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nSUCCESS\n";
    unique_ptr<HttpHelper::Info> info;
    REQUIRE(!HttpHelper::finished(bytes(message), 20, info));
    REQUIRE(!info);
    REQUIRE(!HttpHelper::finished(bytes(message), message.size(), info));
    REQUIRE(info);
    REQUIRE(info->encoding == HttpHelper::Encoding::ContentLength);
    REQUIRE(info->length == 10);
    message += "ok";
    REQUIRE(HttpHelper::finished(bytes(message), message.size(), info));
    REQUIRE(HttpHelper::retrieveContent(bytes(message), message.size(), info) == "SUCCESS\nok");
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_chunked") {
    string message = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n8\r\nSUCCESS\n\r\n";
    unique_ptr<HttpHelper::Info> info;
    REQUIRE(!HttpHelper::finished(bytes(message), message.size(), info));
    REQUIRE(info->encoding == HttpHelper::Encoding::ChunkedEncoding);
    message += "3;ext=1\r\nabc\r\n0\r\n\r\n";
    REQUIRE(HttpHelper::finished(bytes(message), message.size(), info));
    REQUIRE(HttpHelper::retrieveContent(bytes(message), message.size(), info) == "SUCCESS\nabc");
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_until_close") {
    string message = "HTTP/1.0 200 OK\r\nServer: node\r\n\r\nSUCCESS\nerigon.log | 10\n";
    unique_ptr<HttpHelper::Info> info;
    REQUIRE(!HttpHelper::finished(bytes(message), message.size(), info));
    REQUIRE(info->encoding == HttpHelper::Encoding::UntilClose);
    REQUIRE(HttpHelper::retrieveContent(bytes(message), message.size(), info) == "SUCCESS\nerigon.log | 10\n");
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_invalid") {
    string message = "HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n";
    unique_ptr<HttpHelper::Info> info;
    REQUIRE_THROWS_AS(HttpHelper::finished(bytes(message), message.size(), info), runtime_error);

    string chunked = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n";
    info.reset();
    REQUIRE_THROWS_AS(HttpHelper::finished(bytes(chunked), chunked.size(), info), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper_chunk_bounds") {
    // A size near 2^64 waits for more data instead of wrapping around
    string huge = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nFFFFFFFFFFFFFFFF\r\nabc";
    unique_ptr<HttpHelper::Info> info;
    REQUIRE(!HttpHelper::finished(bytes(huge), huge.size(), info));
    REQUIRE_THROWS_AS(HttpHelper::retrieveContent(bytes(huge), huge.size(), info), runtime_error);

    // The chunk data is followed by CRLF
    string unterminated = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcXY0\r\n\r\n";
    info.reset();
    REQUIRE_THROWS_AS(HttpHelper::finished(bytes(unterminated), unterminated.size(), info), runtime_error);

    // Without the CRLF yet the chunk is incomplete
    string partial = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r";
    info.reset();
    REQUIRE(!HttpHelper::finished(bytes(partial), partial.size(), info));
}
//---------------------------------------------------------------------------
} // namespace nodelog::network::test
