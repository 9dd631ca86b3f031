#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <string>
#include <string_view>
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
/// The sink of an http response: headers may be changed until the status
/// line is written, the body follows it.
class ResponseWriter {
    protected:
    /// The response header
    network::HttpResponse _response;
    /// Was the header sent
    bool _headerWritten = false;
    /// Was the response aborted
    bool _aborted = false;

    /// Send the serialized header
    virtual bool sendHeader(const network::HttpResponse& response) = 0;
    /// Send body bytes
    virtual bool sendBody(const uint8_t* data, uint64_t length) = 0;
    /// Tear down the transport after a broken body
    virtual void sendAbort() = 0;

    public:
    /// The destructor
    virtual ~ResponseWriter() = default;

    /// Set or replace a header
    void setHeader(const std::string& key, std::string value);
    /// Remove a header
    void removeHeader(const std::string& key);
    /// Get a header, empty if missing
    [[nodiscard]] std::string_view getHeader(const std::string& key) const;
    /// Write the status line and the headers, only once
    bool writeHeader(network::HttpResponse::Code code);
    /// Write body bytes, writes a 200 header first if none was written; false if the client is gone
    bool write(const uint8_t* data, uint64_t length);
    /// Write body text
    bool write(std::string_view text) { return write(reinterpret_cast<const uint8_t*>(text.data()), text.size()); }
    /// Abort the response, the client sees a truncated body
    void abort();

    /// Was the header written
    [[nodiscard]] bool headerWritten() const { return _headerWritten; }
    /// Was the response aborted
    [[nodiscard]] bool aborted() const { return _aborted; }
    /// The status code, UNKNOWN before the header is written
    [[nodiscard]] network::HttpResponse::Code getCode() const { return _response.code; }
};
//---------------------------------------------------------------------------
/// Collects the response in memory
class StringResponseWriter : public ResponseWriter {
    /// The serialized header
    std::string _head;
    /// The body
    std::string _body;

    protected:
    /// Keep the header
    bool sendHeader(const network::HttpResponse& response) override;
    /// Append to the body
    bool sendBody(const uint8_t* data, uint64_t length) override;
    /// Nothing to tear down
    void sendAbort() override {}

    public:
    /// The serialized status line and headers
    [[nodiscard]] const std::string& head() const { return _head; }
    /// The body
    [[nodiscard]] const std::string& body() const { return _body; }
    /// The headers as sent
    [[nodiscard]] const network::HttpResponse& response() const { return _response; }
};
//---------------------------------------------------------------------------
} // namespace nodelog::server
