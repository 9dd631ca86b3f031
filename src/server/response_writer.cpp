#include "server/response_writer.hpp"
#include "utils/data_vector.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
void ResponseWriter::setHeader(const string& key, string value)
// Set or replace a header
{
    _response.headers[key] = move(value);
}
//---------------------------------------------------------------------------
void ResponseWriter::removeHeader(const string& key)
// Remove a header
{
    _response.headers.erase(key);
}
//---------------------------------------------------------------------------
string_view ResponseWriter::getHeader(const string& key) const
// Get a header
{
    auto it = _response.headers.find(key);
    if (it == _response.headers.end())
        return {};
    return it->second;
}
//---------------------------------------------------------------------------
bool ResponseWriter::writeHeader(network::HttpResponse::Code code)
// Write the status line and the headers
{
    if (_headerWritten)
        return !_aborted;
    _headerWritten = true;
    _response.code = code;
    if (!sendHeader(_response)) {
        _aborted = true;
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
bool ResponseWriter::write(const uint8_t* data, uint64_t length)
// Write body bytes
{
    if (!_headerWritten && !writeHeader(network::HttpResponse::Code::OK_200))
        return false;
    if (_aborted)
        return false;
    if (!length)
        return true;
    if (!sendBody(data, length)) {
        _aborted = true;
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
void ResponseWriter::abort()
// Abort the response
{
    if (_aborted)
        return;
    _aborted = true;
    sendAbort();
}
//---------------------------------------------------------------------------
bool StringResponseWriter::sendHeader(const network::HttpResponse& response)
// Keep the header
{
    _head = network::HttpResponse::serialize(response)->view();
    return true;
}
//---------------------------------------------------------------------------
bool StringResponseWriter::sendBody(const uint8_t* data, uint64_t length)
// Append to the body
{
    _body.append(reinterpret_cast<const char*>(data), length);
    return true;
}
//---------------------------------------------------------------------------
} // namespace nodelog::server
