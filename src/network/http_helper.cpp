#include "network/http_helper.hpp"
#include <cassert>
#include <charconv>
#include <cstring>
#include <strings.h>
#include <stdexcept>
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
namespace nodelog {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static constexpr string_view headerEnd = "\r\n\r\n";
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);

    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";

    auto end = header.find(headerEnd);
    assert(end != string_view::npos);
    info.headerLength = static_cast<unsigned>(end) + static_cast<unsigned>(headerEnd.length());
    info.encoding = Encoding::UntilClose;

    for (auto& keyValue : info.response.headers) {
        if (strcasecmp(keyValue.first.c_str(), transferEncoding.data()) == 0 && keyValue.second.find(chunkedEncoding) != string::npos) {
            info.encoding = Encoding::ChunkedEncoding;
            break;
        } else if (strcasecmp(keyValue.first.c_str(), contentLength.data()) == 0) {
            info.encoding = Encoding::ContentLength;
            auto result = from_chars(keyValue.second.data(), keyValue.second.data() + keyValue.second.size(), info.length);
            if (result.ec != errc() || result.ptr != keyValue.second.data() + keyValue.second.size())
                throw runtime_error("Invalid Content-Length: " + keyValue.second);
        }
    }

    return info;
}
//---------------------------------------------------------------------------
bool HttpHelper::walkChunks(string_view body, string* out)
// Walk the chunks
{
    static constexpr string_view strNewline = "\r\n";
    while (true) {
        auto lineEnd = body.find(strNewline);
        if (lineEnd == body.npos)
            return false;
        auto sizeLine = body.substr(0, lineEnd);
        // chunk extensions are ignored
        auto extension = sizeLine.find(';');
        if (extension != sizeLine.npos)
            sizeLine = sizeLine.substr(0, extension);
        uint64_t chunkSize = 0;
        auto result = from_chars(sizeLine.data(), sizeLine.data() + sizeLine.size(), chunkSize, 16);
        if (result.ec != errc() || sizeLine.empty())
            throw runtime_error("Invalid chunk size line");
        body = body.substr(lineEnd + strNewline.size());
        if (!chunkSize) {
            // trailers end with an empty line
            if (body.starts_with(strNewline))
                return true;
            return body.find(headerEnd) != body.npos;
        }
        if (chunkSize > body.size() || body.size() - chunkSize < strNewline.size())
            return false;
        if (body.substr(chunkSize, strNewline.size()) != strNewline)
            throw runtime_error("Chunk data is not terminated by CRLF");
        if (out)
            out->append(body.data(), chunkSize);
        body = body.substr(chunkSize + strNewline.size());
    }
}
//---------------------------------------------------------------------------
string HttpHelper::retrieveContent(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Retrieve the content without http meta info
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info)
        info = make_unique<Info>(detect(sv));
    auto body = sv.substr(info->headerLength);
    switch (info->encoding) {
        case Encoding::ContentLength:
            return string(body.substr(0, info->length));
        case Encoding::ChunkedEncoding: {
            string content;
            if (!walkChunks(body, &content))
                throw runtime_error("Incomplete chunked content");
            return content;
        }
        case Encoding::UntilClose:
            return string(body);
        default:
            throw runtime_error("Unsupported HTTP transfer protocol");
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Detect end / content
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info) {
        if (sv.find(headerEnd) == sv.npos)
            return false;
        info = make_unique<Info>(detect(sv));
    }
    switch (info->encoding) {
        case Encoding::ContentLength:
            return length >= info->headerLength + info->length;
        case Encoding::ChunkedEncoding:
            return walkChunks(sv.substr(info->headerLength), nullptr);
        case Encoding::UntilClose:
            return false;
        default: {
            info = nullptr;
            throw runtime_error("Unsupported HTTP transfer protocol");
        }
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
