#include "server/content_server.hpp"
#include "network/http_request.hpp"
#include "server/response_writer.hpp"
#include "stream/seekable_content.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <iostream>
#include <string>
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
using Code = network::HttpResponse::Code;
//---------------------------------------------------------------------------
static string_view trim(string_view s)
// Strip spaces and tabs
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}
//---------------------------------------------------------------------------
ByteRange ByteRange::parse(string_view header, uint64_t size)
// Parse a Range header value
{
    static constexpr string_view strBytes = "bytes=";

    ByteRange result;
    header = trim(header);
    if (header.empty())
        return result;
    result.kind = Kind::Unsatisfiable;
    if (!header.starts_with(strBytes))
        return result;

    auto ranges = header.substr(strBytes.size());
    auto overlapping = 0u;
    while (true) {
        auto commaPos = ranges.find(',');
        auto part = trim(ranges.substr(0, commaPos));
        if (!part.empty()) {
            auto dashPos = part.find('-');
            if (dashPos == part.npos)
                return ByteRange{Kind::Unsatisfiable};
            auto first = trim(part.substr(0, dashPos));
            auto last = trim(part.substr(dashPos + 1));
            if (first.empty()) {
                // suffix range, the last n bytes
                auto suffix = utils::parseUnsigned(last);
                if (!suffix)
                    return ByteRange{Kind::Unsatisfiable};
                auto n = min(*suffix, size);
                if (n) {
                    overlapping++;
                    result.start = size - n;
                    result.length = n;
                }
            } else {
                auto start = utils::parseUnsigned(first);
                if (!start)
                    return ByteRange{Kind::Unsatisfiable};
                uint64_t end = size ? size - 1 : 0;
                if (!last.empty()) {
                    auto parsedEnd = utils::parseUnsigned(last);
                    if (!parsedEnd || *parsedEnd < *start)
                        return ByteRange{Kind::Unsatisfiable};
                    end = min(*parsedEnd, end);
                }
                if (*start < size) {
                    overlapping++;
                    result.start = *start;
                    result.length = end - *start + 1;
                }
            }
        }
        if (commaPos == ranges.npos)
            break;
        ranges = ranges.substr(commaPos + 1);
    }

    if (!overlapping)
        return ByteRange{Kind::Unsatisfiable};
    // Ranges that do not overlap the content are dropped
    if (overlapping > 1)
        return ByteRange{Kind::Multiple};
    result.kind = Kind::Single;
    return result;
}
//---------------------------------------------------------------------------
string ContentServer::contentType(string_view name)
// The content type for a file name
{
    auto dot = name.rfind('.');
    if (dot == name.npos)
        return "application/octet-stream";
    auto extension = name.substr(dot + 1);
    if (extension == "log" || extension == "txt")
        return "text/plain; charset=utf-8";
    if (extension == "json")
        return "application/json";
    return "application/octet-stream";
}
//---------------------------------------------------------------------------
bool ContentServer::serve(const network::HttpRequest& request, ResponseWriter& writer, string_view name, stream::SeekableContent& content, int64_t modified) const
// Serve the content
{
    auto size = content.seek(0, stream::Whence::End);
    content.seek(0, stream::Whence::Start);

    writer.setHeader("Accept-Ranges", "bytes");
    writer.setHeader("Last-Modified", utils::httpDate(modified));
    if (writer.getHeader("Content-Type").empty())
        writer.setHeader("Content-Type", contentType(name));

    auto code = Code::OK_200;
    uint64_t start = 0;
    uint64_t length = size;
    auto range = ByteRange::parse(request.getHeader("Range"), size);
    switch (range.kind) {
        case ByteRange::Kind::Unsatisfiable: {
            writer.setHeader("Content-Range", "bytes */" + to_string(size));
            writer.setHeader("Content-Type", "text/plain; charset=utf-8");
            writer.removeHeader("Content-Disposition");
            static constexpr string_view message = "invalid range: failed to overlap\n";
            writer.setHeader("Content-Length", to_string(message.size()));
            writer.writeHeader(Code::RANGE_NOT_SATISFIABLE_416);
            if (request.method != network::HttpRequest::Method::HEAD)
                writer.write(message);
            return true;
        }
        case ByteRange::Kind::Single: {
            code = Code::PARTIAL_CONTENT_206;
            start = range.start;
            length = range.length;
            writer.setHeader("Content-Range", "bytes " + to_string(start) + "-" + to_string(start + length - 1) + "/" + to_string(size));
            content.seek(static_cast<int64_t>(start), stream::Whence::Start);
            break;
        }
        case ByteRange::Kind::None:
        case ByteRange::Kind::Multiple:
            break;
    }
    writer.setHeader("Content-Length", to_string(length));

    if (request.method == network::HttpRequest::Method::HEAD || !length)
        return writer.writeHeader(code);

    utils::DataVector<uint8_t> buffer(min<uint64_t>(max<uint64_t>(_config.copyBufferSize, 1), length));
    uint64_t remaining = length;
    while (remaining) {
        auto result = content.read(buffer.data(), min<uint64_t>(buffer.size(), remaining));
        string error = result.error;
        if (result.ok()) {
            if (!result.copied && !result.eof)
                error = "no progress reading " + string(name);
            else if (!result.copied || (result.eof && result.copied < remaining))
                error = "unexpected end of " + string(name) + " after " + to_string(length - remaining + result.copied) + " of " + to_string(length) + " bytes";
        }
        if (!error.empty() && !writer.headerWritten()) {
            // Nothing sent yet, report the error instead of the content
            writer.removeHeader("Content-Range");
            writer.removeHeader("Content-Disposition");
            writer.setHeader("Content-Type", "text/plain; charset=utf-8");
            auto text = error + "\n";
            writer.setHeader("Content-Length", to_string(text.size()));
            writer.writeHeader(Code::INTERNAL_SERVER_ERROR_500);
            writer.write(text);
            return false;
        }
        if (result.copied) {
            if (!writer.headerWritten())
                writer.writeHeader(code);
            if (!writer.write(buffer.data(), result.copied))
                return false;
            remaining -= result.copied;
        }
        if (!error.empty()) {
            cerr << "serving " << name << " aborted: " << error << endl;
            writer.abort();
            return false;
        }
    }
    return true;
}
//---------------------------------------------------------------------------
} // namespace nodelog::server
