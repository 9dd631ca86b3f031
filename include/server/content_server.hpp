#pragma once
#include "network/config.hpp"
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
namespace nodelog {
namespace network {
struct HttpRequest;
} // namespace network
namespace stream {
class SeekableContent;
} // namespace stream
//---------------------------------------------------------------------------
namespace server {
//---------------------------------------------------------------------------
class ResponseWriter;
//---------------------------------------------------------------------------
/// A parsed Range header
struct ByteRange {
    /// The kind of the range request
    enum class Kind : uint8_t {
        /// No range header, the whole content
        None,
        /// One satisfiable range
        Single,
        /// Several ranges, served as the whole content
        Multiple,
        /// Malformed or not overlapping the content
        Unsatisfiable
    };
    /// The kind
    Kind kind = Kind::None;
    /// The first byte
    uint64_t start = 0;
    /// The number of bytes
    uint64_t length = 0;

    /// Parse a Range header value against the content size
    [[nodiscard]] static ByteRange parse(std::string_view header, uint64_t size);
};
//---------------------------------------------------------------------------
/// Serves a seekable content with http range support
class ContentServer {
    /// The config
    network::Config _config;

    public:
    /// The constructor
    explicit ContentServer(network::Config config = {}) : _config(config) {}

    /// Serve the content, name decides the default content type.
    /// Returns true if the response was completed.
    bool serve(const network::HttpRequest& request, ResponseWriter& writer, std::string_view name, stream::SeekableContent& content, int64_t modified) const;

    /// The content type for a file name
    [[nodiscard]] static std::string contentType(std::string_view name);
};
//---------------------------------------------------------------------------
} // namespace server
} // namespace nodelog
