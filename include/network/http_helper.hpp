#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
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
/// Implements an helper to resolve http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding,
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The content length, only for ContentLength
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    private:
    /// Detect the protocol
    [[nodiscard]] static Info detect(std::string_view s);
    /// Walk the chunks of a chunked body, appends the payload to out if set, returns true if the last chunk was seen
    [[nodiscard]] static bool walkChunks(std::string_view body, std::string* out);

    public:
    /// Retrieve the decoded content without http meta info, the message needs to be finished
    [[nodiscard]] static std::string retrieveContent(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
    /// Detect end of the message, false while the header is incomplete.
    /// Messages delimited by the connection close are finished by the caller.
    [[nodiscard]] static bool finished(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
