#pragma once
#include <cstdint>
#include <map>
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
//---------------------------------------------------------------------------
namespace utils {
template <typename T>
class DataVector;
}
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// Implements an helper to serialize and deserialize http responses
struct HttpResponse {
    /// Important error codes
    enum class Code : uint8_t {
        OK_200,
        PARTIAL_CONTENT_206,
        BAD_REQUEST_400,
        NOT_FOUND_404,
        METHOD_NOT_ALLOWED_405,
        RANGE_NOT_SATISFIABLE_416,
        INTERNAL_SERVER_ERROR_500,
        BAD_GATEWAY_502,
        SERVICE_UNAVAILABLE_503,
        UNKNOWN = 255
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The code
    Code code = Code::UNKNOWN;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the response code
    static constexpr auto getResponseCode(const Code& code) noexcept {
        switch (code) {
            case Code::OK_200: return "200 OK";
            case Code::PARTIAL_CONTENT_206: return "206 Partial Content";
            case Code::BAD_REQUEST_400: return "400 Bad Request";
            case Code::NOT_FOUND_404: return "404 Not Found";
            case Code::METHOD_NOT_ALLOWED_405: return "405 Method Not Allowed";
            case Code::RANGE_NOT_SATISFIABLE_416: return "416 Range Not Satisfiable";
            case Code::INTERNAL_SERVER_ERROR_500: return "500 Internal Server Error";
            case Code::BAD_GATEWAY_502: return "502 Bad Gateway";
            case Code::SERVICE_UNAVAILABLE_503: return "503 Service Unavailable";
            default: return "UNKNOWN";
        }
    }
    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr auto checkSuccess(const Code& code) {
        return (code == Code::OK_200 || code == Code::PARTIAL_CONTENT_206);
    }
    /// Serialize the status line and the headers
    [[nodiscard]] static std::unique_ptr<utils::DataVector<uint8_t>> serialize(const HttpResponse& response);
    /// Deserialize the response
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
