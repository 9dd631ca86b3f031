#include "utils/utils.hpp"
#include <cctype>
#include <charconv>
#include <ctime>
#include <system_error>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace nodelog {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(string_view encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<const uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string decodeUrlParameters(string_view decode)
// Decodes an url encoded string
{
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    string result;
    result.reserve(decode.size());
    for (auto i = 0u; i < decode.size(); i++) {
        auto c = decode[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < decode.size() && hexValue(decode[i + 1]) >= 0 && hexValue(decode[i + 2]) >= 0) {
            result += static_cast<char>((hexValue(decode[i + 1]) << 4) | hexValue(decode[i + 2]));
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
optional<uint64_t> parseUnsigned(string_view input)
// Parses a decimal number
{
    if (input.empty())
        return nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = from_chars(input.data(), input.data() + input.size(), value);
    if (ec != errc() || ptr != input.data() + input.size())
        return nullopt;
    return value;
}
//---------------------------------------------------------------------------
string formatMediaType(string_view type, const map<string, string>& params)
// Formats a media type with its parameters (RFC 2045, RFC 2231 for non ascii values)
{
    static constexpr string_view tspecials = "()<>@,;:\\\"/[]?=";
    auto isToken = [](unsigned char c) {
        return c > 0x20 && c < 0x7f && tspecials.find(static_cast<char>(c)) == string_view::npos;
    };

    string result(type);
    for (const auto& [key, value] : params) {
        result += "; ";
        result += key;

        auto needsEncoding = false;
        auto needsQuotes = value.empty();
        for (auto c : value) {
            auto u = static_cast<unsigned char>(c);
            if (u >= 0x80 || u < 0x20 || u == 0x7f)
                needsEncoding = true;
            else if (!isToken(u))
                needsQuotes = true;
        }

        if (needsEncoding) {
            result += "*=utf-8''";
            for (auto c : value) {
                auto u = static_cast<unsigned char>(c);
                if (isToken(u) && u != '%' && u != '*' && u != '\'') {
                    result += c;
                } else {
                    result += "%";
                    result += hexEncode(&u, 1, true);
                }
            }
        } else if (needsQuotes) {
            result += "=\"";
            for (auto c : value) {
                if (c == '"' || c == '\\')
                    result += '\\';
                result += c;
            }
            result += '"';
        } else {
            result += "=";
            result += value;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string httpDate(int64_t unixSeconds)
// Formats the time as IMF-fixdate
{
    time_t t = static_cast<time_t>(unixSeconds);
    tm gmt;
    gmtime_r(&t, &gmt);
    char buffer[64];
    auto length = strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return string(buffer, length);
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace nodelog
