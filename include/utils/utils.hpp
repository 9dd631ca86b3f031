#pragma once
#include <cstdint>
#include <map>
#include <optional>
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
namespace nodelog::utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(std::string_view encode);
/// Decode %HEX and '+' in url parameters, malformed escapes are kept as they are
std::string decodeUrlParameters(std::string_view decode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Parse a base-10 unsigned 64-bit number, the whole input must be consumed
std::optional<uint64_t> parseUnsigned(std::string_view input);
/// Format a media type with parameters, e.g. attachment; filename="a.log"
std::string formatMediaType(std::string_view type, const std::map<std::string, std::string>& params);
/// Format a point in time as IMF-fixdate (RFC 7231)
std::string httpDate(int64_t unixSeconds);
//---------------------------------------------------------------------------
} // namespace nodelog::utils
