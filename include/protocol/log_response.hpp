#pragma once
#include "network/config.hpp"
#include "network/remote_request.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::protocol {
//---------------------------------------------------------------------------
/// Scales bytes to the largest binary unit below them, returns value and unit exponent (0 = KiB).
/// Values below 1024 are returned unscaled.
[[nodiscard]] std::pair<double, unsigned> scaleBytes(uint64_t bytes);
/// Human readable size, e.g. 1023B, 1.0KB, 1.5MB
[[nodiscard]] std::string formatByteCount(uint64_t bytes);
//---------------------------------------------------------------------------
/// One file of a node's log directory
struct LogListItem {
    /// The file name
    std::string filename;
    /// The size in bytes
    uint64_t size;
    /// The size as printed to the operator
    std::string printedSize;
};
//---------------------------------------------------------------------------
/// The decoded answer to a list request
struct LogList {
    /// Was the listing decoded
    bool success = false;
    /// The error, either from the node or from decoding
    std::string error;
    /// The session the listing belongs to
    std::string sessionName;
    /// The files
    std::vector<LogListItem> entries;

    /// Decode a list response, a bad line rejects the whole listing
    [[nodiscard]] static LogList decode(bool success, std::string_view response, std::string sessionName = {});
};
//---------------------------------------------------------------------------
/// The decoded answer to a head or tail request
struct LogPart {
    /// Was the request successful
    bool success = false;
    /// The error text of the node
    std::string error;
    /// The lines, verbatim
    std::vector<std::string> lines;

    /// Decode a snippet response
    [[nodiscard]] static LogPart decode(bool success, std::string_view response);
};
//---------------------------------------------------------------------------
/// The decoded state of a chunk request
struct ChunkResult {
    /// No further polling required, either success or terminal error
    bool clear = false;
    /// End of the chunk as reported by the node
    uint64_t to = 0;
    /// Size of the file as reported by the node
    uint64_t total = 0;
    /// The chunk bytes, points into data
    std::string_view payload;
    /// Keeps the response alive
    std::shared_ptr<const std::string> data;
    /// The error, empty while pending or on success
    std::string error;

    /// Successful chunk
    [[nodiscard]] bool success() const { return clear && error.empty(); }
};
//---------------------------------------------------------------------------
/// Decode the snapshot of a chunk request issued at offset
[[nodiscard]] ChunkResult decodeChunk(const network::RequestSnapshot& snapshot, uint64_t offset, uint32_t ceiling = network::Config::defaultRetryCeiling);
/// The decode error of a response to a chunk target, empty for valid chunks and other targets
[[nodiscard]] std::string checkChunkResponse(std::string_view target, const std::shared_ptr<const std::string>& response);
//---------------------------------------------------------------------------
/// Builds the request targets understood by the node
struct LogRequests {
    /// List the log files
    [[nodiscard]] static std::string list();
    /// Read a chunk of a file starting at offset
    [[nodiscard]] static std::string read(std::string_view filename, uint64_t offset);
    /// The first bytes of a file
    [[nodiscard]] static std::string head(std::string_view filename, uint64_t bytes);
    /// The last bytes of a file
    [[nodiscard]] static std::string tail(std::string_view filename, uint64_t bytes);
};
//---------------------------------------------------------------------------
} // namespace nodelog::protocol
