#pragma once
#include "network/config.hpp"
#include "stream/seekable_content.hpp"
#include <cstdint>
#include <string>
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
class RequestBridge;
} // namespace network
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
class CancellationToken;
//---------------------------------------------------------------------------
/// Reads a log file of the node chunk by chunk as if it was local.
/// Every read submits one chunk request and polls it until it is final.
class LogReader : public SeekableContent {
    /// The log file
    std::string _filename;
    /// The channel to the node
    network::RequestBridge& _bridge;
    /// The session cancellation
    CancellationToken& _cancellation;
    /// The config
    network::Config _config;
    /// The file size, 0 until known
    uint64_t _total;
    /// The current offset
    uint64_t _offset;
    /// The state of the last read
    ReadState _state;

    public:
    /// The constructor, total may be seeded with a size known from a listing
    LogReader(std::string filename, network::RequestBridge& bridge, CancellationToken& cancellation, uint64_t total = 0, network::Config config = {});

    /// Read the chunk at the current offset
    ReadResult read(uint8_t* buffer, uint64_t size) override;
    /// Seek, an end relative seek before the size is known goes to 0
    uint64_t seek(int64_t offset, Whence whence) override;

    /// The file name
    [[nodiscard]] const std::string& getFilename() const { return _filename; }
    /// The known size, 0 if unknown
    [[nodiscard]] uint64_t size() const { return _total; }
    /// The current offset
    [[nodiscard]] uint64_t offset() const { return _offset; }
    /// The state of the last read
    [[nodiscard]] ReadState getState() const { return _state; }
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace nodelog
