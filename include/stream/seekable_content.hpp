#pragma once
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
namespace nodelog::stream {
//---------------------------------------------------------------------------
/// The reference point of a seek
enum class Whence : uint8_t {
    Start,
    Current,
    End
};
//---------------------------------------------------------------------------
/// The state of a read call
enum class ReadState : uint8_t {
    Idle,
    Polling,
    Delivered,
    Failed,
    Cancelled
};
//---------------------------------------------------------------------------
/// The result of a read call.
/// copied > 0 together with eof means: consume the bytes, then stop.
struct ReadResult {
    /// Bytes copied into the buffer
    uint64_t copied = 0;
    /// End of stream reached
    bool eof = false;
    /// The final state of the read
    ReadState state = ReadState::Idle;
    /// The error for Failed and Cancelled
    std::string error;

    /// Did the read deliver
    [[nodiscard]] bool ok() const { return state == ReadState::Delivered; }
};
//---------------------------------------------------------------------------
/// A byte stream that supports random access, driven by a single consumer
class SeekableContent {
    public:
    /// The destructor
    virtual ~SeekableContent() = default;
    /// Read up to size bytes at the current offset
    virtual ReadResult read(uint8_t* buffer, uint64_t size) = 0;
    /// Move the current offset, returns the new absolute offset
    virtual uint64_t seek(int64_t offset, Whence whence) = 0;
};
//---------------------------------------------------------------------------
} // namespace nodelog::stream
