#include "stream/log_reader.hpp"
#include "network/request_bridge.hpp"
#include "protocol/log_response.hpp"
#include "stream/cancellation.hpp"
#include <algorithm>
#include <cstring>
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
using namespace std;
//---------------------------------------------------------------------------
LogReader::LogReader(string filename, network::RequestBridge& bridge, CancellationToken& cancellation, uint64_t total, network::Config config) : _filename(move(filename)), _bridge(bridge), _cancellation(cancellation), _config(config), _total(total), _offset(0), _state(ReadState::Idle)
// The constructor
{
}
//---------------------------------------------------------------------------
ReadResult LogReader::read(uint8_t* buffer, uint64_t size)
// Submits a chunk request and polls it until it is final
{
    ReadResult result;
    _state = ReadState::Idle;

    auto request = _bridge.submit(protocol::LogRequests::read(_filename, _offset));
    if (!request) {
        _state = result.state = ReadState::Failed;
        result.error = "submission queue is full";
        return result;
    }

    _state = ReadState::Polling;
    protocol::ChunkResult chunk;
    while (true) {
        // The request is abandoned, the dispatcher still owns a reference
        if (_cancellation.cancelled()) {
            _state = result.state = ReadState::Cancelled;
            result.error = "interrupted";
            return result;
        }
        chunk = protocol::decodeChunk(network::RequestBridge::snapshot(*request), _offset, _config.retryCeiling);
        if (chunk.clear)
            break;
        _cancellation.waitFor(_config.pollInterval);
    }

    if (!chunk.success()) {
        _state = result.state = ReadState::Failed;
        result.error = move(chunk.error);
        return result;
    }

    _total = chunk.total;
    auto copied = min<uint64_t>(size, chunk.payload.size());
    if (copied)
        memcpy(buffer, chunk.payload.data(), copied);
    _offset += copied;

    _state = result.state = ReadState::Delivered;
    result.copied = copied;
    result.eof = _offset == _total;
    return result;
}
//---------------------------------------------------------------------------
uint64_t LogReader::seek(int64_t offset, Whence whence)
// Moves the offset, no I/O
{
    switch (whence) {
        case Whence::Start:
            _offset = static_cast<uint64_t>(offset);
            break;
        case Whence::Current:
            _offset = static_cast<uint64_t>(static_cast<int64_t>(_offset) + offset);
            break;
        case Whence::End:
            if (_total > 0)
                _offset = static_cast<uint64_t>(static_cast<int64_t>(_total) + offset);
            else
                _offset = 0;
            break;
    }
    return _offset;
}
//---------------------------------------------------------------------------
} // namespace nodelog::stream
