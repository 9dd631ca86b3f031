#pragma once
#include "network/config.hpp"
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
struct HttpRequest;
class RequestBridge;
} // namespace network
namespace stream {
class CancellationToken;
} // namespace stream
//---------------------------------------------------------------------------
namespace server {
//---------------------------------------------------------------------------
class ResponseWriter;
//---------------------------------------------------------------------------
/// Transfers a log file of the node to the operator as attachment
class LogDownload {
    public:
    /// Stream the file through a range aware content server.
    /// Without a bridge the node is not allocated and a plaintext error is written.
    static bool transmit(const network::HttpRequest& request, ResponseWriter& writer, const std::string& sessionName, const std::string& filename, uint64_t size, network::RequestBridge* bridge, stream::CancellationToken& cancellation, network::Config config = {});
};
//---------------------------------------------------------------------------
} // namespace server
} // namespace nodelog
