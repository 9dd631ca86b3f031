#pragma once
#include "network/connection_manager.hpp"
#include "network/remote_request.hpp"
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
namespace nodelog::network {
//---------------------------------------------------------------------------
/// The address of the node
struct NodeEndpoint {
    /// The host
    std::string host;
    /// The port
    uint32_t port = 80;
    /// Use tls
    bool https = false;
    /// Prefix of every request target, without trailing slash
    std::string basePath;

    /// Parse http://host[:port][/prefix] or https://..., throws on anything else
    [[nodiscard]] static NodeEndpoint parse(std::string_view url);
};
//---------------------------------------------------------------------------
/// Performs one remote call against the node
class NodeTransport {
    public:
    /// The destructor
    virtual ~NodeTransport() = default;
    /// Execute the request target, transport failures are thrown
    [[nodiscard]] virtual RequestOutcome execute(const std::string& target) = 0;
};
//---------------------------------------------------------------------------
/// Blocking HTTP/1.1 GET roundtrip to the node, one connection per call.
/// Not thread safe: use one client per thread.
class NodeClient : public NodeTransport {
    /// The endpoint
    NodeEndpoint _endpoint;
    /// The tcp settings
    ConnectionManager::TCPSettings _tcpSettings;
    /// The connection manager
    ConnectionManager _connectionManager;

    public:
    /// Receive size per socket call
    static constexpr uint64_t chunkSize = 64u * 1024;

    /// The constructor
    explicit NodeClient(NodeEndpoint endpoint, ConnectionManager::TCPSettings tcpSettings = {}, const ConnectionManager::TLSSettings& tlsSettings = {});

    /// Execute the request target
    [[nodiscard]] RequestOutcome execute(const std::string& target) override;
    /// The endpoint
    [[nodiscard]] const NodeEndpoint& getEndpoint() const { return _endpoint; }

    private:
    /// Send all bytes
    void sendAll(int32_t fd, const uint8_t* data, uint64_t length);
    /// Receive up to length bytes, 0 on close
    [[nodiscard]] int64_t receive(int32_t fd, uint8_t* data, uint64_t length);
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
