#pragma once
#include "network/socket.hpp"
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
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
class TLSConnection;
class TLSContext;
//---------------------------------------------------------------------------
// This class acts as the connection enabler and closer for sockets and their
// optional tls connection. We further add the DNS resolution to the
// connection manager. One instance per thread.
class ConnectionManager {
    public:
    /// The tcp settings
    struct TCPSettings {
        /// flag for nonBlocking
        int nonBlocking = 1;
        /// flag for noDelay
        int noDelay = 1;
        /// flag for keepAlive
        int keepAlive = 1;
        /// time for tcp keepIdle
        int keepIdle = 1;
        /// time for tcp keepIntvl
        int keepIntvl = 1;
        /// probe count
        int keepCnt = 1;
        /// recv buffer for tcp
        int recvBuffer = 0;
        /// The connect and transfer timeout in usec
        int timeout = 5 * 1000 * 1000;
    };
    /// The tls settings
    struct TLSSettings {
        /// Reject peers whose certificate is untrusted or issued for another host
        bool verifyPeer = true;
        /// PEM file with the trusted certificates, empty uses the system store
        std::string caFile;
    };

    private:
    /// A connected socket
    struct SocketEntry {
        /// The fd
        int32_t fd;
        /// The hostname
        std::string hostname;
        /// The optional tls connection
        std::unique_ptr<TLSConnection> tls;

        /// The constructor
        SocketEntry(int32_t fd, std::string hostname);
        /// The destructor
        ~SocketEntry();
    };
    /// The socket wrapper
    std::unique_ptr<Socket> _socketWrapper;
    /// The active sockets
    std::unordered_map<int32_t, std::unique_ptr<SocketEntry>> _fdSockets;
    /// The tls context
    std::unique_ptr<TLSContext> _context;

    public:
    /// The default submission queue size of io_uring
    static constexpr unsigned defaultUringEntries = 64;

    /// The constructor
    explicit ConnectionManager(unsigned uringEntries = defaultUringEntries);
    /// The constructor with explicit tls settings, throws if the trusted certificates cannot be loaded
    ConnectionManager(unsigned uringEntries, const TLSSettings& tlsSettings);
    /// The destructor
    ~ConnectionManager();

    /// Creates a new socket connection, throws on failure
    [[nodiscard]] int32_t connect(const std::string& hostname, uint32_t port, bool tls, const TCPSettings& tcpSettings, int retryLimit = 0);
    /// Disconnects the socket
    void disconnect(int32_t fd);

    /// Submits a single send or recv and waits for it, returns the length or -errno
    int64_t transfer(Socket::Request& request);

    /// Get the socket
    Socket& getSocketConnection() {
        assert(_socketWrapper);
        return *_socketWrapper.get();
    }

    /// Get the tls connection of the fd
    TLSConnection* getTLSConnection(int32_t fd);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
