#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <openssl/types.h>
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
class TLSContext;
class ConnectionManager;
//---------------------------------------------------------------------------
/// The TLS Interface
//---------------------------------------------------------------------------
/* nodelog |   OpenSSL
 *   |     |
 *    -------> SSL_read / SSL_write / SSL_connect
 *         |     /\    ||
 *         |     ||    \/
 *         |    internalBio
 *         |    networkBio
 *         |     ||     /\
 *         |     \/     ||
 *    -------<  recv / send
 *   |     |
 *   |     |
 *  socket
 * Adopted from https://www.openssl.org/docs/man3.1/man3/BIO_new_bio_pair.html
*/
//---------------------------------------------------------------------------
class TLSConnection {
    /// The buffer size of the bio pair
    static constexpr uint64_t bufferSize = 1ull << 16;

    /// The SSL context
    TLSContext& _context;
    /// The SSL connection
    SSL* _ssl;
    /// The internal buffer used for communicating with SSL
    BIO* _internalBio;
    /// The external buffer used for communicating with the socket
    BIO* _networkBio;
    /// The buffer
    std::unique_ptr<uint8_t[]> _buffer;
    /// The socket
    int32_t _fd;
    /// The host the certificate must be issued for
    std::string _host;
    /// The timeout of a single socket operation
    std::chrono::milliseconds _timeout;
    /// Already connected
    bool _connected;

    public:
    /// The constructor
    explicit TLSConnection(TLSContext& context);
    /// The destructor
    ~TLSConnection();
    /// Delete copy
    TLSConnection(const TLSConnection&) = delete;
    /// Delete copy assignment
    TLSConnection& operator=(const TLSConnection&) = delete;

    /// Initialize SSL for the socket, the hostname is used for SNI and the certificate check
    [[nodiscard]] bool init(int32_t fd, const std::string& hostname, std::chrono::milliseconds timeout = std::chrono::seconds(5));
    /// Free SSL
    void destroy();
    /// Get the SSL/TLS context
    [[nodiscard]] inline TLSContext& getContext() const { return _context; }

    /// SSL/TLS connect, throws on failure and on a rejected peer certificate
    void connect(ConnectionManager& connectionManager);
    /// Recv a TLS encrypted message, returns 0 on close, throws on failure
    [[nodiscard]] int64_t recv(ConnectionManager& connectionManager, char* buffer, int64_t bufferLength);
    /// Send a TLS encrypted message, throws on failure
    int64_t send(ConnectionManager& connectionManager, const char* buffer, int64_t bufferLength);
    /// SSL/TLS shutdown, caches the session on success
    bool shutdown(ConnectionManager& connectionManager);

    private:
    /// Helper function that handles the SSL_op calls
    template <typename F>
    int64_t operationHelper(ConnectionManager& connectionManager, F&& func);
    /// Write the pending network bio to the socket
    void flush(ConnectionManager& connectionManager);
    /// Read from the socket into the network bio, false on close
    bool fill(ConnectionManager& connectionManager);
    /// Throws if the peer certificate was rejected
    void checkVerification();
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
