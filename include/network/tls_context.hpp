#pragma once
#include <string>
#include <unordered_map>
#include <openssl/ssl.h>
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
// The client side OpenSSL context of one connection manager. It decides which
// peers are trusted and remembers the last session per host for resumption.
// Not thread safe: one context per thread.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// Verify the certificate chain and the host of the peer
    bool _verifyPeer;
    /// The resumable sessions by host
    std::unordered_map<std::string, SSL_SESSION*> _sessions;

    public:
    /// The constructor, an empty caFile trusts the system store, throws on failure
    TLSContext(bool verifyPeer, const std::string& caFile);
    /// The destructor
    ~TLSContext();
    /// Delete copy
    TLSContext(const TLSContext&) = delete;
    /// Delete copy assignment
    TLSContext& operator=(const TLSContext&) = delete;

    /// Creates a client connection to the host with SNI, host check and a resumed session, nullptr on failure
    [[nodiscard]] SSL* createConnection(const std::string& host);
    /// Remembers the session of an established connection
    bool cacheSession(const std::string& host, SSL* ssl);
    /// Forgets the session of the host
    void dropSession(const std::string& host);
    /// Is the peer verified
    [[nodiscard]] bool verifiesPeer() const { return _verifyPeer; }
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
