#include "network/tls_context.hpp"
#include <stdexcept>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
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
using namespace std;
//---------------------------------------------------------------------------
static bool isNumericHost(const string& host)
// Is the host an IPv4 or IPv6 literal
{
    in6_addr address;
    return inet_pton(AF_INET, host.c_str(), &address) == 1 || inet_pton(AF_INET6, host.c_str(), &address) == 1;
}
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer, const string& caFile) : _ctx(nullptr), _verifyPeer(verifyPeer), _sessions()
// The constructor
{
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        throw runtime_error("TLS context creation failed");
    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);

    auto trusted = caFile.empty() ? SSL_CTX_set_default_verify_paths(_ctx) : SSL_CTX_load_verify_locations(_ctx, caFile.c_str(), nullptr);
    if (trusted != 1 && _verifyPeer) {
        SSL_CTX_free(_ctx);
        ERR_clear_error();
        throw runtime_error(caFile.empty() ? string("TLS cannot load the system certificates") : "TLS cannot load the certificates in " + caFile);
    }
    // The handshake fails unless the chain ends in a trusted certificate
    SSL_CTX_set_verify(_ctx, _verifyPeer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The destructor
{
    for (auto& [host, session] : _sessions)
        SSL_SESSION_free(session);
    SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
SSL* TLSContext::createConnection(const string& host)
// Creates a client connection
{
    auto ssl = SSL_new(_ctx);
    if (!ssl)
        return nullptr;
    SSL_set_connect_state(ssl);

    auto numeric = isNumericHost(host);
    // SNI carries names only
    if (!numeric && SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
        SSL_free(ssl);
        return nullptr;
    }
    if (_verifyPeer) {
        // Literal addresses match the IP entries of the certificate, names the DNS entries
        auto matched = numeric ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str()) : SSL_set1_host(ssl, host.c_str());
        if (matched != 1) {
            SSL_free(ssl);
            return nullptr;
        }
    }

    if (auto it = _sessions.find(host); it != _sessions.end())
        SSL_set_session(ssl, it->second);
    return ssl;
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(const string& host, SSL* ssl)
// Remembers the session
{
    if (SSL_session_reused(ssl))
        return false;
    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;
    auto& entry = _sessions[host];
    if (entry)
        SSL_SESSION_free(entry);
    entry = session;
    return true;
}
//---------------------------------------------------------------------------
void TLSContext::dropSession(const string& host)
// Forgets the session
{
    auto it = _sessions.find(host);
    if (it == _sessions.end())
        return;
    SSL_SESSION_free(it->second);
    _sessions.erase(it);
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
