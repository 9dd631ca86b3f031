#include "network/tls_connection.hpp"
#include "network/connection_manager.hpp"
#include "network/tls_context.hpp"
#include <cassert>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
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
static string sslError(const char* operation)
// Text of the oldest OpenSSL error
{
    char buffer[256];
    auto code = ERR_get_error();
    if (!code)
        return string(operation) + " failed";
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return string(operation) + " failed: " + buffer;
}
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context) : _context(context), _ssl(nullptr), _internalBio(nullptr), _networkBio(nullptr), _fd(-1), _host(), _timeout(0), _connected(false)
// The constructor
{
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection()
// The destructor
{
    destroy();
}
//---------------------------------------------------------------------------
bool TLSConnection::init(int32_t fd, const string& hostname, chrono::milliseconds timeout)
// Initialize SSL
{
    if (_ssl)
        return true;
    _ssl = _context.createConnection(hostname);
    if (!_ssl)
        return false;
    if (!BIO_new_bio_pair(&_internalBio, bufferSize, &_networkBio, bufferSize)) {
        SSL_free(_ssl);
        _ssl = nullptr;
        return false;
    }
    SSL_set_bio(_ssl, _internalBio, _internalBio);
    _fd = fd;
    _host = hostname;
    _timeout = timeout;
    _buffer = make_unique<uint8_t[]>(bufferSize);
    return true;
}
//---------------------------------------------------------------------------
void TLSConnection::destroy()
// Free SSL, the internal bio is owned by the SSL object
{
    if (_ssl) {
        SSL_free(_ssl);
        BIO_free(_networkBio);
        _ssl = nullptr;
        _internalBio = nullptr;
        _networkBio = nullptr;
    }
    _connected = false;
}
//---------------------------------------------------------------------------
void TLSConnection::flush(ConnectionManager& connectionManager)
// Write the pending network bio to the socket
{
    while (auto pending = BIO_ctrl_pending(_networkBio)) {
        auto readSize = min<uint64_t>(pending, bufferSize);
        auto networkBioRead = BIO_read(_networkBio, _buffer.get(), static_cast<int>(readSize));
        if (networkBioRead <= 0)
            throw runtime_error("TLS network bio read error!");
        int64_t socketWrite = 0;
        while (socketWrite < networkBioRead) {
            Socket::Request request{.data = {.cdata = _buffer.get() + socketWrite}, .length = networkBioRead - socketWrite, .fd = _fd, .event = Socket::EventType::write, .timeout = _timeout};
            auto length = connectionManager.transfer(request);
            if (length <= 0)
                throw runtime_error("TLS send error: " + string(strerror(static_cast<int>(-length))));
            socketWrite += length;
        }
    }
}
//---------------------------------------------------------------------------
bool TLSConnection::fill(ConnectionManager& connectionManager)
// Read from the socket into the network bio
{
    auto readRequest = BIO_ctrl_get_write_guarantee(_networkBio);
    if (!readRequest)
        return true;
    auto readSize = min<uint64_t>(readRequest, bufferSize);
    Socket::Request request{.data = {.data = _buffer.get()}, .length = static_cast<int64_t>(readSize), .fd = _fd, .event = Socket::EventType::read, .timeout = _timeout};
    auto length = connectionManager.transfer(request);
    if (length == 0)
        return false;
    if (length < 0)
        throw runtime_error("TLS recv error: " + string(strerror(static_cast<int>(-length))));
    auto networkBioWrite = BIO_write(_networkBio, _buffer.get(), static_cast<int>(length));
    if (networkBioWrite != length)
        throw runtime_error("TLS network bio write error!");
    return true;
}
//---------------------------------------------------------------------------
template <typename F>
int64_t TLSConnection::operationHelper(ConnectionManager& connectionManager, F&& func)
// Helper function that handles the SSL_op calls
{
    while (true) {
        auto status = func();
        auto error = SSL_get_error(_ssl, status);
        switch (error) {
            case SSL_ERROR_NONE: {
                flush(connectionManager);
                return status;
            }
            case SSL_ERROR_ZERO_RETURN: {
                flush(connectionManager);
                return 0;
            }
            case SSL_ERROR_WANT_WRITE: {
                flush(connectionManager);
                break;
            }
            case SSL_ERROR_WANT_READ: {
                flush(connectionManager);
                if (!fill(connectionManager))
                    return 0;
                break;
            }
            default:
                throw runtime_error(sslError("TLS operation"));
        }
    }
}
//---------------------------------------------------------------------------
void TLSConnection::connect(ConnectionManager& connectionManager)
// SSL/TLS connect
{
    if (_connected)
        return;
    auto ssl = this->_ssl;
    auto sslConnect = [ssl]() {
        return SSL_connect(ssl);
    };
    int64_t result;
    try {
        result = operationHelper(connectionManager, sslConnect);
    } catch (const runtime_error& /*error*/) {
        checkVerification();
        throw;
    }
    if (result <= 0) {
        checkVerification();
        throw runtime_error("TLS handshake aborted by the peer");
    }
    _connected = true;
}
//---------------------------------------------------------------------------
void TLSConnection::checkVerification()
// Throws the reason of a rejected peer certificate
{
    auto result = SSL_get_verify_result(_ssl);
    if (result == X509_V_OK)
        return;
    ERR_clear_error();
    _context.dropSession(_host);
    throw runtime_error(string("TLS certificate verification failed: ") + X509_verify_cert_error_string(result));
}
//---------------------------------------------------------------------------
int64_t TLSConnection::recv(ConnectionManager& connectionManager, char* buffer, int64_t bufferLength)
// Recv a TLS encrypted message
{
    assert(in_range<int>(bufferLength));
    auto ssl = this->_ssl;
    auto sslRead = [ssl, buffer, bufferLength = static_cast<int>(bufferLength)]() {
        return SSL_read(ssl, buffer, bufferLength);
    };
    return operationHelper(connectionManager, sslRead);
}
//---------------------------------------------------------------------------
int64_t TLSConnection::send(ConnectionManager& connectionManager, const char* buffer, int64_t bufferLength)
// Send a TLS encrypted message
{
    assert(in_range<int>(bufferLength));
    auto ssl = this->_ssl;
    auto sslWrite = [ssl, buffer, bufferLength = static_cast<int>(bufferLength)]() {
        return SSL_write(ssl, buffer, bufferLength);
    };
    return operationHelper(connectionManager, sslWrite);
}
//---------------------------------------------------------------------------
bool TLSConnection::shutdown(ConnectionManager& connectionManager)
// SSL/TLS shutdown
{
    if (!_connected)
        return false;
    auto ssl = this->_ssl;
    // Sending our close notify is enough, the connection is not reused
    auto sslShutdown = [ssl]() {
        auto status = SSL_shutdown(ssl);
        return status == 0 ? 1 : status;
    };
    try {
        operationHelper(connectionManager, sslShutdown);
    } catch (const runtime_error& /*error*/) {
        _context.dropSession(_host);
        return false;
    }
    _context.cacheSession(_host, ssl);
    return true;
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
