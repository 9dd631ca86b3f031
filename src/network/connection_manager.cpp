#include "network/connection_manager.hpp"
#ifdef NODELOG_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#endif
#include "network/poll_socket.hpp"
#include "network/tls_connection.hpp"
#include "network/tls_context.hpp"
#include <cassert>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
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
ConnectionManager::SocketEntry::SocketEntry(int32_t fd, string hostname) : fd(fd), hostname(move(hostname)), tls()
// The constructor
{
}
//---------------------------------------------------------------------------
ConnectionManager::SocketEntry::~SocketEntry()
// The destructor
{
    tls.reset();
    if (fd >= 0)
        close(fd);
}
//---------------------------------------------------------------------------
ConnectionManager::ConnectionManager(unsigned uringEntries) : ConnectionManager(uringEntries, TLSSettings())
// The constructor
{
}
//---------------------------------------------------------------------------
ConnectionManager::ConnectionManager([[maybe_unused]] unsigned uringEntries, const TLSSettings& tlsSettings) : _fdSockets()
// The constructor with tls settings
{
#ifdef NODELOG_HAS_IO_URING
    // Init can fail on runtime instances with kernel < 5.6 as we do not have the uring syscall or specific feature is not available
    try {
        _socketWrapper = make_unique<IOUringSocket>(uringEntries);
    } catch (std::runtime_error& /*error*/) {
        // Fall back to poll socket
        _socketWrapper = make_unique<PollSocket>();
    }
#else
    _socketWrapper = make_unique<PollSocket>();
#endif
    _context = make_unique<TLSContext>(tlsSettings.verifyPeer, tlsSettings.caFile);
}
//---------------------------------------------------------------------------
int32_t ConnectionManager::connect(const string& hostname, uint32_t port, bool tls, const TCPSettings& tcpSettings, int retryLimit)
// Creates a new socket connection
{
    // Resolve the address
    struct addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* addr = nullptr;
    auto portString = to_string(port);
    if (auto res = getaddrinfo(hostname.c_str(), portString.c_str(), &hints, &addr); res != 0)
        throw runtime_error("hostname getaddrinfo error: " + string(gai_strerror(res)));
    unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addrGuard(addr, &freeaddrinfo);

    // Build socket
    auto socketEntry = make_unique<SocketEntry>(socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol), hostname);
    if (socketEntry->fd == -1)
        throw runtime_error("Socket creation error!" + string(strerror(errno)));

    // Settings for socket
    // No blocking mode
    if (tcpSettings.nonBlocking > 0) {
        int flags = fcntl(socketEntry->fd, F_GETFL, 0);
        flags |= O_NONBLOCK;
        if (fcntl(socketEntry->fd, F_SETFL, flags) < 0)
            throw runtime_error("Socket creation error! - non blocking error");
    }

    // Keep Alive
    if (tcpSettings.keepAlive > 0) {
        if (setsockopt(socketEntry->fd, SOL_SOCKET, SO_KEEPALIVE, &tcpSettings.keepAlive, sizeof(tcpSettings.keepAlive)))
            throw runtime_error("Socket creation error! - keep alive error");
    }

    // Keep Idle
    if (tcpSettings.keepIdle > 0) {
        if (setsockopt(socketEntry->fd, SOL_TCP, TCP_KEEPIDLE, &tcpSettings.keepIdle, sizeof(tcpSettings.keepIdle)))
            throw runtime_error("Socket creation error! - keep idle error");
    }

    // Keep intvl
    if (tcpSettings.keepIntvl > 0) {
        if (setsockopt(socketEntry->fd, SOL_TCP, TCP_KEEPINTVL, &tcpSettings.keepIntvl, sizeof(tcpSettings.keepIntvl)))
            throw runtime_error("Socket creation error! - keep intvl error");
    }

    // Keep cnt
    if (tcpSettings.keepCnt > 0) {
        if (setsockopt(socketEntry->fd, SOL_TCP, TCP_KEEPCNT, &tcpSettings.keepCnt, sizeof(tcpSettings.keepCnt)))
            throw runtime_error("Socket creation error! - keep cnt error");
    }

    // No Delay
    if (tcpSettings.noDelay > 0) {
        if (setsockopt(socketEntry->fd, SOL_TCP, TCP_NODELAY, &tcpSettings.noDelay, sizeof(tcpSettings.noDelay)))
            throw runtime_error("Socket creation error! - nodelay error");
    }

    // Recv buffer
    if (tcpSettings.recvBuffer > 0) {
        if (setsockopt(socketEntry->fd, SOL_SOCKET, SO_RCVBUF, &tcpSettings.recvBuffer, sizeof(tcpSettings.recvBuffer)))
            throw runtime_error("Socket creation error! - recvbuf error");
    }

    // Connect to remote
    auto connectRes = ::connect(socketEntry->fd, addr->ai_addr, addr->ai_addrlen);
    if (connectRes < 0 && errno != EINPROGRESS) {
        auto error = errno;
        if (retryLimit > 0)
            return connect(hostname, port, tls, tcpSettings, retryLimit - 1);
        throw runtime_error("Socket creation error! " + string(strerror(error)));
    }

    if (connectRes < 0) {
        // connection check
        struct pollfd pollEvent;
        pollEvent.fd = socketEntry->fd;
        pollEvent.events = POLLIN | POLLOUT;
        pollEvent.revents = 0;

        auto t = poll(&pollEvent, 1, tcpSettings.timeout / 1000);
        if (t != 1) {
            // Reached timeout
            if (retryLimit > 0)
                return connect(hostname, port, tls, tcpSettings, retryLimit - 1);
            throw runtime_error("Socket creation error! Timeout reached");
        }
        int socketError;
        socklen_t socketErrorLen = sizeof(socketError);
        if (getsockopt(socketEntry->fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen))
            throw runtime_error("Socket creation error! Could not retrieve socket options!");
        if (socketError)
            throw runtime_error("Socket creation error! " + string(strerror(socketError)));
    }

    auto fd = socketEntry->fd;
    if (tls) {
        socketEntry->tls = make_unique<TLSConnection>(*_context);
        if (!socketEntry->tls->init(fd, hostname))
            throw runtime_error("TLS init error!");
    }
    _fdSockets.emplace(fd, move(socketEntry));
    return fd;
}
//---------------------------------------------------------------------------
void ConnectionManager::disconnect(int32_t fd)
// Disconnects the socket
{
    auto socketIt = _fdSockets.find(fd);
    assert(socketIt != _fdSockets.end());
    _fdSockets.erase(socketIt);
}
//---------------------------------------------------------------------------
int64_t ConnectionManager::transfer(Socket::Request& request)
// Submits a single send or recv and waits for it
{
    while (true) {
        auto length = request.length;
        auto queued = request.event == Socket::EventType::read ? _socketWrapper->recv(request) : _socketWrapper->send(request);
        if (!queued)
            throw runtime_error("Socket submission error!");
        _socketWrapper->submit();
        auto completed = _socketWrapper->complete();
        assert(completed == &request);
        if (completed->length == -EAGAIN || completed->length == -EINTR) {
            // Spurious wakeup, retry with the requested length
            completed->length = length;
            continue;
        }
        return completed->length;
    }
}
//---------------------------------------------------------------------------
TLSConnection* ConnectionManager::getTLSConnection(int32_t fd)
// Get the tls connection of the fd
{
    auto it = _fdSockets.find(fd);
    assert(it != _fdSockets.end());
    return it->second->tls.get();
}
//---------------------------------------------------------------------------
ConnectionManager::~ConnectionManager()
// The destructor
{
    _fdSockets.clear();
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
