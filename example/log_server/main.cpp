#include "network/config.hpp"
#include "network/http_request.hpp"
#include "network/node_client.hpp"
#include "network/node_dispatcher.hpp"
#include "network/request_bridge.hpp"
#include "protocol/log_response.hpp"
#include "server/disconnect_watcher.hpp"
#include "server/log_download.hpp"
#include "server/log_session.hpp"
#include "server/response_writer.hpp"
#include "stream/cancellation.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace nodelog;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Writes the response to a blocking client socket
class SocketResponseWriter : public server::ResponseWriter {
    /// The client socket
    int _fd;

    /// Send all bytes
    bool sendAll(const uint8_t* data, uint64_t length) {
        while (length) {
            auto sent = ::send(_fd, data, length, MSG_NOSIGNAL);
            if (sent < 0 && errno == EINTR)
                continue;
            if (sent <= 0)
                return false;
            data += sent;
            length -= static_cast<uint64_t>(sent);
        }
        return true;
    }

    protected:
    bool sendHeader(const network::HttpResponse& response) override {
        auto header = network::HttpResponse::serialize(response);
        return sendAll(header->cdata(), header->size());
    }
    bool sendBody(const uint8_t* data, uint64_t length) override { return sendAll(data, length); }
    void sendAbort() override { ::shutdown(_fd, SHUT_RDWR); }

    public:
    explicit SocketResponseWriter(int fd) : _fd(fd) {
        setHeader("Connection", "close");
    }
};
//---------------------------------------------------------------------------
/// Read the request header of the client
bool readRequest(int fd, network::HttpRequest& request) {
    static constexpr uint64_t maxHeaderSize = 64u * 1024;
    utils::DataVector<uint8_t> data;
    while (data.view().find("\r\n\r\n") == string_view::npos) {
        if (data.size() >= maxHeaderSize)
            return false;
        auto offset = data.size();
        data.resize(offset + 4096);
        auto length = ::recv(fd, data.data() + offset, 4096, 0);
        if (length < 0 && errno == EINTR) {
            data.resize(offset);
            continue;
        }
        if (length <= 0)
            return false;
        data.resize(offset + static_cast<uint64_t>(length));
    }
    request = network::HttpRequest::deserialize(data.view());
    return true;
}
//---------------------------------------------------------------------------
/// Write a plaintext answer
void writeText(server::ResponseWriter& writer, network::HttpResponse::Code code, const string& text) {
    writer.setHeader("Content-Type", "text/plain; charset=utf-8");
    writer.setHeader("Content-Length", to_string(text.size()));
    writer.writeHeader(code);
    writer.write(text);
}
//---------------------------------------------------------------------------
/// Answer one client
void handle(int fd, network::RequestBridge& bridge, const string& sessionName, const network::Config& config) {
    SocketResponseWriter writer(fd);
    network::HttpRequest request;
    try {
        if (!readRequest(fd, request)) {
            close(fd);
            return;
        }
    } catch (const runtime_error& e) {
        writeText(writer, network::HttpResponse::Code::BAD_REQUEST_400, string(e.what()) + "\n");
        close(fd);
        return;
    }

    stream::CancellationToken cancellation;
    // A client that hangs up cancels the outstanding node requests
    server::DisconnectWatcher watcher(fd, cancellation);
    server::LogSession session(sessionName, &bridge, cancellation, config);
    if (request.method != network::HttpRequest::Method::GET && request.method != network::HttpRequest::Method::HEAD) {
        writeText(writer, network::HttpResponse::Code::METHOD_NOT_ALLOWED_405, "method not allowed\n");
    } else if (request.path == "/logs/download") {
        auto file = string(request.getQuery("file"));
        auto size = utils::parseUnsigned(request.getQuery("size"));
        if (file.empty()) {
            writeText(writer, network::HttpResponse::Code::BAD_REQUEST_400, "ERROR: missing file\n");
        } else {
            // Without a size the listing tells how large the file is
            if (!size) {
                auto list = session.list();
                for (auto& entry : list.entries)
                    if (entry.filename == file)
                        size = entry.size;
            }
            server::LogDownload::transmit(request, writer, sessionName, file, size.value_or(0), session.getBridge(), cancellation, config);
        }
    } else if (request.path == "/logs/list") {
        auto list = session.list();
        string text;
        if (!list.success) {
            text = "ERROR: " + list.error + "\n";
        } else {
            for (auto& entry : list.entries)
                text += entry.filename + " | " + to_string(entry.size) + " | " + entry.printedSize + "\n";
        }
        writeText(writer, network::HttpResponse::Code::OK_200, text);
    } else if (request.path == "/logs/head" || request.path == "/logs/tail") {
        auto file = string(request.getQuery("file"));
        auto bytes = utils::parseUnsigned(request.getQuery("size")).value_or(server::LogSession::defaultSnippetSize);
        auto part = request.path == "/logs/head" ? session.head(file, bytes) : session.tail(file, bytes);
        string text;
        if (!part.success) {
            text = "ERROR: " + part.error + "\n";
        } else {
            for (auto& line : part.lines)
                text += line + "\n";
        }
        writeText(writer, network::HttpResponse::Code::OK_200, text);
    } else {
        writeText(writer, network::HttpResponse::Code::NOT_FOUND_404, "not found\n");
    }
    watcher.stop();
    close(fd);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc < 3) {
        cerr << "usage: " << argv[0] << " <listen-port> <node-url> [session]" << endl;
        return 1;
    }
    auto port = utils::parseUnsigned(argv[1]);
    if (!port || !*port || *port > 65535) {
        cerr << "invalid port: " << argv[1] << endl;
        return 1;
    }
    string sessionName = argc > 3 ? argv[3] : "node";

    network::Config config;
    network::NodeEndpoint endpoint;
    try {
        config = network::Config::fromEnvironment();
        endpoint = network::NodeEndpoint::parse(argv[2]);
    } catch (const runtime_error& e) {
        cerr << e.what() << endl;
        return 1;
    }

    // The channel between the readers and the node
    network::RequestBridge bridge(config.submissionCapacity);
    network::ConnectionManager::TLSSettings tlsSettings{.verifyPeer = config.verifyPeer, .caFile = config.caFile};
    network::NodeDispatcher dispatcher(bridge, [endpoint, tlsSettings]() { return make_unique<network::NodeClient>(endpoint, network::ConnectionManager::TCPSettings(), tlsSettings); }, config, &protocol::checkChunkResponse);
    dispatcher.start();

    auto listenFd = socket(AF_INET6, SOCK_STREAM, 0);
    if (listenFd < 0) {
        cerr << "socket error: " << strerror(errno) << endl;
        return 1;
    }
    int on = 1;
    setsockopt(listenFd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
    sockaddr_in6 addr = {};
    addr.sin6_family = AF_INET6;
    addr.sin6_addr = in6addr_any;
    addr.sin6_port = htons(static_cast<uint16_t>(*port));
    if (::bind(listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listenFd, 64) < 0) {
        cerr << "listen error: " << strerror(errno) << endl;
        close(listenFd);
        return 1;
    }
    cout << "serving logs of " << argv[2] << " on port " << *port << endl;

    while (true) {
        auto clientFd = ::accept(listenFd, nullptr, nullptr);
        if (clientFd < 0) {
            if (errno == EINTR)
                continue;
            cerr << "accept error: " << strerror(errno) << endl;
            break;
        }
        thread(handle, clientFd, ref(bridge), sessionName, config).detach();
    }
    close(listenFd);
    dispatcher.stop();
    return 0;
}
//---------------------------------------------------------------------------
