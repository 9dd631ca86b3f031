#include "network/node_client.hpp"
#include "network/http_helper.hpp"
#include "network/http_request.hpp"
#include "network/tls_connection.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
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
NodeEndpoint NodeEndpoint::parse(string_view url)
// Parse the node url
{
    static constexpr string_view strHttp = "http://";
    static constexpr string_view strHttps = "https://";

    NodeEndpoint endpoint;
    string_view sub;
    if (url.starts_with(strHttps)) {
        endpoint.https = true;
        endpoint.port = 443;
        sub = url.substr(strHttps.size());
    } else if (url.starts_with(strHttp)) {
        sub = url.substr(strHttp.size());
    } else {
        throw runtime_error("Node url needs to start with http:// or https://: " + string(url));
    }

    auto pos = sub.find('/');
    auto addressPort = sub.substr(0, pos);
    if (auto colonPos = addressPort.find(':'); colonPos != string_view::npos) {
        endpoint.host = addressPort.substr(0, colonPos);
        auto port = utils::parseUnsigned(addressPort.substr(colonPos + 1));
        if (!port || !*port || *port > 65535)
            throw runtime_error("Invalid node port: " + string(addressPort.substr(colonPos + 1)));
        endpoint.port = static_cast<uint32_t>(*port);
    } else {
        endpoint.host = addressPort;
    }
    if (endpoint.host.empty())
        throw runtime_error("Node url without host: " + string(url));

    if (pos != string_view::npos) {
        auto path = sub.substr(pos);
        while (!path.empty() && path.back() == '/')
            path.remove_suffix(1);
        endpoint.basePath = path;
    }
    return endpoint;
}
//---------------------------------------------------------------------------
NodeClient::NodeClient(NodeEndpoint endpoint, ConnectionManager::TCPSettings tcpSettings, const ConnectionManager::TLSSettings& tlsSettings) : _endpoint(move(endpoint)), _tcpSettings(tcpSettings), _connectionManager(ConnectionManager::defaultUringEntries, tlsSettings)
// The constructor
{
}
//---------------------------------------------------------------------------
void NodeClient::sendAll(int32_t fd, const uint8_t* data, uint64_t length)
// Send all bytes
{
    auto tls = _connectionManager.getTLSConnection(fd);
    uint64_t written = 0;
    while (written < length) {
        int64_t result;
        if (tls) {
            result = tls->send(_connectionManager, reinterpret_cast<const char*>(data + written), static_cast<int64_t>(length - written));
        } else {
            Socket::Request request{.data = {.cdata = data + written}, .length = static_cast<int64_t>(length - written), .fd = fd, .event = Socket::EventType::write, .timeout = chrono::milliseconds(_tcpSettings.timeout / 1000)};
            result = _connectionManager.transfer(request);
        }
        if (result < 0)
            throw runtime_error("Send error: " + string(strerror(static_cast<int>(-result))));
        if (result == 0)
            throw runtime_error("Send error: connection closed");
        written += static_cast<uint64_t>(result);
    }
}
//---------------------------------------------------------------------------
int64_t NodeClient::receive(int32_t fd, uint8_t* data, uint64_t length)
// Receive up to length bytes
{
    if (auto tls = _connectionManager.getTLSConnection(fd))
        return tls->recv(_connectionManager, reinterpret_cast<char*>(data), static_cast<int64_t>(length));
    Socket::Request request{.data = {.data = data}, .length = static_cast<int64_t>(length), .fd = fd, .event = Socket::EventType::read, .timeout = chrono::milliseconds(_tcpSettings.timeout / 1000)};
    auto result = _connectionManager.transfer(request);
    if (result < 0)
        throw runtime_error("Recv error: " + string(strerror(static_cast<int>(-result))));
    return result;
}
//---------------------------------------------------------------------------
RequestOutcome NodeClient::execute(const string& target)
// One roundtrip to the node
{
    HttpRequest request;
    request.method = HttpRequest::Method::GET;
    request.type = HttpRequest::Type::HTTP_1_1;
    request.setTarget(_endpoint.basePath + target);
    request.headers.emplace("Host", _endpoint.host);
    request.headers.emplace("User-Agent", "nodelog");
    request.headers.emplace("Accept", "*/*");
    request.headers.emplace("Connection", "close");
    auto header = HttpRequest::serialize(request);

    auto fd = _connectionManager.connect(_endpoint.host, _endpoint.port, _endpoint.https, _tcpSettings);
    utils::DataVector<uint8_t> data;
    unique_ptr<HttpHelper::Info> info;
    try {
        if (auto tls = _connectionManager.getTLSConnection(fd))
            tls->connect(_connectionManager);
        sendAll(fd, header->cdata(), header->size());

        auto closed = false;
        while (!HttpHelper::finished(data.cdata(), data.size(), info)) {
            auto offset = data.size();
            data.resize(offset + chunkSize);
            auto length = receive(fd, data.data() + offset, chunkSize);
            data.resize(offset + static_cast<uint64_t>(length));
            if (!length) {
                closed = true;
                break;
            }
        }
        if (closed && !(info && info->encoding == HttpHelper::Encoding::UntilClose))
            throw runtime_error("Connection closed before the response was complete");
        if (auto tls = _connectionManager.getTLSConnection(fd))
            tls->shutdown(_connectionManager);
    } catch (const runtime_error& /*error*/) {
        _connectionManager.disconnect(fd);
        throw;
    }
    _connectionManager.disconnect(fd);

    auto content = HttpHelper::retrieveContent(data.cdata(), data.size(), info);
    if (HttpResponse::checkSuccess(info->response.code))
        return RequestOutcome::success(move(content));
    if (content.empty())
        content = "node answered with " + string(HttpResponse::getResponseCode(info->response.code));
    return RequestOutcome::failure(move(content));
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
