#pragma once
#include "network/config.hpp"
#include "protocol/log_response.hpp"
#include <cstdint>
#include <memory>
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
class RequestBridge;
} // namespace network
namespace stream {
class CancellationToken;
class LogReader;
} // namespace stream
//---------------------------------------------------------------------------
namespace server {
//---------------------------------------------------------------------------
/// The text answer of the node to a whole request
struct FetchResult {
    /// Was the request successful
    bool success = false;
    /// The response, or the error text
    std::string text;
};
//---------------------------------------------------------------------------
/// The operator's view on one node: listing, snippets and readers
class LogSession {
    /// The session name
    std::string _name;
    /// The channel to the node, null if the node is not allocated
    network::RequestBridge* _bridge;
    /// The cancellation
    stream::CancellationToken& _cancellation;
    /// The config
    network::Config _config;

    public:
    /// Bytes requested for head and tail views
    static constexpr uint64_t defaultSnippetSize = 16u * 1024;

    /// The constructor
    LogSession(std::string name, network::RequestBridge* bridge, stream::CancellationToken& cancellation, network::Config config = {});

    /// Submit a request and wait until it is final
    [[nodiscard]] FetchResult fetch(const std::string& target);
    /// The log files of the node
    [[nodiscard]] protocol::LogList list();
    /// The beginning of a log file
    [[nodiscard]] protocol::LogPart head(const std::string& filename, uint64_t bytes = defaultSnippetSize);
    /// The end of a log file
    [[nodiscard]] protocol::LogPart tail(const std::string& filename, uint64_t bytes = defaultSnippetSize);
    /// A reader on a log file, size may be 0 if unknown; null if the node is not allocated
    [[nodiscard]] std::unique_ptr<stream::LogReader> open(const std::string& filename, uint64_t size = 0);

    /// The session name
    [[nodiscard]] const std::string& getName() const { return _name; }
    /// The bridge, null if the node is not allocated
    [[nodiscard]] network::RequestBridge* getBridge() const { return _bridge; }
    /// The cancellation
    [[nodiscard]] stream::CancellationToken& getCancellation() const { return _cancellation; }
    /// The config
    [[nodiscard]] const network::Config& getConfig() const { return _config; }
};
//---------------------------------------------------------------------------
} // namespace server
} // namespace nodelog
