#include "server/log_session.hpp"
#include "network/request_bridge.hpp"
#include "stream/cancellation.hpp"
#include "stream/log_reader.hpp"
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::server {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
LogSession::LogSession(string name, network::RequestBridge* bridge, stream::CancellationToken& cancellation, network::Config config) : _name(move(name)), _bridge(bridge), _cancellation(cancellation), _config(config)
// The constructor
{
}
//---------------------------------------------------------------------------
FetchResult LogSession::fetch(const string& target)
// Submit and poll with the same ceiling as chunk reads
{
    FetchResult result;
    if (!_bridge) {
        result.text = "Node is not allocated";
        return result;
    }
    auto request = _bridge->submit(target);
    if (!request) {
        result.text = "submission queue is full";
        return result;
    }
    while (true) {
        if (_cancellation.cancelled()) {
            result.text = "interrupted";
            return result;
        }
        auto snapshot = network::RequestBridge::snapshot(*request);
        auto outcome = network::RetryOutcome::evaluate(snapshot, snapshot.errorText, _config.retryCeiling);
        if (outcome.done) {
            result.success = outcome.error.empty();
            result.text = result.success ? string(snapshot.view()) : move(outcome.error);
            return result;
        }
        _cancellation.waitFor(_config.pollInterval);
    }
}
//---------------------------------------------------------------------------
protocol::LogList LogSession::list()
// The log files of the node
{
    auto result = fetch(protocol::LogRequests::list());
    return protocol::LogList::decode(result.success, result.text, _name);
}
//---------------------------------------------------------------------------
protocol::LogPart LogSession::head(const string& filename, uint64_t bytes)
// The beginning of a log file
{
    auto result = fetch(protocol::LogRequests::head(filename, bytes));
    return protocol::LogPart::decode(result.success, result.text);
}
//---------------------------------------------------------------------------
protocol::LogPart LogSession::tail(const string& filename, uint64_t bytes)
// The end of a log file
{
    auto result = fetch(protocol::LogRequests::tail(filename, bytes));
    return protocol::LogPart::decode(result.success, result.text);
}
//---------------------------------------------------------------------------
unique_ptr<stream::LogReader> LogSession::open(const string& filename, uint64_t size)
// A reader on a log file
{
    if (!_bridge)
        return nullptr;
    return make_unique<stream::LogReader>(filename, *_bridge, _cancellation, size, _config);
}
//---------------------------------------------------------------------------
} // namespace nodelog::server
