#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
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
/// The immutable result of one dispatcher attempt
struct RequestOutcome {
    /// The raw response, set iff the attempt succeeded
    std::shared_ptr<const std::string> payload;
    /// The error text, empty on success
    std::string error;
    /// The attempt that produced this outcome, starting at 1
    uint32_t attempt = 0;

    /// A successful attempt
    [[nodiscard]] static RequestOutcome success(std::string payload, uint32_t attempt = 1);
    /// A failed attempt
    [[nodiscard]] static RequestOutcome failure(std::string error, uint32_t attempt = 1);
};
//---------------------------------------------------------------------------
struct RequestSnapshot;
//---------------------------------------------------------------------------
/// The decision whether the consumer keeps waiting on a request
struct RetryOutcome {
    /// No further polling
    bool done = false;
    /// The error, empty on success or while pending
    std::string error;
    /// The attempt the decision is based on
    uint32_t attempt = 0;

    /// Decide for a snapshot and the error found while interpreting it.
    /// Success is final, errors are final once the dispatcher reached the ceiling.
    [[nodiscard]] static RetryOutcome evaluate(const RequestSnapshot& snapshot, std::string error, uint32_t ceiling);
};
//---------------------------------------------------------------------------
/// A consistent copy of the mutable request state
struct RequestSnapshot {
    /// Has the dispatcher produced an outcome
    bool served = false;
    /// The error text of the outcome
    std::string errorText;
    /// The number of attempts the dispatcher made so far
    uint32_t attemptCount = 0;
    /// The response of a successful attempt
    std::shared_ptr<const std::string> payload;

    /// The payload as view, empty if none
    [[nodiscard]] std::string_view view() const { return payload ? std::string_view(*payload) : std::string_view(); }
};
//---------------------------------------------------------------------------
/// A request to the node, shared by the polling consumer and the dispatcher.
/// The dispatcher publishes immutable outcomes into a single completion slot.
class RemoteRequest {
    /// The request target, e.g. /logs/read?file=a.log&offset=0
    const std::string _target;
    /// Guards the slot
    mutable std::mutex _mutex;
    /// The completion slot, empty while unresolved
    std::optional<RequestOutcome> _outcome;
    /// The attempt count survives reopen
    uint32_t _attempts;

    public:
    /// The constructor
    explicit RemoteRequest(std::string target) : _target(std::move(target)), _mutex(), _outcome(), _attempts(0) {}
    /// Delete copy
    RemoteRequest(const RemoteRequest&) = delete;
    /// Delete copy assignment
    RemoteRequest& operator=(const RemoteRequest&) = delete;

    /// Get the target
    [[nodiscard]] const std::string& getTarget() const { return _target; }
    /// Publish the outcome of an attempt, marks the request served
    void publish(RequestOutcome outcome);
    /// Mark the request unresolved again before a new attempt
    void reopen();
    /// Take a consistent snapshot
    [[nodiscard]] RequestSnapshot snapshot() const;
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
