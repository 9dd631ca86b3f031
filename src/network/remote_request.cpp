#include "network/remote_request.hpp"
#include <algorithm>
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
using namespace std;
//---------------------------------------------------------------------------
RequestOutcome RequestOutcome::success(string payload, uint32_t attempt)
// A successful attempt
{
    RequestOutcome outcome;
    outcome.payload = make_shared<const string>(move(payload));
    outcome.attempt = attempt;
    return outcome;
}
//---------------------------------------------------------------------------
RequestOutcome RequestOutcome::failure(string error, uint32_t attempt)
// A failed attempt
{
    RequestOutcome outcome;
    outcome.error = move(error);
    // An empty error would read as success
    if (outcome.error.empty())
        outcome.error = "unknown error";
    outcome.attempt = attempt;
    return outcome;
}
//---------------------------------------------------------------------------
RetryOutcome RetryOutcome::evaluate(const RequestSnapshot& snapshot, string error, uint32_t ceiling)
// Decide whether to continue polling
{
    RetryOutcome outcome;
    outcome.attempt = snapshot.attemptCount;
    if (!snapshot.served)
        return outcome;
    outcome.done = error.empty() || snapshot.attemptCount >= ceiling;
    outcome.error = move(error);
    return outcome;
}
//---------------------------------------------------------------------------
void RemoteRequest::publish(RequestOutcome outcome)
// Publish an attempt
{
    lock_guard<mutex> lock(_mutex);
    _attempts = max(_attempts, outcome.attempt);
    _outcome = move(outcome);
}
//---------------------------------------------------------------------------
void RemoteRequest::reopen()
// Reset the served state
{
    lock_guard<mutex> lock(_mutex);
    _outcome.reset();
}
//---------------------------------------------------------------------------
RequestSnapshot RemoteRequest::snapshot() const
// Take a snapshot under the lock
{
    lock_guard<mutex> lock(_mutex);
    RequestSnapshot snapshot;
    snapshot.attemptCount = _attempts;
    if (_outcome) {
        snapshot.served = true;
        snapshot.errorText = _outcome->error;
        snapshot.payload = _outcome->payload;
    }
    return snapshot;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
