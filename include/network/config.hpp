#pragma once
#include <chrono>
#include <cstdint>
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
namespace nodelog::network {
//---------------------------------------------------------------------------
/// Config for the remote log protocol, the polling consumer and the dispatcher
struct Config {
    /// The marker the node puts in the first line of every successful response
    static constexpr std::string_view successLine = "SUCCESS";
    /// Default interval between two polls of an outstanding request
    static constexpr std::chrono::milliseconds defaultPollInterval{100};
    /// Default number of dispatcher attempts before a transient error is final
    static constexpr uint32_t defaultRetryCeiling = 16;
    /// Default number of requests the submission queue holds
    static constexpr uint64_t defaultSubmissionCapacity = 1 << 10;
    /// Default buffer size used when streaming content to a client
    static constexpr uint64_t defaultCopyBufferSize = 32u * 1024;
    /// Default number of dispatcher threads
    static constexpr unsigned defaultDispatcherThreads = 2;

    /// Interval between two polls
    std::chrono::milliseconds pollInterval = defaultPollInterval;
    /// Attempts after which an error is terminal
    uint32_t retryCeiling = defaultRetryCeiling;
    /// Capacity of the submission queue
    uint64_t submissionCapacity = defaultSubmissionCapacity;
    /// Copy buffer for content serving
    uint64_t copyBufferSize = defaultCopyBufferSize;
    /// Dispatcher threads
    unsigned dispatcherThreads = defaultDispatcherThreads;
    /// Reject https nodes with an untrusted certificate
    bool verifyPeer = true;
    /// PEM file with the trusted certificates of https nodes, empty uses the system store
    std::string caFile;

    /// Apply the NODELOG_* environment overrides to the defaults
    [[nodiscard]] static Config fromEnvironment();
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
