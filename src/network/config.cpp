#include "network/config.hpp"
#include "utils/utils.hpp"
#include <cstdlib>
#include <limits>
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
namespace {
//---------------------------------------------------------------------------
optional<uint64_t> readVariable(const char* name, uint64_t min, uint64_t max)
// Reads a numeric environment variable
{
    auto value = getenv(name);
    if (!value)
        return nullopt;
    auto number = utils::parseUnsigned(value);
    if (!number.has_value() || *number < min || *number > max)
        throw runtime_error(string("Invalid value for ") + name + ": " + value);
    return number;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
Config Config::fromEnvironment()
// Creates the config with environment overrides
{
    Config config;
    if (auto v = readVariable("NODELOG_POLL_INTERVAL_MS", 1, 60 * 1000))
        config.pollInterval = chrono::milliseconds(*v);
    if (auto v = readVariable("NODELOG_RETRY_CEILING", 1, numeric_limits<uint32_t>::max()))
        config.retryCeiling = static_cast<uint32_t>(*v);
    if (auto v = readVariable("NODELOG_SUBMISSION_CAPACITY", 1, 1ull << 24))
        config.submissionCapacity = *v;
    if (auto v = readVariable("NODELOG_DISPATCHER_THREADS", 1, 256))
        config.dispatcherThreads = static_cast<unsigned>(*v);
    if (auto v = readVariable("NODELOG_TLS_VERIFY", 0, 1))
        config.verifyPeer = *v == 1;
    if (auto file = getenv("NODELOG_CA_FILE"))
        config.caFile = file;
    return config;
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
