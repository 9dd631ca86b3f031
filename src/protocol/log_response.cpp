#include "protocol/log_response.hpp"
#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <cstdio>
#include <string>
//---------------------------------------------------------------------------
// NodeLog - Remote Node Log Access Library
// NodeLog Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace nodelog::protocol {
//---------------------------------------------------------------------------
using namespace std;
using network::Config;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
vector<string_view> splitLines(string_view text)
// Splits at every newline, n newlines give n + 1 lines
{
    vector<string_view> lines;
    while (true) {
        auto pos = text.find('\n');
        if (pos == text.npos) {
            lines.push_back(text);
            return lines;
        }
        lines.push_back(text.substr(0, pos));
        text = text.substr(pos + 1);
    }
}
//---------------------------------------------------------------------------
string joinLines(const vector<string_view>& lines)
// Renders the lines for error messages
{
    string result = "[";
    for (auto i = 0u; i < lines.size(); i++) {
        if (i)
            result += " ";
        result += lines[i];
    }
    result += "]";
    return result;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
pair<double, unsigned> scaleBytes(uint64_t bytes)
// Scale to binary units
{
    constexpr uint64_t unit = 1024;
    if (bytes < unit)
        return {static_cast<double>(bytes), 0};

    auto div = unit;
    auto exp = 0u;
    for (auto n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        exp++;
    }
    return {static_cast<double>(bytes) / static_cast<double>(div), exp};
}
//---------------------------------------------------------------------------
string formatByteCount(uint64_t bytes)
// Human readable size
{
    static constexpr string_view units = "KMGTPE";
    if (bytes < 1024)
        return to_string(bytes) + "B";
    auto [value, exp] = scaleBytes(bytes);
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.1f%cB", value, units[exp]);
    return buffer;
}
//---------------------------------------------------------------------------
LogList LogList::decode(bool success, string_view response, string sessionName)
// Decodes the list of log files
{
    static constexpr string_view separator = " | ";

    LogList list;
    list.sessionName = move(sessionName);
    if (!success) {
        list.error = response;
        return list;
    }

    auto lines = splitLines(response);
    if (lines.size() < 2) {
        list.error = "incorrect response (length of lines should be at least 2): " + joinLines(lines);
        return list;
    }
    if (!lines[0].starts_with(Config::successLine)) {
        list.error = "incorrect response (first line needs to be " + string(Config::successLine) + "): " + joinLines(lines);
        return list;
    }

    for (auto it = lines.begin() + 1; it != lines.end(); ++it) {
        auto line = *it;
        if (line.empty())
            continue;

        auto pos = line.find(separator);
        if (pos == line.npos || line.find(separator, pos + separator.size()) != line.npos) {
            list.error = "incorrect response line (need to have 2 terms divided by |): " + string(line);
            list.entries.clear();
            return list;
        }
        auto sizeTerm = line.substr(pos + separator.size());
        auto size = utils::parseUnsigned(sizeTerm);
        if (!size.has_value()) {
            list.error = "incorrect size: " + string(sizeTerm) + " in line: " + string(line);
            list.entries.clear();
            return list;
        }
        list.entries.push_back(LogListItem{string(line.substr(0, pos)), *size, formatByteCount(*size)});
    }
    list.success = true;
    return list;
}
//---------------------------------------------------------------------------
LogPart LogPart::decode(bool success, string_view response)
// Decodes a head or tail of a log file
{
    LogPart part;
    if (!success) {
        part.error = response;
        return part;
    }
    part.success = true;

    auto lines = splitLines(response);
    auto begin = lines.begin();
    if (begin->starts_with(Config::successLine))
        ++begin;
    part.lines.assign(begin, lines.end());
    return part;
}
//---------------------------------------------------------------------------
ChunkResult decodeChunk(const network::RequestSnapshot& snapshot, uint64_t offset, uint32_t ceiling)
// Decodes a chunk, the first line has the format SUCCESS: from-to/total
{
    ChunkResult result;
    auto fail = [&](string error) {
        auto decision = network::RetryOutcome::evaluate(snapshot, move(error), ceiling);
        result.clear = decision.done;
        result.error = move(decision.error);
        return result;
    };

    if (!snapshot.served)
        return result;
    if (!snapshot.errorText.empty())
        return fail(snapshot.errorText);

    auto response = snapshot.view();
    auto firstLineEnd = response.find('\n');
    if (firstLineEnd == response.npos)
        return fail("could not find first line in log part response");
    auto firstLine = response.substr(0, firstLineEnd);

    // Split SUCCESS: from-to/total into its three numbers
    string prefix = string(Config::successLine) + ": ";
    string_view fields[3];
    auto valid = firstLine.starts_with(prefix);
    if (valid) {
        auto rest = firstLine.substr(prefix.size());
        auto dash = rest.find('-');
        auto slash = rest.find('/', dash == rest.npos ? 0 : dash);
        valid = dash != rest.npos && slash != rest.npos;
        if (valid) {
            fields[0] = rest.substr(0, dash);
            fields[1] = rest.substr(dash + 1, slash - dash - 1);
            fields[2] = rest.substr(slash + 1);
            for (auto field : fields)
                valid = valid && !field.empty() && field.find_first_not_of("0123456789") == field.npos;
        }
    }
    if (!valid)
        return fail("first line needs to have format " + prefix + "from-to/total, was [" + string(firstLine) + "]");

    auto from = utils::parseUnsigned(fields[0]);
    if (!from.has_value())
        return fail("parsing from: value out of range: " + string(fields[0]));
    if (*from != offset)
        return fail("unexpected from offset " + to_string(*from) + ", wanted " + to_string(offset));
    auto to = utils::parseUnsigned(fields[1]);
    if (!to.has_value())
        return fail("parsing to: value out of range: " + string(fields[1]));
    auto total = utils::parseUnsigned(fields[2]);
    if (!total.has_value())
        return fail("parsing total: value out of range: " + string(fields[2]));

    result.clear = true;
    result.to = *to;
    result.total = *total;
    result.data = snapshot.payload;
    result.payload = response.substr(firstLineEnd + 1);
    return result;
}
//---------------------------------------------------------------------------
string checkChunkResponse(string_view target, const shared_ptr<const string>& response)
// Decode errors of a chunk response, independent of attempts
{
    static constexpr string_view readPath = "/logs/read";
    network::HttpRequest request;
    request.setTarget(target);
    if (request.path != readPath)
        return {};
    auto offset = utils::parseUnsigned(request.getQuery("offset"));
    if (!offset.has_value())
        return "invalid chunk target: " + string(target);
    network::RequestSnapshot snapshot;
    snapshot.served = true;
    snapshot.attemptCount = 1;
    snapshot.payload = response;
    return decodeChunk(snapshot, *offset, 1).error;
}
//---------------------------------------------------------------------------
string LogRequests::list()
// The list target
{
    return "/logs/list";
}
//---------------------------------------------------------------------------
string LogRequests::read(string_view filename, uint64_t offset)
// The read target
{
    return "/logs/read?file=" + utils::encodeUrlParameters(filename) + "&offset=" + to_string(offset);
}
//---------------------------------------------------------------------------
string LogRequests::head(string_view filename, uint64_t bytes)
// The head target
{
    return "/logs/head?file=" + utils::encodeUrlParameters(filename) + "&size=" + to_string(bytes);
}
//---------------------------------------------------------------------------
string LogRequests::tail(string_view filename, uint64_t bytes)
// The tail target
{
    return "/logs/tail?file=" + utils::encodeUrlParameters(filename) + "&size=" + to_string(bytes);
}
//---------------------------------------------------------------------------
} // namespace nodelog::protocol
