#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
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
namespace nodelog {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string_view HttpRequest::getHeader(string_view name) const
// Case insensitive header lookup
{
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() && equal(key.begin(), key.end(), name.begin(), [](char a, char b) { return tolower(static_cast<unsigned char>(a)) == tolower(static_cast<unsigned char>(b)); }))
            return value;
    }
    return {};
}
//---------------------------------------------------------------------------
string_view HttpRequest::getQuery(string_view name) const
// Query lookup
{
    auto it = queries.find(string(name));
    if (it == queries.end())
        return {};
    return it->second;
}
//---------------------------------------------------------------------------
void HttpRequest::setTarget(string_view target)
// Split path and query
{
    static constexpr string_view strQuerySeperator = "=";
    static constexpr string_view strQueryStart = "?";
    static constexpr string_view strQueryAnd = "&";

    queries.clear();
    auto queriesPos = target.find(strQueryStart);
    if (queriesPos == target.npos) {
        path = target;
        return;
    }

    path = target.substr(0, queriesPos);
    auto queryString = target.substr(queriesPos + 1);
    while (true) {
        auto queryPos = queryString.find(strQueryAnd);
        string_view query;
        if (queryPos == queryString.npos)
            query = queryString;
        else
            query = queryString.substr(0, queryPos);

        // split between key and value (value might be unnecassary)
        auto keyPos = query.find(strQuerySeperator);
        string_view key, value = "";
        if (keyPos == query.npos) {
            key = query;
        } else {
            key = query.substr(0, keyPos);
            value = query.substr(keyPos + 1);
        }
        if (key.size() > 0)
            queries.emplace(utils::decodeUrlParameters(key), utils::decodeUrlParameters(value));
        if (queryPos == queryString.npos)
            break;
        queryString = queryString.substr(queryPos + 1);
    }
}
//---------------------------------------------------------------------------
HttpRequest HttpRequest::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpRequest request;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpRequest: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpRequest: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // parse method
            auto methodEnd = line.find(' ');
            if (methodEnd == line.npos)
                throw runtime_error("Invalid HttpRequest: Needs to start with request method!");
            auto methodName = line.substr(0, methodEnd);
            auto found = false;
            for (auto m = static_cast<uint8_t>(Method::GET); m <= static_cast<uint8_t>(Method::DELETE); m++) {
                if (methodName == getRequestMethod(static_cast<Method>(m))) {
                    request.method = static_cast<Method>(m);
                    found = true;
                }
            }
            if (!found)
                throw runtime_error("Invalid HttpRequest: Needs to start with request method!");
            line = line.substr(methodEnd + 1);

            // parse path, requires HTTP type, otherwise invalid
            pos = line.find(' ');
            if (pos == line.npos || !pos)
                throw runtime_error("Invalid HttpRequest: Could not find path, or missing HTTP type!");
            request.setTarget(line.substr(0, pos));
            line = line.substr(pos + 1);

            // the http type
            if (line.starts_with(strHttp1_0)) {
                request.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                request.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpRequest: Needs to be a HTTP type 1.0 or 1.1!");
            }
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpRequest: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + strHeaderSeperator.size());
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.remove_suffix(1);
            request.headers.emplace(key, value);
        }
    }

    return request;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path;
    if (request.queries.size())
        httpHeader += "?";
    auto it = request.queries.begin();
    while (it != request.queries.end()) {
        httpHeader += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
        if (++it != request.queries.end())
            httpHeader += "&";
    }
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<const uint8_t*>(httpHeader.data()), reinterpret_cast<const uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace nodelog
