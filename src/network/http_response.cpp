#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
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
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            string_view httpType = getResponseType(response.type);
            line = line.substr(min(line.size(), httpType.size() + 1));

            // the response code, only the number is compared as reason phrases vary
            response.code = Code::UNKNOWN;
            for (auto code = static_cast<uint8_t>(Code::OK_200); code <= static_cast<uint8_t>(Code::SERVICE_UNAVAILABLE_503); code++) {
                const string_view responseCode = getResponseCode(static_cast<Code>(code));
                if (line.substr(0, 3) == responseCode.substr(0, 3)) {
                    response.code = static_cast<Code>(code);
                    break;
                }
            }
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + strHeaderSeperator.size());
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.remove_suffix(1);
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpResponse::serialize(const HttpResponse& response)
// Serialize the status line and the headers
{
    string httpHeader = getResponseType(response.type);
    httpHeader += " ";
    httpHeader += getResponseCode(response.code);
    httpHeader += "\r\n";
    for (const auto& h : response.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<const uint8_t*>(httpHeader.data()), reinterpret_cast<const uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
