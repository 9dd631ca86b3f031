#include "server/log_download.hpp"
#include "server/content_server.hpp"
#include "server/response_writer.hpp"
#include "stream/log_reader.hpp"
#include "utils/utils.hpp"
#include <chrono>
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
bool LogDownload::transmit(const network::HttpRequest& request, ResponseWriter& writer, const string& sessionName, const string& filename, uint64_t size, network::RequestBridge* bridge, stream::CancellationToken& cancellation, network::Config config)
// Transfer the log file
{
    if (!bridge) {
        writer.setHeader("Content-Type", "text/plain; charset=utf-8");
        writer.write("ERROR: Node is not allocated\n");
        return false;
    }
    writer.setHeader("Content-Disposition", utils::formatMediaType("attachment", {{"filename", sessionName + "_" + filename}}));
    writer.setHeader("Content-Type", "application/octet-stream");

    stream::LogReader reader(filename, *bridge, cancellation, size, config);
    auto now = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
    return ContentServer(config).serve(request, writer, filename, reader, now);
}
//---------------------------------------------------------------------------
} // namespace nodelog::server
