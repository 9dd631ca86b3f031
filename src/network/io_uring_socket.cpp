#ifdef NODELOG_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#include <cassert>
#include <cstring>
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
IOUringSocket::IOUringSocket(uint32_t entries)
// Constructor that inits uring queue
{
    struct io_uring_params params;
    memset(&params, 0, sizeof(params));

    if (io_uring_queue_init_params(entries, &_uring, &params) < 0)
        throw runtime_error("Uring init error!");

    if (!(params.features & IORING_FEAT_FAST_POLL)) {
        io_uring_queue_exit(&_uring);
        throw runtime_error("Uring init error - IORING_FEAT_FAST_POLL not available in the kernel!");
    }
}
//---------------------------------------------------------------------------
void IOUringSocket::linkTimeout(io_uring_sqe* sqe, Request& req)
// Link a timeout to the previous sqe
{
    auto ms = req.timeout->count();
    req.kernelTimeout.tv_sec = ms / 1000;
    req.kernelTimeout.tv_nsec = (ms % 1000) * 1000 * 1000;
    sqe->flags |= IOSQE_IO_LINK;
    auto timeoutSqe = io_uring_get_sqe(&_uring);
    if (!timeoutSqe)
        throw runtime_error("Uring submission queue is full!");
    io_uring_prep_link_timeout(timeoutSqe, &req.kernelTimeout, 0);
    timeoutSqe->user_data = reinterpret_cast<uintptr_t>(nullptr);
}
//---------------------------------------------------------------------------
io_uring_sqe* IOUringSocket::send_prep(Request& req, int32_t msg_flags, uint8_t flags)
// Prepare a submission (sqe) send
{
    assert(req.length > 0);
    auto sqe = io_uring_get_sqe(&_uring);
    if (!sqe)
        return nullptr;
    io_uring_prep_send(sqe, req.fd, req.data.cdata, static_cast<uint64_t>(req.length), msg_flags | MSG_NOSIGNAL);
    sqe->flags |= flags;
    sqe->user_data = reinterpret_cast<uintptr_t>(&req);
    if (req.timeout.has_value())
        linkTimeout(sqe, req);
    return sqe;
}
//---------------------------------------------------------------------------
io_uring_sqe* IOUringSocket::recv_prep(Request& req, int32_t msg_flags, uint8_t flags)
// Prepare a submission (sqe) recv
{
    assert(req.length > 0);
    auto sqe = io_uring_get_sqe(&_uring);
    if (!sqe)
        return nullptr;
    io_uring_prep_recv(sqe, req.fd, req.data.data, static_cast<uint64_t>(req.length), msg_flags);
    sqe->flags |= flags;
    sqe->user_data = reinterpret_cast<uintptr_t>(&req);
    if (req.timeout.has_value())
        linkTimeout(sqe, req);
    return sqe;
}
//---------------------------------------------------------------------------
IOUringSocket::Request* IOUringSocket::complete()
// Get a completion (cqe) event and mark it as seen; return the SQE attached Request
{
    while (true) {
        io_uring_cqe* cqe;
        auto res = io_uring_wait_cqe(&_uring, &cqe);
        if (res)
            throw runtime_error("io_uring_wait_cqe error!");
        Request* req = nullptr;
        memcpy(&req, &cqe->user_data, sizeof(cqe->user_data));
        if (req)
            req->length = cqe->res;
        io_uring_cqe_seen(&_uring, cqe);
        // Completions of linked timeouts carry no request
        if (req)
            return req;
    }
}
//---------------------------------------------------------------------------
int32_t IOUringSocket::submit()
// Submit uring to the kernel and return the number of submitted entries
{
    return io_uring_submit(&_uring);
}
//---------------------------------------------------------------------------
IOUringSocket::~IOUringSocket() noexcept
// The destructor
{
    io_uring_queue_exit(&_uring);
}
//---------------------------------------------------------------------------
} // namespace nodelog::network
#endif
