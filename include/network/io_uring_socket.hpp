#pragma once
#ifndef NODELOG_HAS_IO_URING
#error "You must not include io_uring_socket.hpp when building without uring support"
#endif
#include "network/socket.hpp"
#include <liburing.h>
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
/// This exchanges messages with the io_uring library for minimizing
/// syscalls and unnecessary kernel overhead
class IOUringSocket : public Socket {
    private:
    /// The uring buffer
    struct io_uring _uring;

    public:
    /// The IO Uring Socket Constructor
    explicit IOUringSocket(uint32_t entries);
    /// The destructor
    ~IOUringSocket() noexcept override;

    /// Prepare a submission (sqe) send, linked with a timeout if the request has one
    io_uring_sqe* send_prep(Request& req, int32_t msg_flags = 0, uint8_t flags = 0);
    /// Prepare a submission (sqe) recv, linked with a timeout if the request has one
    io_uring_sqe* recv_prep(Request& req, int32_t msg_flags = 0, uint8_t flags = 0);

    /// Prepare a submission send
    bool send(Request& req, int32_t msg_flags = 0) override {
        return send_prep(req, msg_flags);
    }
    /// Prepare a submission recv
    bool recv(Request& req, int32_t msg_flags = 0) override {
        return recv_prep(req, msg_flags);
    }

    /// Get a completion (cqe) event and mark it as seen; return the SQE attached Request
    [[nodiscard]] Request* complete() override;
    /// Submit uring to the kernel and return the number of submitted entries
    int32_t submit() override;

    private:
    /// Link a timeout to the previous sqe
    void linkTimeout(io_uring_sqe* sqe, Request& req);
};
//---------------------------------------------------------------------------
} // namespace nodelog::network
