/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include "shelf/http_response.hpp"
#include "shelf/router.hpp"
#include "shelf/server_config.hpp"

namespace shelf::internal {

enum class ReadStatus {
    Ok,         // raw holds one request (possibly without CRLFCRLF at EOF)
    Closed,     // peer sent nothing, or the socket failed
    TooLarge,   // more than max_request bytes, or a Content-Length that cannot fit
    Incomplete, // EOF or receive timeout before Content-Length body bytes arrived
    TimedOut    // deadline passed before the request was complete
};

// Read one request: until CRLFCRLF, then until Content-Length body bytes
// (when the header is present and numeric), or until EOF. The deadline
// bounds the whole read; SO_RCVTIMEO only bounds each recv.
ReadStatus recv_http_request(int fd, std::size_t max_request, std::string& raw,
                             std::chrono::steady_clock::time_point deadline =
                                 std::chrono::steady_clock::time_point::max());

// Parse, apply the HTTP/1.1-only policy and route.
shelf::HttpResponse process_request(const std::string& raw,
                                    const shelf::Router& router,
                                    const std::string& peer_ip);

bool send_response(int fd, const shelf::HttpResponse& resp);

// Serves one request on fd and closes it.
void handle_connection_plain(int fd,
                             const shelf::ServerConfig& cfg,
                             const shelf::Router& router,
                             const std::string& peer_ip);

} // namespace shelf::internal
