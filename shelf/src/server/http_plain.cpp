/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/connection.hpp"
#include "shelf/internal/http_parser.hpp"
#include "shelf/internal/utils.hpp"
#include "shelf/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace shelf::internal {

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Total request size implied by the head; 0 when there is no usable
// Content-Length and the request ends at the blank line. False when the
// declared body cannot fit in max_request.
static bool expected_total(const std::string& req, std::size_t hdr_end,
                           std::size_t max_request, std::size_t& total) {
    std::vector<std::string> lines = split_lines(req.substr(0, hdr_end));
    lines.erase(lines.begin());
    shelf::RequestHeaders h;
    h.parse(lines);
    std::size_t cl = 0;
    total = 0;
    if (!content_length(h, cl)) return true;
    const std::size_t head_len = hdr_end + 4;
    if (head_len > max_request || cl > max_request - head_len) return false;
    total = head_len + cl;
    return true;
}

ReadStatus recv_http_request(int fd, std::size_t max_request, std::string& raw,
                             std::chrono::steady_clock::time_point deadline) {
    std::string req;
    req.reserve(4096);
    char buf[4096];
    std::size_t hdr_end = std::string::npos;
    std::size_t scanned = 0;
    std::size_t total = 0;

    while (true) {
        if (hdr_end == std::string::npos) {
            hdr_end = req.find("\r\n\r\n", scanned);
            scanned = req.size() < 3 ? 0 : req.size() - 3;
            if (hdr_end != std::string::npos) {
                if (!expected_total(req, hdr_end, max_request, total)) return ReadStatus::TooLarge;
                if (total == 0) break;
            }
        }
        if (hdr_end != std::string::npos && req.size() >= total) break;
        if (req.size() > max_request) return ReadStatus::TooLarge;
        if (std::chrono::steady_clock::now() >= deadline) return ReadStatus::TimedOut;

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && !req.empty()) {
                // Receive timeout mid-body: the upload is short of Content-Length.
                if (total != 0) return ReadStatus::Incomplete;
                // Partial head: serve what arrived.
                break;
            }
            return ReadStatus::Closed;
        }
        if (n == 0) {
            if (req.empty()) return ReadStatus::Closed;
            if (total != 0) return ReadStatus::Incomplete;
            break;
        }
        req.append(buf, buf + n);
    }

    if (req.size() > max_request) return ReadStatus::TooLarge;
    raw.swap(req);
    return ReadStatus::Ok;
}

// --- Per-request pipeline ---

shelf::HttpResponse process_request(const std::string& raw,
                                    const shelf::Router& router,
                                    const std::string& peer_ip)
{
    shelf::HttpRequest R;
    if (!parse_request(raw, R)) {
        shelf::log_line("[400] ip=" + peer_ip + " reason=MALFORMED_REQUEST_LINE");
        return make_text_response(Status::BadRequest, "malformed request line.");
    }

    if (R.version != Version::Http11) {
        shelf::log_line("[400] ip=" + peer_ip + " reason=UNSUPPORTED_VERSION version=" +
                        version_str(R.version));
        return make_text_response(Status::BadRequest,
                                  "this server only supports HTTP version 1.1.");
    }

    shelf::HttpResponse resp = router.route(R);
    shelf::log_line("[" + std::to_string(status_code(resp.status)) + "] " +
                    method_str(R.method) + " " + R.path + " ip=" + peer_ip);
    return resp;
}

bool send_response(int fd, const shelf::HttpResponse& resp) {
    const std::string h = serialize_head(resp);
    if (!send_all(fd, h.data(), h.size())) return false;
    return send_all(fd, resp.body.data(), resp.body.size());
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const shelf::ServerConfig& cfg,
                             const shelf::Router& router,
                             const std::string& peer_ip)
{
    FdGuard conn(fd);

    // Per-connection kernel timeouts
    timeval tv{cfg.io_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string raw;
    shelf::HttpResponse resp;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(cfg.request_timeout_sec);
    switch (recv_http_request(fd, cfg.max_request, raw, deadline)) {
        case ReadStatus::Closed:
            return;
        case ReadStatus::TimedOut:
            shelf::log_line("[NET] ip=" + peer_ip + " request deadline exceeded");
            return;
        case ReadStatus::Incomplete:
            shelf::log_line("[400] ip=" + peer_ip + " reason=INCOMPLETE_BODY");
            resp = make_text_response(Status::BadRequest, "incomplete request body.");
            break;
        case ReadStatus::TooLarge:
            shelf::log_line("[400] ip=" + peer_ip + " reason=REQUEST_TOO_LARGE");
            resp = make_text_response(Status::BadRequest, "request too large.");
            break;
        case ReadStatus::Ok:
            resp = process_request(raw, router, peer_ip);
            break;
    }

    if (!send_response(fd, resp)) {
        shelf::log_line(std::string("[NET] ip=") + peer_ip + " send failed: " + std::strerror(errno));
        return;
    }
    ::shutdown(fd, SHUT_WR);
}

} // namespace shelf::internal
