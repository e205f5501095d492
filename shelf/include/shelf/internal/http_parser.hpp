/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "shelf/http_request.hpp"

namespace shelf::internal {

// Split at the first CRLFCRLF. Without one, the whole buffer is the head
// and body is nullopt.
void split_head_body(const std::string& raw,
                     std::string& head,
                     std::optional<std::string>& body);

// Split the head on '\n', dropping one trailing '\r' per line.
std::vector<std::string> split_lines(const std::string& head);

// Parse "GET /path HTTP/1.1". Fills method, path and version.
bool parse_request_line(const std::string& line, shelf::HttpRequest& r);

// Full request parse. Returns false only when the request-line is bad;
// header lines never fail.
bool parse_request(const std::string& raw, shelf::HttpRequest& r);

// Numeric Content-Length of the head, if present and well-formed.
bool content_length(const shelf::RequestHeaders& h, std::size_t& out);

} // namespace shelf::internal
