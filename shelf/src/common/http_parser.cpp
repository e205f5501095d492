/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/http_parser.hpp"
#include "shelf/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace shelf::internal {

void split_head_body(const std::string& raw,
                     std::string& head,
                     std::optional<std::string>& body)
{
    std::size_t hdr_end = raw.find("\r\n\r\n");
    if (hdr_end == std::string::npos) {
        head = raw;
        body.reset();
        return;
    }
    head = raw.substr(0, hdr_end);
    body = raw.substr(hdr_end + 4);
}

std::vector<std::string> split_lines(const std::string& head) {
    std::vector<std::string> lines = split_char(head, '\n');
    for (auto& l : lines) {
        if (!l.empty() && l.back() == '\r') l.pop_back();
    }
    return lines;
}

bool parse_request_line(const std::string& line, shelf::HttpRequest& r) {
    std::istringstream iss(line);
    std::vector<std::string> parts;
    for (std::string tok; iss >> tok; ) {
        parts.push_back(tok);
        if (parts.size() > 3) return false;
    }
    if (parts.size() != 3) return false;

    shelf::Method m;
    shelf::Version v;
    if (!method_from_string(parts[0], m)) return false;
    if (!version_from_string(parts[2], v)) return false;

    r.method  = m;
    r.path    = parts[1];
    r.version = v;
    return true;
}

bool parse_request(const std::string& raw, shelf::HttpRequest& r) {
    std::string head;
    split_head_body(raw, head, r.body);

    std::vector<std::string> lines = split_lines(head);
    if (!parse_request_line(lines.front(), r)) return false;

    lines.erase(lines.begin());
    r.headers = shelf::RequestHeaders{};
    r.headers.parse(lines);
    return true;
}

bool content_length(const shelf::RequestHeaders& h, std::size_t& out) {
    auto v = h.get(shelf::RequestHeader::ContentLength);
    if (!v || v->empty()) return false;
    if (!std::all_of(v->begin(), v->end(), [](unsigned char c){ return std::isdigit(c); })) {
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(*v));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace shelf::internal
