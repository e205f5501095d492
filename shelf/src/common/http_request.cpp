/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/http_request.hpp"
#include "shelf/internal/utils.hpp"

namespace shelf {

void RequestHeaders::parse(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        std::size_t c = line.find(": ");
        if (c == std::string::npos) continue;
        RequestHeader name;
        if (!request_header_from_string(line.substr(0, c), name)) continue;
        std::string v = line.substr(c + 2);
        internal::trim_inplace(v);
        _entries.emplace_back(name, std::move(v));
    }
}

void RequestHeaders::add(RequestHeader name, std::string value) {
    _entries.emplace_back(name, std::move(value));
}

std::optional<std::string> RequestHeaders::get(RequestHeader name) const {
    for (const auto& e : _entries) {
        if (e.first == name) return e.second;
    }
    return std::nullopt;
}

std::optional<ContentType> RequestHeaders::content_type() const {
    auto v = get(RequestHeader::ContentType);
    if (!v) return std::nullopt;
    return ContentType::parse(*v);
}

bool RequestHeaders::is_content_type(const ContentType& ct) const {
    auto have = content_type();
    return have && *have == ct;
}

} // namespace shelf
