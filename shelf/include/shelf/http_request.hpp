/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "shelf/types.hpp"

namespace shelf {

// Recognized request headers in arrival order. Repeated headers are all
// kept; lookups return the first occurrence.
class RequestHeaders {
public:
    using Entry = std::pair<RequestHeader, std::string>;

    // Parse "Name: value" lines. Lines without ": " and unknown names are
    // skipped; values are trimmed.
    void parse(const std::vector<std::string>& lines);

    void add(RequestHeader name, std::string value);

    std::optional<std::string> get(RequestHeader name) const;
    std::optional<ContentType> content_type() const;
    bool is_content_type(const ContentType& ct) const;

    std::size_t size() const { return _entries.size(); }
    const std::vector<Entry>& entries() const { return _entries; }

private:
    std::vector<Entry> _entries;
};

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    Method         method  = Method::Get;
    std::string    path;               // raw, not decoded: "/echo/a%20b"
    Version        version = Version::Http11;
    RequestHeaders headers;
    std::optional<std::string> body;   // nullopt: no CRLFCRLF in the request
};

} // namespace shelf
