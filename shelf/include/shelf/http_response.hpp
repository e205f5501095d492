/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>
#include "shelf/types.hpp"

namespace shelf {

struct HttpResponse {
    Status status = Status::Ok;
    std::vector<std::pair<ResponseHeader, std::string>> headers;
    std::string body;        // raw bytes; may hold non-UTF-8 file content
};

// Status line only: "HTTP/1.1 <code> <reason>\r\n\r\n" once serialized.
HttpResponse make_response(Status sc);

// Text body with Content-Type (text/plain unless given) and Content-Length.
HttpResponse make_text_response(Status sc,
                                std::string body,
                                const ContentType& ctype = ContentType::text_plain());

// Arbitrary bytes, same header shape, application/octet-stream unless given.
HttpResponse make_binary_response(Status sc,
                                  std::string bytes,
                                  const ContentType& ctype = ContentType::octet_stream());

// "HTTP/1.1 200 OK"
std::string status_line(Status sc);

// Status line, header lines and the blank line; no body.
std::string serialize_head(const HttpResponse& r);

// serialize_head(r) + body.
std::string serialize(const HttpResponse& r);

} // namespace shelf
