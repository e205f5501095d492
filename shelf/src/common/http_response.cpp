/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/http_response.hpp"
#include <sstream>

namespace shelf {

static HttpResponse with_body(Status sc, std::string body, const ContentType& ctype) {
    HttpResponse r;
    r.status = sc;
    r.headers.emplace_back(ResponseHeader::ContentType, ctype.str());
    r.headers.emplace_back(ResponseHeader::ContentLength, std::to_string(body.size()));
    r.body = std::move(body);
    return r;
}

HttpResponse make_response(Status sc) {
    HttpResponse r;
    r.status = sc;
    return r;
}

HttpResponse make_text_response(Status sc, std::string body, const ContentType& ctype) {
    return with_body(sc, std::move(body), ctype);
}

HttpResponse make_binary_response(Status sc, std::string bytes, const ContentType& ctype) {
    return with_body(sc, std::move(bytes), ctype);
}

std::string status_line(Status sc) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code(sc) << " " << reason_phrase(sc);
    return oss.str();
}

std::string serialize_head(const HttpResponse& r) {
    std::ostringstream oss;
    oss << status_line(r.status) << "\r\n";
    for (const auto& kv : r.headers) {
        oss << response_header_prefix(kv.first) << kv.second << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

std::string serialize(const HttpResponse& r) {
    std::string out = serialize_head(r);
    out.append(r.body);
    return out;
}

} // namespace shelf
