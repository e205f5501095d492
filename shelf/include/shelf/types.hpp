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

namespace shelf {

enum class Method {
    Get,
    Post,
    Put,
    Delete
};

enum class Version {
    Http10,
    Http11
};

// Request headers we keep; everything else is dropped by the parser.
enum class RequestHeader {
    UserAgent,
    Host,
    Accept,
    ContentType,
    ContentLength
};

enum class ResponseHeader {
    ContentType,
    ContentLength
};

// The only outcomes the server produces.
enum class Status {
    Ok                  = 200,
    Created             = 201,
    BadRequest          = 400,
    NotFound            = 404,
    Conflict            = 409,
    InternalServerError = 500
};

// Exact, case-sensitive token match ("GET", "HTTP/1.1", ...).
bool method_from_string(const std::string& s, Method& out);
bool version_from_string(const std::string& s, Version& out);
const char* method_str(Method m);
const char* version_str(Version v);

// Case-insensitive header name lookup.
bool request_header_from_string(const std::string& s, RequestHeader& out);
const char* request_header_str(RequestHeader h);

// Wire prefix including the ": " separator, e.g. "Content-Type: ".
const char* response_header_prefix(ResponseHeader h);

int status_code(Status s);
const char* reason_phrase(Status s);

// Media type of a body. Two known kinds; anything else is kept verbatim
// (lower-cased) as Other.
class ContentType {
public:
    enum class Kind { TextPlain, OctetStream, Other };

    ContentType() = default;

    static ContentType text_plain() { return ContentType(Kind::TextPlain, {}); }
    static ContentType octet_stream() { return ContentType(Kind::OctetStream, {}); }
    static ContentType parse(const std::string& value);

    Kind kind() const { return _kind; }
    std::string str() const;

    bool operator==(const ContentType& o) const {
        return _kind == o._kind && _raw == o._raw;
    }
    bool operator!=(const ContentType& o) const { return !(*this == o); }

private:
    ContentType(Kind k, std::string raw) : _kind(k), _raw(std::move(raw)) {}

    Kind        _kind = Kind::TextPlain;
    std::string _raw;   // only for Kind::Other
};

} // namespace shelf
