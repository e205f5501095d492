/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/types.hpp"
#include "shelf/internal/utils.hpp"
#include <utility>

namespace shelf {

bool method_from_string(const std::string& s, Method& out) {
    if (s == "GET")    { out = Method::Get;    return true; }
    if (s == "POST")   { out = Method::Post;   return true; }
    if (s == "PUT")    { out = Method::Put;    return true; }
    if (s == "DELETE") { out = Method::Delete; return true; }
    return false;
}

bool version_from_string(const std::string& s, Version& out) {
    if (s == "HTTP/1.0") { out = Version::Http10; return true; }
    if (s == "HTTP/1.1") { out = Version::Http11; return true; }
    return false;
}

const char* method_str(Method m) {
    switch (m) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "";
}

const char* version_str(Version v) {
    switch (v) {
        case Version::Http10: return "HTTP/1.0";
        case Version::Http11: return "HTTP/1.1";
    }
    return "";
}

bool request_header_from_string(const std::string& s, RequestHeader& out) {
    const std::string k = internal::lower_copy(s);
    if (k == "user-agent")     { out = RequestHeader::UserAgent;     return true; }
    if (k == "host")           { out = RequestHeader::Host;          return true; }
    if (k == "accept")         { out = RequestHeader::Accept;        return true; }
    if (k == "content-type")   { out = RequestHeader::ContentType;   return true; }
    if (k == "content-length") { out = RequestHeader::ContentLength; return true; }
    return false;
}

const char* request_header_str(RequestHeader h) {
    switch (h) {
        case RequestHeader::UserAgent:     return "User-Agent";
        case RequestHeader::Host:          return "Host";
        case RequestHeader::Accept:        return "Accept";
        case RequestHeader::ContentType:   return "Content-Type";
        case RequestHeader::ContentLength: return "Content-Length";
    }
    return "";
}

const char* response_header_prefix(ResponseHeader h) {
    switch (h) {
        case ResponseHeader::ContentType:   return "Content-Type: ";
        case ResponseHeader::ContentLength: return "Content-Length: ";
    }
    return "";
}

int status_code(Status s) {
    return static_cast<int>(s);
}

const char* reason_phrase(Status s) {
    switch (s) {
        case Status::Ok:                  return "OK";
        case Status::Created:             return "Created";
        case Status::BadRequest:          return "Bad Request";
        case Status::NotFound:            return "Not Found";
        case Status::Conflict:            return "Conflict";
        case Status::InternalServerError: return "Internal Server Error";
    }
    return "";
}

ContentType ContentType::parse(const std::string& value) {
    std::string v = internal::lower_copy(value);
    if (v == "text/plain") return text_plain();
    if (v == "application/octet-stream") return octet_stream();
    return ContentType(Kind::Other, std::move(v));
}

std::string ContentType::str() const {
    switch (_kind) {
        case Kind::TextPlain:   return "text/plain";
        case Kind::OctetStream: return "application/octet-stream";
        case Kind::Other:       return _raw;
    }
    return _raw;
}

} // namespace shelf
