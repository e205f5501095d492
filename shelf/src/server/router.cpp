/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/router.hpp"
#include "shelf/internal/utils.hpp"
#include "shelf/log.hpp"

#include <utility>

namespace shelf {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

Router::Router(BlobStore& store, bool strict_paths)
    : _store(store), _strict_paths(strict_paths)
{
}

HttpResponse Router::route(const HttpRequest& r) const {
    if (r.method == Method::Get) {
        if (r.path == "/") return make_response(Status::Ok);
        if (starts_with(r.path, "/echo/")) return echo(r);
        if (r.path == "/user-agent") return user_agent(r);
        if (starts_with(r.path, "/files/")) return read_file(r);
    } else if (r.method == Method::Post) {
        if (starts_with(r.path, "/files/")) return write_file(r);
    }
    return make_response(Status::NotFound);
}

HttpResponse Router::echo(const HttpRequest& r) const {
    return make_text_response(Status::Ok, internal::path_remainder(r.path));
}

// A missing User-Agent is reported as 404, not 400.
HttpResponse Router::user_agent(const HttpRequest& r) const {
    auto ua = r.headers.get(RequestHeader::UserAgent);
    if (!ua) return make_response(Status::NotFound);
    return make_text_response(Status::Ok, *ua);
}

HttpResponse Router::read_file(const HttpRequest& r) const {
    const std::string key = internal::path_remainder(r.path);
    if (_strict_paths && !internal::is_safe_key(key)) {
        return make_text_response(Status::BadRequest, "invalid file name.");
    }
    std::string data;
    if (!_store.read(key, data)) return make_response(Status::NotFound);
    return make_binary_response(Status::Ok, std::move(data), ContentType::octet_stream());
}

HttpResponse Router::write_file(const HttpRequest& r) const {
    const std::string key = internal::path_remainder(r.path);
    if (_strict_paths && !internal::is_safe_key(key)) {
        return make_text_response(Status::BadRequest, "invalid file name.");
    }
    if (!r.headers.is_content_type(ContentType::octet_stream())) {
        return make_text_response(Status::BadRequest, "unexpected content type");
    }
    if (_store.exists(key)) {
        return make_text_response(Status::Conflict, "file already exists.");
    }
    if (!r.body) {
        return make_text_response(Status::BadRequest, "no body provided.");
    }

    switch (_store.create_new(key, *r.body)) {
        case CreateResult::Ok:
            shelf::log_line("[STORE] created key=" + key +
                            " bytes=" + std::to_string(r.body->size()) +
                            " sha256=" + internal::sha256_hex(*r.body));
            return make_response(Status::Created);
        case CreateResult::AlreadyExists:
            return make_text_response(Status::Conflict, "file already exists.");
        case CreateResult::CreateFailed:
            return make_text_response(Status::InternalServerError, "failed to create file.");
        case CreateResult::WriteFailed:
            return make_text_response(Status::InternalServerError, "failed to write to file.");
    }
    return make_text_response(Status::InternalServerError, "failed to create file.");
}

} // namespace shelf
