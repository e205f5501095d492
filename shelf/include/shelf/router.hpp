/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include "shelf/blob_store.hpp"
#include "shelf/http_request.hpp"
#include "shelf/http_response.hpp"

namespace shelf {

// Maps a parsed request to a response. Holds no per-request state, so one
// Router is shared by all workers.
//
// Dispatch, first match wins:
//   GET  /             -> 200, no headers
//   GET  /echo/...     -> echo
//   GET  /user-agent   -> User-Agent reflection
//   GET  /files/...    -> blob read
//   POST /files/...    -> blob create
//   otherwise          -> 404
class Router {
public:
    // store must outlive the router. strict_paths rejects file names that
    // could escape the storage root.
    explicit Router(BlobStore& store, bool strict_paths = false);

    HttpResponse route(const HttpRequest& r) const;

private:
    BlobStore& _store;
    bool       _strict_paths;

    HttpResponse echo(const HttpRequest& r) const;
    HttpResponse user_agent(const HttpRequest& r) const;
    HttpResponse read_file(const HttpRequest& r) const;
    HttpResponse write_file(const HttpRequest& r) const;
};

} // namespace shelf
