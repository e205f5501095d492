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
#include <cstddef>
#include <cstdint>

namespace shelf {

struct ServerConfig {
    // Core
    std::string bind_address = "127.0.0.1";
    uint16_t    port = 4221;
    int         workers = 8;

    // Requests larger than this are answered with 400
    std::size_t max_request = 1024*1024;
    int         io_timeout_sec = 5;      // per recv/send
    int         request_timeout_sec = 30; // whole request read

    // File backend: blob path = directory + name (no separator added)
    std::string directory;

    // Reject file names with "..", a leading '/' or NUL
    bool strict_paths = false;

    // Empty disables the log file
    std::string log_file = "shelf.log";

    // ---- Redis blob backend (replaces directory when enabled) ----
    bool store_use_redis = false;
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "shelf:blob:";
        int         pool_size  = 8;
        int         timeout_ms = 200;
    } redis;
};

} // namespace shelf
