/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <atomic>
#include <cstdint>
#include "shelf/blob_store.hpp"
#include "shelf/router.hpp"
#include "shelf/server_config.hpp"

namespace shelf {

// Plain HTTP/1.1 server: one request per connection, served by a fixed
// worker pool.
class Server {
public:
    // Builds the blob store from cfg (directory or Redis). Throws
    // std::runtime_error if the backend cannot be initialized.
    explicit Server(const ServerConfig& cfg);

    // Use a caller-owned store instead; it must outlive the server.
    Server(const ServerConfig& cfg, BlobStore& store);

    ~Server();

    // Blocking run: create socket, listen and accept until stop().
    void run();

    // Sets the stop flag and unblocks accept.
    void stop();

    // Port actually bound (useful with port 0); 0 until listening.
    uint16_t bound_port() const { return _bound_port.load(); }

private:
    ServerConfig _cfg;
    std::unique_ptr<BlobStore> _own_store;
    BlobStore& _store;
    Router _router;
    std::atomic<bool> _stop{false};
    std::atomic<int> _listen_fd{-1};
    std::atomic<uint16_t> _bound_port{0};

    void serve_plain();

    // helpers
    int create_listen_socket();
};

} // namespace shelf
