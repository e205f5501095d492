/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/server.hpp"
#include "shelf/log.hpp"
#include "shelf/internal/connection.hpp"
#include "shelf/internal/file_store.hpp"
#include "shelf/internal/redis_store.hpp"
#include "shelf/internal/worker_pool.hpp"

#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace shelf {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

static std::unique_ptr<BlobStore> make_store(const ServerConfig& cfg) {
    if (cfg.store_use_redis) {
        internal::RedisBlobStore::Options ropt;
        ropt.host       = cfg.redis.host;
        ropt.port       = cfg.redis.port;
        ropt.db         = cfg.redis.db;
        ropt.password   = cfg.redis.password;
        ropt.key_prefix = cfg.redis.key_prefix;
        ropt.pool_size  = cfg.redis.pool_size;
        ropt.timeout_ms = cfg.redis.timeout_ms;

        auto store = std::make_unique<internal::RedisBlobStore>();
        if (!store->init(ropt)) {
            throw std::runtime_error("BlobStore: failed to init Redis backend");
        }
        return store;
    }
    if (cfg.directory.empty()) {
        throw std::runtime_error("BlobStore: directory is required when Redis is disabled");
    }
    return std::make_unique<internal::FileBlobStore>(cfg.directory);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg),
      _own_store(make_store(cfg)),
      _store(*_own_store),
      _router(_store, cfg.strict_paths)
{
}

Server::Server(const ServerConfig& cfg, BlobStore& store)
    : _cfg(cfg),
      _store(store),
      _router(_store, cfg.strict_paths)
{
}

Server::~Server() {
    stop();
}

void Server::stop() {
    // Set stop flag; shutting the listen socket down wakes accept().
    _stop.store(true);
    int fd = _listen_fd.load();
    if (fd >= 0) {
        (void)::shutdown(fd, SHUT_RDWR);
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        shelf::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_cfg.port);
    if (inet_pton(AF_INET, _cfg.bind_address.c_str(), &addr.sin_addr) != 1) {
        shelf::log_line("[FATAL] bad bind address: " + _cfg.bind_address);
        ::close(srv);
        throw std::runtime_error("bad bind address");
    }

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        shelf::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        shelf::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        _bound_port.store(ntohs(bound.sin_port));
    }
    return srv;
}

void Server::run() {
    shelf::log_line("[INFO] Shelf server starting...");
    shelf::log_line("[INFO] Address: " + _cfg.bind_address + ":" + std::to_string(_cfg.port));
    if (_cfg.store_use_redis) {
        shelf::log_line(std::string("[INFO] Store backend: REDIS host=") + _cfg.redis.host +
                        ":" + std::to_string(_cfg.redis.port) +
                        " db=" + std::to_string(_cfg.redis.db) +
                        " prefix=" + _cfg.redis.key_prefix);
    } else {
        shelf::log_line("[INFO] Store backend: FILE " + _cfg.directory);
    }
    if (_cfg.strict_paths) {
        shelf::log_line("[INFO] Strict file names: ENABLED");
    }
    shelf::log_line("[INFO] Workers=" + std::to_string(_cfg.workers) +
                    " max_request=" + std::to_string(_cfg.max_request) +
                    " io_timeout=" + std::to_string(_cfg.io_timeout_sec) + "s" +
                    " request_timeout=" + std::to_string(_cfg.request_timeout_sec) + "s");

    serve_plain();
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    _listen_fd.store(srv);
    shelf::log_line("[INFO] Listening HTTP on " + _cfg.bind_address + ":" +
                    std::to_string(_bound_port.load()));

    internal::WorkerPool pool(_cfg.workers, [this](int fd, const std::string& peer) {
        internal::handle_connection_plain(fd, _cfg, _router, peer);
    });

    while (!_stop.load()) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load()) break;
            // transient error; continue
            shelf::log_line(std::string("[NET] accept() failed: ") + std::strerror(errno));
            continue;
        }
        (void)set_nodelay(fd);
        pool.submit(fd, sockaddr_to_ip(cli));
    }

    _listen_fd.store(-1);
    ::close(srv);
    pool.shutdown();
    shelf::log_line("[INFO] Shelf server stopped");
}

} // namespace shelf
