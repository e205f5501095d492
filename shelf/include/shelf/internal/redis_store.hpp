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
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include "shelf/blob_store.hpp"

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

namespace shelf::internal {

/**
 * Redis-backed blob store. Each blob is one string value under
 * key_prefix + key. Creation uses SET NX, so concurrent writers of the
 * same key cannot both succeed. Thread-safe via a fixed connection pool.
 */
class RedisBlobStore : public shelf::BlobStore {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                     // SELECT db
        std::string password;                     // optional
        std::string key_prefix = "shelf:blob:";   // redis key = key_prefix + key
        int         pool_size  = 8;               // number of hiredis connections
        int         timeout_ms = 200;             // connect + command timeout
    };

    RedisBlobStore();
    ~RedisBlobStore() override;
    RedisBlobStore(const RedisBlobStore&) = delete;
    RedisBlobStore& operator=(const RedisBlobStore&) = delete;

    // Builds the pool. False if no connection could be established.
    bool init(const Options& opt);

    bool exists(const std::string& key) override;
    bool read(const std::string& key, std::string& out) override;
    CreateResult create_new(const std::string& key, const std::string& data) override;

private:
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };
    std::vector<RedisConn>  _pool;
    std::deque<size_t>      _free;
    std::mutex              _pool_mtx;
    std::condition_variable _pool_cv;

    Options _opt{};

    bool connect_one(size_t idx);
    void close_one(size_t idx);
    bool auth_and_select(::redisContext* ctx);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(RedisBlobStore& s) : store(s) {}
        ~Slot() { release(); }
        void acquire();
        void release();
        ::redisContext* ctx();     // ensure connected and return pointer
    private:
        RedisBlobStore& store;
        size_t idx = (size_t)-1;
        bool   have = false;
    };
};

} // namespace shelf::internal
