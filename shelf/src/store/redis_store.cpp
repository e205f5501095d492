/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/redis_store.hpp"
#include "shelf/log.hpp"

#include <sys/time.h>

namespace shelf::internal {

RedisBlobStore::RedisBlobStore() = default;

RedisBlobStore::~RedisBlobStore() {
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
}

bool RedisBlobStore::init(const Options& opt) {
    _opt = opt;
    if (_opt.pool_size <= 0) _opt.pool_size = 1;

    _pool.resize(_opt.pool_size);

    // Pre-connect all slots; broken slots reconnect on use.
    size_t connected = 0;
    for (size_t i=0; i<_pool.size(); ++i) {
        if (connect_one(i)) ++connected;
    }
    if (connected == 0) {
        shelf::log_line("[STORE][redis] no connection to "+_opt.host+":"+std::to_string(_opt.port));
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _free.clear();
        for (size_t i=0; i<_pool.size(); ++i) _free.push_back(i);
    }
    shelf::log_line("[STORE] redis backend initialized: pool="+std::to_string(_pool.size())+
                    " connected="+std::to_string(connected)+
                    " host="+_opt.host+":"+std::to_string(_opt.port)+
                    " db="+std::to_string(_opt.db)+
                    " prefix="+_opt.key_prefix);
    return true;
}

bool RedisBlobStore::connect_one(size_t idx) {
    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            shelf::log_line(std::string("[STORE][redis] connect error: ")+ctx->errstr);
            redisFree(ctx);
        } else {
            shelf::log_line("[STORE][redis] connect error: NULL context");
        }
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        shelf::log_line("[STORE][redis] failed to set command timeout");
    }

    if (!auth_and_select(ctx)) {
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool RedisBlobStore::auth_and_select(::redisContext* ctx) {
    if (!_opt.password.empty()) {
        redisReply* r = (redisReply*)redisCommand(ctx, "AUTH %s", _opt.password.c_str());
        if (!r) {
            shelf::log_line("[STORE][redis] AUTH failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            shelf::log_line(std::string("[STORE][redis] AUTH error: ")+ (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    if (_opt.db != 0) {
        redisReply* r = (redisReply*)redisCommand(ctx, "SELECT %d", _opt.db);
        if (!r) {
            shelf::log_line("[STORE][redis] SELECT failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            shelf::log_line(std::string("[STORE][redis] SELECT error: ")+ (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    return true;
}

void RedisBlobStore::close_one(size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

void RedisBlobStore::Slot::acquire() {
    if (have) return;
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&]{ return !store._free.empty(); });
    idx = store._free.front();
    store._free.pop_front();
    have = true;
}

void RedisBlobStore::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(store._pool_mtx);
        store._free.push_back(idx);
    }
    store._pool_cv.notify_one();
    idx = (size_t)-1;
    have = false;
}

::redisContext* RedisBlobStore::Slot::ctx() {
    // The slot is exclusively owned by this thread until release().
    auto& c = store._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        store.close_one(idx);
        (void)store.connect_one(idx);
    }
    return store._pool[idx].ctx;
}

bool RedisBlobStore::exists(const std::string& key) {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    const std::string rkey = _opt.key_prefix + key;
    redisReply* r = (redisReply*)redisCommand(c, "EXISTS %b", rkey.data(), rkey.size());
    if (!r) return false;
    bool found = (r->type == REDIS_REPLY_INTEGER && r->integer > 0);
    if (r->type == REDIS_REPLY_ERROR) {
        shelf::log_line(std::string("[STORE][redis] EXISTS error: ")+(r->str? r->str : ""));
    }
    freeReplyObject(r);
    return found;
}

bool RedisBlobStore::read(const std::string& key, std::string& out) {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    const std::string rkey = _opt.key_prefix + key;
    redisReply* r = (redisReply*)redisCommand(c, "GET %b", rkey.data(), rkey.size());
    if (!r) {
        // Connection likely broken; next acquire will reconnect
        return false;
    }

    bool ok = false;
    if (r->type == REDIS_REPLY_STRING && r->str) {
        out.assign(r->str, r->len);
        ok = true;
    } else if (r->type == REDIS_REPLY_ERROR) {
        shelf::log_line(std::string("[STORE][redis] GET error: ")+(r->str? r->str : ""));
    }
    freeReplyObject(r);
    return ok;
}

CreateResult RedisBlobStore::create_new(const std::string& key, const std::string& data) {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return CreateResult::CreateFailed;

    const std::string rkey = _opt.key_prefix + key;
    redisReply* r = (redisReply*)redisCommand(c, "SET %b %b NX",
                                              rkey.data(), rkey.size(),
                                              data.data(), data.size());
    if (!r) {
        shelf::log_line(std::string("[STORE][redis] SET failed: ")+(c->err ? c->errstr : "no reply"));
        return CreateResult::WriteFailed;
    }

    CreateResult res = CreateResult::WriteFailed;
    if (r->type == REDIS_REPLY_NIL) {
        res = CreateResult::AlreadyExists;
    } else if (r->type == REDIS_REPLY_STATUS) {
        res = CreateResult::Ok;
    } else if (r->type == REDIS_REPLY_ERROR) {
        shelf::log_line(std::string("[STORE][redis] SET error: ")+(r->str? r->str : ""));
    }
    freeReplyObject(r);
    return res;
}

} // namespace shelf::internal
