/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/worker_pool.hpp"
#include "shelf/log.hpp"

#include <exception>
#include <utility>
#include <unistd.h>

namespace shelf::internal {

WorkerPool::WorkerPool(int threads, Job job)
    : _job(std::move(job))
{
    if (threads <= 0) threads = 1;
    _threads.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        _threads.emplace_back(&WorkerPool::loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(int fd, std::string peer_ip) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (!_stopping) {
            _queue.push_back(Pending{fd, std::move(peer_ip)});
            fd = -1;
        }
    }
    if (fd >= 0) {
        ::close(fd);
        return;
    }
    _cv.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _stopping = true;
    }
    _cv.notify_all();
    for (auto& t : _threads) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::loop() {
    while (true) {
        Pending p;
        {
            std::unique_lock<std::mutex> lk(_mtx);
            _cv.wait(lk, [&]{ return _stopping || !_queue.empty(); });
            if (_queue.empty()) return;     // stopping and drained
            p = std::move(_queue.front());
            _queue.pop_front();
        }

        // The job owns and closes the fd.
        try {
            _job(p.fd, p.peer_ip);
        } catch (const std::exception& e) {
            shelf::log_line(std::string("[ERROR] ip=") + p.peer_ip +
                            " connection handler failed: " + e.what());
        }
    }
}

} // namespace shelf::internal
