/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shelf::internal {

// Fixed set of threads serving accepted sockets, one connection per job.
// A job that throws is logged and the worker carries on. Jobs own the fd.
class WorkerPool {
public:
    using Job = std::function<void(int fd, const std::string& peer_ip)>;

    WorkerPool(int threads, Job job);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Takes ownership of fd. After shutdown() the fd is closed immediately.
    void submit(int fd, std::string peer_ip);

    // Finish queued connections, then join all workers.
    void shutdown();

    std::size_t size() const { return _threads.size(); }

private:
    struct Pending {
        int         fd;
        std::string peer_ip;
    };

    Job                      _job;
    std::mutex               _mtx;
    std::condition_variable  _cv;
    std::deque<Pending>      _queue;
    bool                     _stopping = false;
    std::vector<std::thread> _threads;

    void loop();
};

} // namespace shelf::internal
