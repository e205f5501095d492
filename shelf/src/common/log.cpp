/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/log.hpp"
#include "shelf/internal/time.hpp"
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

// Process-wide sink: the optional log file plus stdout, behind one mutex.
struct LogSink {
    std::mutex    mtx;
    std::string   path = "shelf.log";
    std::ofstream file;

    // Caller holds mtx. Opened lazily so a path change takes effect on the
    // next line.
    std::ofstream* file_unlocked() {
        if (path.empty()) return nullptr;
        if (!file.is_open()) file.open(path, std::ios::out | std::ios::app);
        return file ? &file : nullptr;
    }
};

LogSink& sink() {
    static LogSink s;
    return s;
}

} // namespace

namespace shelf {

void set_log_file(const std::string& path) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (s.file.is_open()) s.file.close();
    s.file.clear();
    s.path = path;
}

void log_line(const std::string& line) {
    const std::string stamped = utc_iso8601_now() + " " + line;
    LogSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (std::ofstream* f = s.file_unlocked()) {
        *f << stamped << '\n';
        f->flush();
    }
    std::cout << stamped << '\n';
}

} // namespace shelf
