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
#include <cstddef>
#include <unistd.h>

namespace shelf::internal {

// Owns a file or socket descriptor; closes it on scope exit unless release()d.
class FdGuard {
public:
    explicit FdGuard(int fd) : _fd(fd) {}
    ~FdGuard() { if (_fd >= 0) ::close(_fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return _fd; }
    int release() { int f = _fd; _fd = -1; return f; }

private:
    int _fd;
};

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// ASCII lower-case copy
std::string lower_copy(std::string s);

// Split on a single character; keeps empty pieces ("/a//b" -> "", "a", "", "b").
std::vector<std::string> split_char(const std::string& s, char sep);

// Everything after the first two '/'-separated segments, re-joined with '/'.
// "/echo/a/b" -> "a/b", "/files/" -> "".
std::string path_remainder(const std::string& path);

// Rejects empty names, absolute names, ".." segments and embedded NULs.
bool is_safe_key(const std::string& key);

// Hex helpers
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// SHA-256 as hex (uses OpenSSL from .cpp)
std::string sha256_hex(const std::string& data);

// n_bytes of OpenSSL randomness as hex; empty on RNG failure.
std::string random_hex(std::size_t n_bytes);

} // namespace shelf::internal
