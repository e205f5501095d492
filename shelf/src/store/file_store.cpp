/*
 * Part of the Shelf project.
 *
 * SPDX-FileCopyrightText: 2025 Shelf contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Shelf. See LICENSE for details.
 */

#include "shelf/internal/file_store.hpp"
#include "shelf/internal/utils.hpp"
#include "shelf/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace shelf::internal {

static bool write_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::write(fd, d + off, len - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

FileBlobStore::FileBlobStore(std::string root)
    : _root(std::move(root))
{
}

bool FileBlobStore::exists(const std::string& key) {
    struct stat st{};
    return ::stat(path_for(key).c_str(), &st) == 0;
}

bool FileBlobStore::read(const std::string& key, std::string& out) {
    const std::string path = path_for(key);
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) return false;

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0 || !S_ISREG(st.st_mode)) return false;

    std::string buf;
    buf.reserve(static_cast<std::size_t>(st.st_size));
    char chunk[16384];
    while (true) {
        ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            shelf::log_line("[STORE][file] read error: " + path + ": " + std::strerror(errno));
            return false;
        }
        if (n == 0) break;
        buf.append(chunk, static_cast<std::size_t>(n));
    }
    out.swap(buf);
    return true;
}

// The blob is written to a private temporary next to the target and then
// published with link(2), which refuses to replace an existing name.
CreateResult FileBlobStore::create_new(const std::string& key, const std::string& data) {
    const std::string target = path_for(key);
    const std::string suffix = random_hex(8);
    if (suffix.empty()) {
        shelf::log_line("[STORE][file] RAND_bytes failed");
        return CreateResult::CreateFailed;
    }
    const std::string tmp = target + ".shelf-tmp-" + suffix;

    FdGuard fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
        shelf::log_line("[STORE][file] create error: " + tmp + ": " + std::strerror(errno));
        return CreateResult::CreateFailed;
    }

    bool ok = write_all(fd.get(), data.data(), data.size()) && ::fsync(fd.get()) == 0;
    int werr = errno;
    if (::close(fd.release()) != 0 && ok) {
        ok = false;
        werr = errno;
    }
    if (!ok) {
        shelf::log_line("[STORE][file] write error: " + tmp + ": " + std::strerror(werr));
        ::unlink(tmp.c_str());
        return CreateResult::WriteFailed;
    }

    int rc = ::link(tmp.c_str(), target.c_str());
    int lerr = errno;
    ::unlink(tmp.c_str());
    if (rc != 0) {
        if (lerr == EEXIST) return CreateResult::AlreadyExists;
        shelf::log_line("[STORE][file] publish error: " + target + ": " + std::strerror(lerr));
        return CreateResult::CreateFailed;
    }
    return CreateResult::Ok;
}

} // namespace shelf::internal
