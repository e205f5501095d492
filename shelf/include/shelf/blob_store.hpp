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

namespace shelf {

enum class CreateResult {
    Ok,
    AlreadyExists,
    CreateFailed,
    WriteFailed
};

/**
 * Key -> bytes store behind the /files/ routes. Keys are the raw path
 * remainder after "/files/". Implementations must be safe to call from
 * several workers at once.
 */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual bool exists(const std::string& key) = 0;

    // Whole blob into out. False if missing or unreadable.
    virtual bool read(const std::string& key, std::string& out) = 0;

    // Atomic create-if-absent; readers never observe a partial blob.
    virtual CreateResult create_new(const std::string& key, const std::string& data) = 0;
};

} // namespace shelf
