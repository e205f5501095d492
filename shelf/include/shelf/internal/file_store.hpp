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
#include "shelf/blob_store.hpp"

namespace shelf::internal {

// Blobs as regular files under a storage root. The file path is
// root + key, with no normalization.
class FileBlobStore : public shelf::BlobStore {
public:
    explicit FileBlobStore(std::string root);

    bool exists(const std::string& key) override;
    bool read(const std::string& key, std::string& out) override;
    CreateResult create_new(const std::string& key, const std::string& data) override;

    std::string path_for(const std::string& key) const { return _root + key; }

private:
    std::string _root;
};

} // namespace shelf::internal
