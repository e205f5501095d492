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

// Thread-safe logging (to file + stdout). Each line gets a UTC timestamp.
// An empty path turns the file sink off.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace shelf
