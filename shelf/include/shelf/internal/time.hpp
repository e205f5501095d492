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
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();
} // namespace shelf
