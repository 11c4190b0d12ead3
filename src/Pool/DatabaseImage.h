/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include "../Storage/StorageError.h"

namespace OriginVault::Core::Pool::DatabaseImage {

// "SQLite format 3" followed by its NUL terminator
constexpr char kMagic[] = "SQLite format 3";
constexpr size_t kMagicSize = 16;

// File format write/read version bytes; 1 = rollback journal, 2 = WAL
constexpr size_t kWriteVersionOffset = 18;
constexpr size_t kReadVersionOffset = 19;

inline void requireHeader(std::span<const std::byte> first, const std::string& name) {
    if (first.size() < kMagicSize || std::memcmp(first.data(), kMagic, kMagicSize) != 0) {
        throw IO::StorageException(IO::StorageError::NotADatabase, "Input does not contain an SQLite database header", name);
    }
}

inline void requireLength(uint64_t length, const std::string& name) {
    if (length == 0 || length % 512 != 0) {
        throw IO::StorageException(IO::StorageError::NotADatabase,
                                   "Byte array size " + std::to_string(length) + " is invalid for an SQLite db", name);
    }
}

} // namespace OriginVault::Core::Pool::DatabaseImage
