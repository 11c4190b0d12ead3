/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace OriginVault::Core::IO {

/**
 * Public error taxonomy surfaced by storage operations.
 * Mapping guidelines:
 * - IOError: the underlying storage operation failed
 * - Busy: lock, exclusive-handle or pause conflict; the caller may retry
 * - ReadOnly: write attempted on a read-only file or denied by permissions
 * - CantOpen: a file could not be opened or created
 * - NotFound: missing file, directory or slot association
 * - Misuse: protocol violation (pausing with open files, bad path, closed descriptor)
 * - IOTimeout: the requester stopped waiting; the outcome of the command is unknown
 * - CapacityExceeded: no free pool slot
 * - Corruption: persisted slot metadata failed its digest check
 * - WrongContext: synchronous storage touched from a context that does not own it
 * - NotADatabase: imported bytes are not an SQLite database image
 */
enum class StorageError {
    None = 0,
    IOError,
    Busy,
    ReadOnly,
    CantOpen,
    NotFound,
    Misuse,
    IOTimeout,
    CapacityExceeded,
    Corruption,
    WrongContext,
    NotADatabase,
    Unknown
};

struct StorageErrorInfo {
    StorageError code = StorageError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
};

std::string_view toString(StorageError code) noexcept;

// Maps an errno value to the taxonomy (ENOENT -> NotFound, EACCES -> ReadOnly, ...)
StorageError mapErrnoToStorageError(int err) noexcept;

/**
 * @brief Exception thrown by synchronous storage, pool and registry operations
 *
 * what() is "<CODE>: <message>" so callers that only see the text still get the class
 * of failure, e.g. "MISUSE: Cannot pause VFS pool because it has opened files.".
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(StorageErrorInfo info);
    StorageException(StorageError code, const std::string& message, const std::string& path = "",
                     std::optional<std::error_code> ec = std::nullopt);

    StorageError code() const noexcept { return _info.code; }
    const StorageErrorInfo& info() const noexcept { return _info; }

    // Builds an exception from the current errno
    static StorageException fromErrno(int err, const std::string& message, const std::string& path);

private:
    StorageErrorInfo _info;
};

} // namespace OriginVault::Core::IO
