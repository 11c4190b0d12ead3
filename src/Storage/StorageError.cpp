/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "StorageError.h"
#include <cerrno>

namespace OriginVault::Core::IO {

std::string_view toString(StorageError code) noexcept {
    switch (code) {
        case StorageError::None:             return "OK";
        case StorageError::IOError:          return "IOERR";
        case StorageError::Busy:             return "BUSY";
        case StorageError::ReadOnly:         return "READONLY";
        case StorageError::CantOpen:         return "CANTOPEN";
        case StorageError::NotFound:         return "NOTFOUND";
        case StorageError::Misuse:           return "MISUSE";
        case StorageError::IOTimeout:        return "IOTIMEOUT";
        case StorageError::CapacityExceeded: return "CAPACITY_EXCEEDED";
        case StorageError::Corruption:       return "CORRUPTION";
        case StorageError::WrongContext:     return "WRONG_CONTEXT";
        case StorageError::NotADatabase:     return "NOTADB";
        case StorageError::Unknown:          return "UNKNOWN";
    }
    return "UNKNOWN";
}

StorageError mapErrnoToStorageError(int err) noexcept {
    switch (err) {
        case 0:
            return StorageError::None;
        case ENOENT:
        case ENOTDIR:
            return StorageError::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageError::ReadOnly;
#if defined(__unix__) || defined(__APPLE__)
        case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
        case EAGAIN:
#endif
            return StorageError::Busy;
#endif
        case EINVAL:
        case ENAMETOOLONG:
        case EISDIR:
            return StorageError::Misuse;
        case ETIMEDOUT:
            return StorageError::IOTimeout;
        default:
            return StorageError::IOError;
    }
}

namespace {
    std::string composeWhat(const StorageErrorInfo& info) {
        std::string what(toString(info.code));
        what += ": ";
        what += info.message;
        return what;
    }
}

StorageException::StorageException(StorageErrorInfo info)
    : std::runtime_error(composeWhat(info))
    , _info(std::move(info)) {
}

StorageException::StorageException(StorageError code, const std::string& message, const std::string& path,
                                   std::optional<std::error_code> ec)
    : StorageException(StorageErrorInfo{code, message, ec, path}) {
}

StorageException StorageException::fromErrno(int err, const std::string& message, const std::string& path) {
    return StorageException(mapErrnoToStorageError(err), message, path,
                            std::error_code(err, std::generic_category()));
}

} // namespace OriginVault::Core::IO
