/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "SyncAccessHandle.h"
#include "StorageError.h"
#include "../Logging/Logger.h"
#include <cerrno>
#include <cstring>

#include <fcntl.h>     // open()
#include <sys/file.h>  // flock()
#include <sys/stat.h>  // fstat()
#include <unistd.h>    // pread(), pwrite(), ftruncate(), fsync(), close()

namespace OriginVault::Core::IO {

SyncAccessHandle::SyncAccessHandle(int fd, std::filesystem::path path, Mode mode)
    : _fd(fd)
    , _path(std::move(path))
    , _mode(mode) {
}

SyncAccessHandle::~SyncAccessHandle() {
    if (_fd < 0) return;
    try {
        close();
    } catch (const StorageException& e) {
        ORIGINVAULT_LOG_WARN_CAT("SyncAccessHandle", std::string("Close during destruction failed: ") + e.what());
    }
}

std::unique_ptr<SyncAccessHandle> SyncAccessHandle::open(const std::filesystem::path& file, bool create, Mode mode) {
    const std::string p = file.string();

    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) {
        throw StorageException(StorageError::CantOpen, "Path names a directory", p);
    }

    int oflags = O_CLOEXEC | (mode == Mode::ReadOnly ? O_RDONLY : O_RDWR);
    if (create && mode == Mode::ReadWrite) oflags |= O_CREAT;

    int fd = ::open(p.c_str(), oflags, 0600);
    if (fd < 0) {
        const int saved = errno;
        if (saved == ENOENT) {
            throw StorageException(StorageError::NotFound, "File not found", p,
                                   std::error_code(saved, std::generic_category()));
        }
        auto code = mapErrnoToStorageError(saved);
        if (code == StorageError::IOError || code == StorageError::Misuse) code = StorageError::CantOpen;
        throw StorageException(code, "Cannot open file", p, std::error_code(saved, std::generic_category()));
    }

    const int lockOp = (mode == Mode::ReadOnly ? LOCK_SH : LOCK_EX) | LOCK_NB;
    if (::flock(fd, lockOp) != 0) {
        const int saved = errno;
        ::close(fd);
        if (saved == EWOULDBLOCK) {
            throw StorageException(StorageError::Busy, "File is held by another access handle", p,
                                   std::error_code(saved, std::generic_category()));
        }
        throw StorageException::fromErrno(saved, "Cannot lock file", p);
    }

    return std::unique_ptr<SyncAccessHandle>(new SyncAccessHandle(fd, file, mode));
}

void SyncAccessHandle::requireOpen(const char* operation) const {
    if (_fd < 0) {
        throw StorageException(StorageError::Misuse, std::string(operation) + " on a closed access handle", _path.string());
    }
}

size_t SyncAccessHandle::read(std::span<std::byte> buffer, uint64_t offset) {
    requireOpen("read");
    size_t total = 0;
    while (total < buffer.size()) {
        ssize_t n = ::pread(_fd, buffer.data() + total, buffer.size() - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageException(StorageError::IOError, "Read failed", _path.string(),
                                   std::error_code(errno, std::generic_category()));
        }
        if (n == 0) break;  // EOF
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t SyncAccessHandle::write(std::span<const std::byte> data, uint64_t offset) {
    requireOpen("write");
    if (_mode == Mode::ReadOnly) {
        throw StorageException(StorageError::ReadOnly, "Write on a read-only access handle", _path.string());
    }
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::pwrite(_fd, data.data() + total, data.size() - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            const int saved = errno;
            auto code = (saved == ENOSPC || saved == EDQUOT) ? StorageError::IOError : mapErrnoToStorageError(saved);
            throw StorageException(code, saved == ENOSPC ? "Disk full or quota exceeded" : "Write failed",
                                   _path.string(), std::error_code(saved, std::generic_category()));
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

void SyncAccessHandle::truncate(uint64_t size) {
    requireOpen("truncate");
    if (_mode == Mode::ReadOnly) {
        throw StorageException(StorageError::ReadOnly, "Truncate on a read-only access handle", _path.string());
    }
    while (::ftruncate(_fd, static_cast<off_t>(size)) != 0) {
        if (errno == EINTR) continue;
        throw StorageException::fromErrno(errno, "Truncate failed", _path.string());
    }
}

void SyncAccessHandle::flush() {
    requireOpen("flush");
    if (_mode == Mode::ReadOnly) return;
#if defined(__linux__)
    if (::fdatasync(_fd) != 0) {
        throw StorageException(StorageError::IOError, "fdatasync failed", _path.string(),
                               std::error_code(errno, std::generic_category()));
    }
#else
    if (::fsync(_fd) != 0) {
        throw StorageException(StorageError::IOError, "fsync failed", _path.string(),
                               std::error_code(errno, std::generic_category()));
    }
#endif
}

uint64_t SyncAccessHandle::size() const {
    requireOpen("size");
    struct stat st{};
    if (::fstat(_fd, &st) != 0) {
        throw StorageException(StorageError::IOError, "fstat failed", _path.string(),
                               std::error_code(errno, std::generic_category()));
    }
    return static_cast<uint64_t>(st.st_size);
}

void SyncAccessHandle::close() {
    if (_fd < 0) return;
    int fd = _fd;
    _fd = -1;
    ::flock(fd, LOCK_UN);
    if (::close(fd) != 0 && errno != EINTR) {
        throw StorageException(StorageError::IOError, "close failed", _path.string(),
                               std::error_code(errno, std::generic_category()));
    }
}

} // namespace OriginVault::Core::IO
