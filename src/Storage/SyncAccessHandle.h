/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file SyncAccessHandle.h
 * @brief Exclusive, positional, synchronous file handle
 *
 * A SyncAccessHandle is the only way bytes move in or out of the storage root. It holds an
 * exclusive advisory lock on its file for its whole lifetime, so at most one handle per file
 * exists across the process (and across processes honoring flock). All I/O is positional;
 * there is no cursor.
 *
 * Handles are obtained from OriginDirectory::open() in the owning context. Once open, a handle
 * may be used by whichever component holds it; the caller serializes access.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace OriginVault::Core::IO {

class SyncAccessHandle {
public:
    enum class Mode { ReadWrite, ReadOnly };

    ~SyncAccessHandle();

    SyncAccessHandle(const SyncAccessHandle&) = delete;
    SyncAccessHandle& operator=(const SyncAccessHandle&) = delete;

    /**
     * @brief Opens (optionally creating) a file and takes its exclusive lock
     * @param file Absolute host path
     * @param create Create the file if missing
     * @param mode ReadWrite takes an exclusive lock, ReadOnly a shared one
     * @throws StorageException NotFound when missing and !create, Busy when another handle
     *         holds the file, CantOpen/ReadOnly/IOError for other failures
     */
    static std::unique_ptr<SyncAccessHandle> open(const std::filesystem::path& file, bool create,
                                                  Mode mode = Mode::ReadWrite);

    /**
     * @brief Reads up to buffer.size() bytes at offset
     * @return Bytes read; less than requested only at end of file
     */
    size_t read(std::span<std::byte> buffer, uint64_t offset);

    /**
     * @brief Writes all of data at offset, extending the file as needed
     * @return Bytes written (always data.size() on success)
     */
    size_t write(std::span<const std::byte> data, uint64_t offset);

    void truncate(uint64_t size);
    void flush();
    uint64_t size() const;

    // Releases the lock and the descriptor; idempotent
    void close();

    bool isOpen() const noexcept { return _fd >= 0; }
    bool isReadOnly() const noexcept { return _mode == Mode::ReadOnly; }
    const std::filesystem::path& path() const noexcept { return _path; }

private:
    SyncAccessHandle(int fd, std::filesystem::path path, Mode mode);
    void requireOpen(const char* operation) const;

    int _fd = -1;
    std::filesystem::path _path;
    Mode _mode;
};

} // namespace OriginVault::Core::IO
