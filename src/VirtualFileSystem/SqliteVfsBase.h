/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file SqliteVfsBase.h
 * @brief Shared sqlite3_vfs plumbing for the proxy and pool backends
 *
 * SqliteVfsBase owns the sqlite3_vfs record and the sqlite3_io_methods table. SQLite sees
 * one C interface; each callback forwards to a VfsFile implemented by the backend and
 * translates failures:
 *
 * - StorageException codes are narrowed to PageStoreResult {OK, IOErr, Busy, ReadOnly,
 *   CantOpen, NotFound, Misuse, IOTimeout}, then to the SQLite code of the operation
 *   (IOErr keeps the per-operation extended code such as SQLITE_IOERR_READ).
 * - No exception ever crosses back into SQLite.
 *
 * Locking (xLock/xUnlock/xCheckReservedLock) is handled here against the VFS's LockTable,
 * so backends only implement byte I/O.
 *
 * xRandomness, xSleep and xCurrentTime come from the platform's default VFS.
 */
#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include "LockTable.h"
#include "../Storage/StorageError.h"

namespace OriginVault::Core::Vfs {

enum class PageStoreResult { OK, IOErr, Busy, ReadOnly, CantOpen, NotFound, Misuse, IOTimeout };

std::string_view toString(PageStoreResult result) noexcept;

// Never invents a cause; only narrows the storage taxonomy to the page-store set
PageStoreResult toPageStoreResult(IO::StorageError error) noexcept;

/**
 * @brief Maps a page-store result to the SQLite code for one operation
 * @param ioErrCode Extended SQLITE_IOERR_* code of the operation, or SQLITE_CANTOPEN for xOpen
 */
int toSqliteCode(PageStoreResult result, int ioErrCode) noexcept;

/**
 * @brief Byte-level file served by a backend
 */
class VfsFile {
public:
    virtual ~VfsFile() = default;

    // Returns the bytes read; fewer than requested only at end of file
    virtual size_t read(std::span<std::byte> buffer, uint64_t offset) = 0;
    virtual void write(std::span<const std::byte> data, uint64_t offset) = 0;
    virtual void truncate(uint64_t size) = 0;
    virtual void sync() = 0;
    virtual uint64_t size() = 0;
    virtual void close() = 0;
};

class SqliteVfsBase {
public:
    SqliteVfsBase(std::string name, bool makeDefault);
    virtual ~SqliteVfsBase();

    SqliteVfsBase(const SqliteVfsBase&) = delete;
    SqliteVfsBase& operator=(const SqliteVfsBase&) = delete;

    /**
     * @brief Makes the VFS visible to sqlite3_vfs_find / sqlite3_open_v2; idempotent
     * @throws StorageException IOError when SQLite refuses the registration
     */
    void registerVfs();
    // Idempotent
    void unregisterVfs();
    bool isRegistered() const;

    const std::string& name() const noexcept { return _name; }
    LockTable& locks() noexcept { return _locks; }

    std::string lastError() const;

protected:
    /**
     * @brief Opens a file for SQLite
     * @param path Normalized name ("/dir/file.db")
     * @param uri The name exactly as SQLite passed it, for sqlite3_uri_* lookups; null for temp files
     * @param flags SQLITE_OPEN_* flags
     */
    virtual std::unique_ptr<VfsFile> openFile(const std::string& path, sqlite3_filename uri, int flags) = 0;

    // Returns false when there was nothing to delete
    virtual bool deleteFile(const std::string& path) = 0;
    virtual bool fileExists(const std::string& path) = 0;

    virtual int deviceCharacteristics() const { return 0; }

    // Log category for this backend
    virtual const char* category() const { return "Vfs"; }

    int reportError(const IO::StorageException& e, int ioErrCode, const char* operation);
    int reportError(const std::exception& e, int ioErrCode, const char* operation);

private:
    struct OpenFile;

    static const sqlite3_io_methods kIoMethods;

    static int xOpen(sqlite3_vfs* vfs, sqlite3_filename zName, sqlite3_file* file, int flags, int* pOutFlags);
    static int xDelete(sqlite3_vfs* vfs, const char* zName, int syncDir);
    static int xAccess(sqlite3_vfs* vfs, const char* zName, int flags, int* pResOut);
    static int xFullPathname(sqlite3_vfs* vfs, const char* zName, int nOut, char* zOut);
    static int xGetLastError(sqlite3_vfs* vfs, int nBuf, char* zBuf);

    static int xClose(sqlite3_file* file);
    static int xRead(sqlite3_file* file, void* buffer, int iAmt, sqlite3_int64 iOfst);
    static int xWrite(sqlite3_file* file, const void* buffer, int iAmt, sqlite3_int64 iOfst);
    static int xTruncate(sqlite3_file* file, sqlite3_int64 size);
    static int xSync(sqlite3_file* file, int flags);
    static int xFileSize(sqlite3_file* file, sqlite3_int64* pSize);
    static int xLock(sqlite3_file* file, int level);
    static int xUnlock(sqlite3_file* file, int level);
    static int xCheckReservedLock(sqlite3_file* file, int* pResOut);
    static int xFileControl(sqlite3_file* file, int op, void* pArg);
    static int xSectorSize(sqlite3_file* file);
    static int xDeviceCharacteristics(sqlite3_file* file);

    std::string _name;
    bool _makeDefault;
    sqlite3_vfs _vfs{};
    LockTable _locks;

    mutable std::mutex _mutex;
    bool _registered = false;
    std::string _lastError;
};

} // namespace OriginVault::Core::Vfs
