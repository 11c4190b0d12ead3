/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "SqliteVfsBase.h"
#include "../Logging/Logger.h"
#include "../Storage/OriginDirectory.h"
#include <cstring>
#include <new>

namespace OriginVault::Core::Vfs {

using IO::StorageError;
using IO::StorageException;

static_assert(static_cast<int>(LockLevel::None) == SQLITE_LOCK_NONE);
static_assert(static_cast<int>(LockLevel::Shared) == SQLITE_LOCK_SHARED);
static_assert(static_cast<int>(LockLevel::Reserved) == SQLITE_LOCK_RESERVED);
static_assert(static_cast<int>(LockLevel::Pending) == SQLITE_LOCK_PENDING);
static_assert(static_cast<int>(LockLevel::Exclusive) == SQLITE_LOCK_EXCLUSIVE);

std::string_view toString(PageStoreResult result) noexcept {
    switch (result) {
        case PageStoreResult::OK:        return "OK";
        case PageStoreResult::IOErr:     return "IOERR";
        case PageStoreResult::Busy:      return "BUSY";
        case PageStoreResult::ReadOnly:  return "READONLY";
        case PageStoreResult::CantOpen:  return "CANTOPEN";
        case PageStoreResult::NotFound:  return "NOTFOUND";
        case PageStoreResult::Misuse:    return "MISUSE";
        case PageStoreResult::IOTimeout: return "IOTIMEOUT";
    }
    return "IOERR";
}

PageStoreResult toPageStoreResult(StorageError error) noexcept {
    switch (error) {
        case StorageError::None:             return PageStoreResult::OK;
        case StorageError::Busy:             return PageStoreResult::Busy;
        case StorageError::ReadOnly:         return PageStoreResult::ReadOnly;
        case StorageError::CantOpen:         return PageStoreResult::CantOpen;
        case StorageError::CapacityExceeded: return PageStoreResult::CantOpen;
        case StorageError::NotFound:         return PageStoreResult::NotFound;
        case StorageError::Misuse:           return PageStoreResult::Misuse;
        case StorageError::WrongContext:     return PageStoreResult::Misuse;
        case StorageError::IOTimeout:        return PageStoreResult::IOTimeout;
        case StorageError::IOError:
        case StorageError::Corruption:
        case StorageError::NotADatabase:
        case StorageError::Unknown:
            return PageStoreResult::IOErr;
    }
    return PageStoreResult::IOErr;
}

int toSqliteCode(PageStoreResult result, int ioErrCode) noexcept {
    switch (result) {
        case PageStoreResult::OK:       return SQLITE_OK;
        case PageStoreResult::Busy:     return SQLITE_BUSY;
        case PageStoreResult::ReadOnly: return SQLITE_READONLY;
        case PageStoreResult::CantOpen: return SQLITE_CANTOPEN;
        case PageStoreResult::Misuse:   return SQLITE_MISUSE;
        case PageStoreResult::NotFound:
            if (ioErrCode == SQLITE_CANTOPEN) return SQLITE_CANTOPEN;
            if (ioErrCode == SQLITE_IOERR_DELETE) return SQLITE_IOERR_DELETE_NOENT;
            return ioErrCode;
        case PageStoreResult::IOErr:
        case PageStoreResult::IOTimeout:
            return ioErrCode;
    }
    return ioErrCode;
}

// The sqlite3_file SQLite allocates for us (szOsFile bytes); constructed in place by xOpen
struct SqliteVfsBase::OpenFile : public sqlite3_file {
    SqliteVfsBase& vfs;
    std::unique_ptr<VfsFile> impl;
    std::string path;
    int flags;
    LockLevel lock = LockLevel::None;

    OpenFile(SqliteVfsBase& owner, std::unique_ptr<VfsFile> file, std::string name, int openFlags)
        : sqlite3_file{&kIoMethods}
        , vfs(owner)
        , impl(std::move(file))
        , path(std::move(name))
        , flags(openFlags) {}
};

#define ORIGINVAULT_VFS_SELF() auto& self = *static_cast<SqliteVfsBase*>(vfs->pAppData)
#define ORIGINVAULT_FILE_SELF() auto& of = *static_cast<OpenFile*>(file)

const sqlite3_io_methods SqliteVfsBase::kIoMethods = {
    1,
    &SqliteVfsBase::xClose,
    &SqliteVfsBase::xRead,
    &SqliteVfsBase::xWrite,
    &SqliteVfsBase::xTruncate,
    &SqliteVfsBase::xSync,
    &SqliteVfsBase::xFileSize,
    &SqliteVfsBase::xLock,
    &SqliteVfsBase::xUnlock,
    &SqliteVfsBase::xCheckReservedLock,
    &SqliteVfsBase::xFileControl,
    &SqliteVfsBase::xSectorSize,
    &SqliteVfsBase::xDeviceCharacteristics,
    nullptr, nullptr, nullptr, nullptr,   // no shared memory: WAL only with locking_mode=EXCLUSIVE
    nullptr, nullptr                      // no memory mapping
};

SqliteVfsBase::SqliteVfsBase(std::string name, bool makeDefault)
    : _name(std::move(name))
    , _makeDefault(makeDefault) {
    if (int rc = sqlite3_initialize(); rc != SQLITE_OK) {
        throw StorageException(StorageError::CantOpen, std::string("sqlite3_initialize failed: ") + sqlite3_errstr(rc));
    }
    sqlite3_vfs* native = sqlite3_vfs_find(nullptr);
    if (!native) {
        throw StorageException(StorageError::CantOpen, "SQLite has no default VFS to borrow OS services from");
    }

    _vfs.iVersion = 2;
    _vfs.szOsFile = static_cast<int>(sizeof(OpenFile));
    _vfs.mxPathname = 512;
    _vfs.pNext = nullptr;
    _vfs.zName = _name.c_str();
    _vfs.pAppData = this;
    _vfs.xOpen = &SqliteVfsBase::xOpen;
    _vfs.xDelete = &SqliteVfsBase::xDelete;
    _vfs.xAccess = &SqliteVfsBase::xAccess;
    _vfs.xFullPathname = &SqliteVfsBase::xFullPathname;
    _vfs.xDlOpen = nullptr;
    _vfs.xDlError = nullptr;
    _vfs.xDlSym = nullptr;
    _vfs.xDlClose = nullptr;
    _vfs.xRandomness = native->xRandomness;
    _vfs.xSleep = native->xSleep;
    _vfs.xCurrentTime = native->xCurrentTime;
    _vfs.xGetLastError = &SqliteVfsBase::xGetLastError;
    _vfs.xCurrentTimeInt64 = native->iVersion >= 2 ? native->xCurrentTimeInt64 : nullptr;
}

SqliteVfsBase::~SqliteVfsBase() {
    unregisterVfs();
}

void SqliteVfsBase::registerVfs() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_registered) return;
    if (int rc = sqlite3_vfs_register(&_vfs, _makeDefault ? 1 : 0); rc != SQLITE_OK) {
        throw StorageException(StorageError::IOError, "Cannot register VFS " + _name + ": " + sqlite3_errstr(rc));
    }
    _registered = true;
    ORIGINVAULT_LOG_DEBUG_CAT(category(), "Registered VFS " + _name);
}

void SqliteVfsBase::unregisterVfs() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_registered) return;
    sqlite3_vfs_unregister(&_vfs);
    _registered = false;
    ORIGINVAULT_LOG_DEBUG_CAT(category(), "Unregistered VFS " + _name);
}

bool SqliteVfsBase::isRegistered() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _registered;
}

std::string SqliteVfsBase::lastError() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastError;
}

int SqliteVfsBase::reportError(const StorageException& e, int ioErrCode, const char* operation) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _lastError = e.what();
    }
    const auto result = toPageStoreResult(e.code());
    const std::string text = std::string(operation) + " -> " + std::string(toString(result)) + ": " + e.what();
    if (result == PageStoreResult::Busy || result == PageStoreResult::NotFound) {
        ORIGINVAULT_LOG_DEBUG_CAT(category(), text);
    } else {
        ORIGINVAULT_LOG_WARN_CAT(category(), text);
    }
    return toSqliteCode(result, ioErrCode);
}

int SqliteVfsBase::reportError(const std::exception& e, int ioErrCode, const char* operation) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _lastError = e.what();
    }
    ORIGINVAULT_LOG_ERROR_CAT(category(), std::string(operation) + " failed: " + e.what());
    return ioErrCode;
}

int SqliteVfsBase::xOpen(sqlite3_vfs* vfs, sqlite3_filename zName, sqlite3_file* file, int flags, int* pOutFlags) {
    ORIGINVAULT_VFS_SELF();
    // SQLite skips xClose when pMethods is null after a failed open
    file->pMethods = nullptr;
    try {
        std::string path;
        if (zName) {
            path = IO::OriginDirectory::normalizePath(zName);
        } else {
            path = "/.ovtmp-" + IO::OriginDirectory::randomFilename(16);
            flags |= SQLITE_OPEN_DELETEONCLOSE;
        }
        auto impl = self.openFile(path, zName, flags);
        new (file) OpenFile(self, std::move(impl), std::move(path), flags);
        if (pOutFlags) *pOutFlags = flags;
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return self.reportError(e, SQLITE_CANTOPEN, "xOpen");
    } catch (const std::exception& e) {
        return self.reportError(e, SQLITE_CANTOPEN, "xOpen");
    }
}

int SqliteVfsBase::xDelete(sqlite3_vfs* vfs, const char* zName, int) {
    ORIGINVAULT_VFS_SELF();
    try {
        return self.deleteFile(IO::OriginDirectory::normalizePath(zName)) ? SQLITE_OK : SQLITE_IOERR_DELETE_NOENT;
    } catch (const StorageException& e) {
        return self.reportError(e, SQLITE_IOERR_DELETE, "xDelete");
    } catch (const std::exception& e) {
        return self.reportError(e, SQLITE_IOERR_DELETE, "xDelete");
    }
}

int SqliteVfsBase::xAccess(sqlite3_vfs* vfs, const char* zName, int, int* pResOut) {
    ORIGINVAULT_VFS_SELF();
    try {
        // Every existing file is readable and writable through this VFS
        *pResOut = self.fileExists(IO::OriginDirectory::normalizePath(zName)) ? 1 : 0;
        return SQLITE_OK;
    } catch (const StorageException& e) {
        *pResOut = 0;
        return self.reportError(e, SQLITE_IOERR_ACCESS, "xAccess");
    } catch (const std::exception& e) {
        *pResOut = 0;
        return self.reportError(e, SQLITE_IOERR_ACCESS, "xAccess");
    }
}

int SqliteVfsBase::xFullPathname(sqlite3_vfs* vfs, const char* zName, int nOut, char* zOut) {
    ORIGINVAULT_VFS_SELF();
    try {
        const std::string path = IO::OriginDirectory::normalizePath(zName);
        if (static_cast<int>(path.size()) >= nOut) {
            return SQLITE_CANTOPEN;
        }
        std::memcpy(zOut, path.c_str(), path.size() + 1);
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return self.reportError(e, SQLITE_CANTOPEN, "xFullPathname");
    }
}

int SqliteVfsBase::xGetLastError(sqlite3_vfs* vfs, int nBuf, char* zBuf) {
    ORIGINVAULT_VFS_SELF();
    if (nBuf <= 0 || !zBuf) return SQLITE_OK;
    const std::string text = self.lastError();
    const size_t n = std::min(text.size(), static_cast<size_t>(nBuf - 1));
    std::memcpy(zBuf, text.data(), n);
    zBuf[n] = '\0';
    return SQLITE_OK;
}

int SqliteVfsBase::xClose(sqlite3_file* file) {
    ORIGINVAULT_FILE_SELF();
    SqliteVfsBase& self = of.vfs;
    int rc = SQLITE_OK;
    self._locks.unlock(of.path, &of, LockLevel::None);
    try {
        of.impl->close();
    } catch (const StorageException& e) {
        rc = self.reportError(e, SQLITE_IOERR_CLOSE, "xClose");
    } catch (const std::exception& e) {
        rc = self.reportError(e, SQLITE_IOERR_CLOSE, "xClose");
    }
    // SQLite frees the memory but knows nothing of destructors
    of.~OpenFile();
    file->pMethods = nullptr;
    return rc;
}

int SqliteVfsBase::xRead(sqlite3_file* file, void* buffer, int iAmt, sqlite3_int64 iOfst) {
    ORIGINVAULT_FILE_SELF();
    try {
        auto bytes = std::span<std::byte>(static_cast<std::byte*>(buffer), static_cast<size_t>(iAmt));
        const size_t got = of.impl->read(bytes, static_cast<uint64_t>(iOfst));
        if (got < bytes.size()) {
            std::memset(bytes.data() + got, 0, bytes.size() - got);
            return SQLITE_IOERR_SHORT_READ;
        }
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_READ, "xRead");
    } catch (const std::exception& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_READ, "xRead");
    }
}

int SqliteVfsBase::xWrite(sqlite3_file* file, const void* buffer, int iAmt, sqlite3_int64 iOfst) {
    ORIGINVAULT_FILE_SELF();
    if (of.flags & SQLITE_OPEN_READONLY) return SQLITE_READONLY;
    try {
        auto bytes = std::span<const std::byte>(static_cast<const std::byte*>(buffer), static_cast<size_t>(iAmt));
        of.impl->write(bytes, static_cast<uint64_t>(iOfst));
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_WRITE, "xWrite");
    } catch (const std::exception& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_WRITE, "xWrite");
    }
}

int SqliteVfsBase::xTruncate(sqlite3_file* file, sqlite3_int64 size) {
    ORIGINVAULT_FILE_SELF();
    if (of.flags & SQLITE_OPEN_READONLY) return SQLITE_READONLY;
    try {
        of.impl->truncate(static_cast<uint64_t>(size));
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_TRUNCATE, "xTruncate");
    } catch (const std::exception& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_TRUNCATE, "xTruncate");
    }
}

int SqliteVfsBase::xSync(sqlite3_file* file, int) {
    ORIGINVAULT_FILE_SELF();
    try {
        of.impl->sync();
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_FSYNC, "xSync");
    } catch (const std::exception& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_FSYNC, "xSync");
    }
}

int SqliteVfsBase::xFileSize(sqlite3_file* file, sqlite3_int64* pSize) {
    ORIGINVAULT_FILE_SELF();
    try {
        *pSize = static_cast<sqlite3_int64>(of.impl->size());
        return SQLITE_OK;
    } catch (const StorageException& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_FSTAT, "xFileSize");
    } catch (const std::exception& e) {
        return of.vfs.reportError(e, SQLITE_IOERR_FSTAT, "xFileSize");
    }
}

int SqliteVfsBase::xLock(sqlite3_file* file, int level) {
    ORIGINVAULT_FILE_SELF();
    const bool granted = of.vfs._locks.tryLock(of.path, &of, static_cast<LockLevel>(level));
    of.lock = of.vfs._locks.levelOf(of.path, &of);
    return granted ? SQLITE_OK : SQLITE_BUSY;
}

int SqliteVfsBase::xUnlock(sqlite3_file* file, int level) {
    ORIGINVAULT_FILE_SELF();
    of.vfs._locks.unlock(of.path, &of, static_cast<LockLevel>(level));
    of.lock = of.vfs._locks.levelOf(of.path, &of);
    return SQLITE_OK;
}

int SqliteVfsBase::xCheckReservedLock(sqlite3_file* file, int* pResOut) {
    ORIGINVAULT_FILE_SELF();
    *pResOut = of.vfs._locks.checkReserved(of.path) ? 1 : 0;
    return SQLITE_OK;
}

int SqliteVfsBase::xFileControl(sqlite3_file*, int, void*) {
    return SQLITE_NOTFOUND;
}

int SqliteVfsBase::xSectorSize(sqlite3_file*) {
    return 4096;
}

int SqliteVfsBase::xDeviceCharacteristics(sqlite3_file* file) {
    ORIGINVAULT_FILE_SELF();
    return of.vfs.deviceCharacteristics();
}

#undef ORIGINVAULT_VFS_SELF
#undef ORIGINVAULT_FILE_SELF

} // namespace OriginVault::Core::Vfs
