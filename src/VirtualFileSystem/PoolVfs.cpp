/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "PoolVfs.h"
#include "../Pool/HandlePool.h"

namespace OriginVault::Core::Vfs {

using Pool::HandlePool;
namespace PersistentFlags = Pool::PersistentFlags;

static_assert(PersistentFlags::MainDb == SQLITE_OPEN_MAIN_DB);
static_assert(PersistentFlags::MainJournal == SQLITE_OPEN_MAIN_JOURNAL);
static_assert(PersistentFlags::SuperJournal == SQLITE_OPEN_SUPER_JOURNAL);
static_assert(PersistentFlags::Wal == SQLITE_OPEN_WAL);

namespace {

class PoolFile : public VfsFile {
public:
    PoolFile(HandlePool& pool, SlotHandle slot, bool deleteOnClose)
        : _pool(pool), _slot(slot), _deleteOnClose(deleteOnClose) {}

    size_t read(std::span<std::byte> buffer, uint64_t offset) override {
        return _pool.readAt(_slot, buffer, offset);
    }

    void write(std::span<const std::byte> data, uint64_t offset) override {
        _pool.writeAt(_slot, data, offset);
    }

    void truncate(uint64_t size) override { _pool.truncateAt(_slot, size); }
    void sync() override { _pool.flushSlot(_slot); }
    uint64_t size() override { return _pool.dataSize(_slot); }

    void close() override {
        if (_closed) return;
        _closed = true;
        _pool.closeFile(_slot, _deleteOnClose);
    }

private:
    HandlePool& _pool;
    SlotHandle _slot;
    bool _deleteOnClose;
    bool _closed = false;
};

} // namespace

PoolVfs::PoolVfs(HandlePool& pool, bool makeDefault)
    : SqliteVfsBase(pool.vfsName(), makeDefault)
    , _pool(pool) {}

PoolVfs::~PoolVfs() {
    // Detach before the overrides go away
    unregisterVfs();
}

std::unique_ptr<VfsFile> PoolVfs::openFile(const std::string& path, sqlite3_filename, int flags) {
    const bool create = (flags & SQLITE_OPEN_CREATE) != 0;
    const uint32_t persistent = static_cast<uint32_t>(flags) & PersistentFlags::Mask;
    SlotHandle slot = _pool.openFile(path, create, persistent);
    return std::make_unique<PoolFile>(_pool, slot, (flags & SQLITE_OPEN_DELETEONCLOSE) != 0);
}

bool PoolVfs::deleteFile(const std::string& path) {
    return _pool.unlink(path);
}

bool PoolVfs::fileExists(const std::string& path) {
    return _pool.hasFile(path);
}

int PoolVfs::deviceCharacteristics() const {
    return SQLITE_IOCAP_UNDELETABLE_WHEN_OPEN;
}

} // namespace OriginVault::Core::Vfs
