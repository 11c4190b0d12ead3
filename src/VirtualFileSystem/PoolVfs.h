/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file PoolVfs.h
 * @brief SQLite VFS over a HandlePool
 *
 * Registered under the pool's name. Every file SQLite opens maps to a pool slot; the
 * slot is associated on first open with SQLITE_OPEN_CREATE and released on xDelete or
 * when a DELETEONCLOSE file is closed. I/O runs synchronously on the calling thread.
 */
#pragma once

#include "SqliteVfsBase.h"

namespace OriginVault::Core::Pool { class HandlePool; }

namespace OriginVault::Core::Vfs {

class PoolVfs : public SqliteVfsBase {
public:
    PoolVfs(Pool::HandlePool& pool, bool makeDefault);
    ~PoolVfs() override;

    Pool::HandlePool& pool() noexcept { return _pool; }

protected:
    std::unique_ptr<VfsFile> openFile(const std::string& path, sqlite3_filename uri, int flags) override;
    bool deleteFile(const std::string& path) override;
    bool fileExists(const std::string& path) override;
    int deviceCharacteristics() const override;
    const char* category() const override { return "PoolVfs"; }

private:
    Pool::HandlePool& _pool;
};

} // namespace OriginVault::Core::Vfs
