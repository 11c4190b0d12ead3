/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file ProxyVfs.h
 * @brief SQLite VFS that performs every file operation through the async proxy
 *
 * The SQLite connection runs on a driving thread. Each xRead/xWrite/xSync becomes a
 * command round trip to the AsyncProxy's I/O thread, and the calling thread blocks until
 * the result is published or the timeout passes (reported as an I/O error for that
 * operation). Lock state never crosses threads; it lives in the VFS's LockTable.
 *
 * A URI filename with delete-before-open=1 unlinks the target before opening it:
 * @code
 * Vfs::ProxyVfs vfs;
 * sqlite3_open_v2("file:/scratch.db?delete-before-open=1", &db,
 *                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, "origin");
 * @endcode
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "SqliteVfsBase.h"
#include "../Concurrency/AsyncProxy.h"
#include "../Concurrency/DirectoryClient.h"
#include "../Concurrency/ProxyClient.h"
#include "../Pool/ChunkSource.h"

namespace OriginVault::Core::Vfs {

class ProxyVfs : public SqliteVfsBase {
public:
    struct Config {
        std::string vfsName;
        bool makeDefault;
        // Per-call wait; nullopt uses the proxy's defaultTimeout
        std::optional<std::chrono::milliseconds> timeout;
        Concurrency::AsyncProxy::Config proxy;

        Config()
            : vfsName("origin")
            , makeDefault(false) {}
    };

    /**
     * @brief Starts the proxy thread and registers the VFS
     * @throws StorageException CantOpen when storage is unavailable
     */
    explicit ProxyVfs(Config config = Config{});
    ~ProxyVfs() override;

    Concurrency::AsyncProxy& proxy() noexcept { return *_proxy; }
    Concurrency::ProxyClient& client() noexcept { return *_client; }
    Concurrency::DirectoryClient directoryClient() { return Concurrency::DirectoryClient(*_proxy, _config.timeout); }

    /**
     * @brief Replaces name with a database image written through the command channel
     *
     * Same validation as HandlePool::importDb; the copy opens in rollback-journal mode.
     * A failed import deletes the partial file.
     * @return Bytes written
     */
    size_t importDb(const std::string& name, std::span<const std::byte> bytes);
    size_t importDb(const std::string& name, Pool::ChunkSource& source);

protected:
    std::unique_ptr<VfsFile> openFile(const std::string& path, sqlite3_filename uri, int flags) override;
    bool deleteFile(const std::string& path) override;
    bool fileExists(const std::string& path) override;
    const char* category() const override { return "ProxyVfs"; }

private:
    Config _config;
    std::unique_ptr<Concurrency::AsyncProxy> _proxy;
    std::unique_ptr<Concurrency::ProxyClient> _client;
};

} // namespace OriginVault::Core::Vfs
