/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "ProxyVfs.h"
#include "../Logging/Logger.h"
#include "../Pool/DatabaseImage.h"
#include <array>

namespace OriginVault::Core::Vfs {

using Concurrency::CommandMessage;
using Concurrency::CommandResult;
using Concurrency::Opcode;
using Concurrency::ProxyClient;
using IO::StorageError;
using IO::StorageException;
namespace OpenFlags = Concurrency::OpenFlags;
namespace DatabaseImage = Pool::DatabaseImage;

namespace {

void throwIfFailed(const CommandResult& result) {
    if (!result.ok()) {
        throw StorageException(result.error);
    }
}

class ProxyFile : public VfsFile {
public:
    ProxyFile(ProxyClient& client, int32_t fd)
        : _client(client), _fd(fd) {}

    size_t read(std::span<std::byte> buffer, uint64_t offset) override {
        auto result = _client.read(_fd, buffer, offset);
        throwIfFailed(result);
        return static_cast<size_t>(result.value);
    }

    void write(std::span<const std::byte> data, uint64_t offset) override {
        throwIfFailed(_client.write(_fd, data, offset));
    }

    void truncate(uint64_t size) override { throwIfFailed(_client.truncate(_fd, size)); }
    void sync() override { throwIfFailed(_client.sync(_fd)); }

    uint64_t size() override {
        auto result = _client.fileSize(_fd);
        throwIfFailed(result);
        return static_cast<uint64_t>(result.value);
    }

    void close() override {
        if (_closed) return;
        _closed = true;
        throwIfFailed(_client.close(_fd));
    }

private:
    ProxyClient& _client;
    int32_t _fd;
    bool _closed = false;
};

} // namespace

ProxyVfs::ProxyVfs(Config config)
    : SqliteVfsBase(config.vfsName, config.makeDefault)
    , _config(std::move(config)) {
    _proxy = std::make_unique<Concurrency::AsyncProxy>(_config.proxy);
    _proxy->start();
    _client = std::make_unique<ProxyClient>(*_proxy, _config.timeout);
    registerVfs();
}

ProxyVfs::~ProxyVfs() {
    unregisterVfs();
    _client.reset();
    _proxy.reset();
}

std::unique_ptr<VfsFile> ProxyVfs::openFile(const std::string& path, sqlite3_filename uri, int flags) {
    uint32_t openFlags = 0;
    if (flags & SQLITE_OPEN_CREATE) openFlags |= OpenFlags::Create;
    if (flags & SQLITE_OPEN_READONLY) openFlags |= OpenFlags::ReadOnly;
    if (flags & SQLITE_OPEN_DELETEONCLOSE) openFlags |= OpenFlags::DeleteOnClose;
    if (uri && (flags & SQLITE_OPEN_MAIN_DB) && sqlite3_uri_boolean(uri, "delete-before-open", 0)) {
        openFlags |= OpenFlags::DeleteBeforeOpen;
    }

    const int32_t fd = _client->allocateDescriptor();
    throwIfFailed(_client->open(fd, path, openFlags));
    ORIGINVAULT_LOG_TRACE_CAT(category(), "Opened " + path + " as fd " + std::to_string(fd));
    return std::make_unique<ProxyFile>(*_client, fd);
}

bool ProxyVfs::deleteFile(const std::string& path) {
    auto result = _client->remove(path);
    throwIfFailed(result);
    return result.value != 0;
}

bool ProxyVfs::fileExists(const std::string& path) {
    CommandMessage msg;
    msg.opcode = Opcode::Exists;
    msg.path = path;
    auto result = _client->submit(std::move(msg));
    throwIfFailed(result);
    return result.value != 0;
}

size_t ProxyVfs::importDb(const std::string& name, std::span<const std::byte> bytes) {
    Pool::VectorChunkSource source(std::vector<std::byte>(bytes.begin(), bytes.end()),
                                   _proxy->results().payloadCapacity());
    return importDb(name, source);
}

size_t ProxyVfs::importDb(const std::string& rawName, Pool::ChunkSource& source) {
    const std::string name = IO::OriginDirectory::normalizePath(rawName);
    const int32_t fd = _client->allocateDescriptor();
    throwIfFailed(_client->open(fd, name, OpenFlags::Create | OpenFlags::DeleteBeforeOpen));

    uint64_t written = 0;
    try {
        std::vector<std::byte> head;
        bool headerChecked = false;
        while (true) {
            Pool::Chunk chunk = source.next();
            if (!chunk.bytes.empty()) {
                if (!headerChecked) {
                    const size_t take = std::min(DatabaseImage::kMagicSize - head.size(), chunk.bytes.size());
                    head.insert(head.end(), chunk.bytes.begin(), chunk.bytes.begin() + take);
                    if (head.size() == DatabaseImage::kMagicSize) {
                        DatabaseImage::requireHeader(head, name);
                        headerChecked = true;
                    }
                }
                throwIfFailed(_client->write(fd, chunk.bytes, written));
                written += chunk.bytes.size();
            }
            if (chunk.endOfData) break;
        }
        if (!headerChecked) DatabaseImage::requireHeader(head, name);
        DatabaseImage::requireLength(written, name);
        if (auto expected = source.totalSize(); expected && *expected != written) {
            throw StorageException(StorageError::IOError, "Expected to write " + std::to_string(*expected) +
                                                          " bytes but wrote " + std::to_string(written), name);
        }

        const std::array<std::byte, 2> rollback{std::byte{1}, std::byte{1}};
        throwIfFailed(_client->write(fd, rollback, DatabaseImage::kWriteVersionOffset));
        throwIfFailed(_client->truncate(fd, written));
        throwIfFailed(_client->sync(fd));
    } catch (const StorageException& e) {
        ORIGINVAULT_LOG_WARN_CAT(category(), "Import of " + name + " failed: " + e.what());
        // Best effort: the import error is the one the caller needs
        auto closed = _client->close(fd);
        auto removed = _client->remove(name);
        if (!closed.ok() || !removed.ok()) {
            ORIGINVAULT_LOG_WARN_CAT(category(), "Could not clean up partial import of " + name);
        }
        throw;
    }
    throwIfFailed(_client->close(fd));

    ORIGINVAULT_LOG_INFO_CAT(category(), "Imported " + std::to_string(written) + " bytes into " + name);
    return static_cast<size_t>(written);
}

} // namespace OriginVault::Core::Vfs
