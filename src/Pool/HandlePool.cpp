/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "HandlePool.h"
#include "DatabaseImage.h"
#include "../Core/ByteOrder.h"
#include "../Logging/Logger.h"
#include "../Storage/OriginDirectory.h"
#include "../Storage/StorageCapabilities.h"
#include "../VirtualFileSystem/PoolVfs.h"
#include <algorithm>
#include <array>
#include <cstring>

namespace OriginVault::Core::Pool {

using IO::StorageError;
using IO::StorageException;
using Logging::LogLevel;

namespace {
    uint32_t imul(uint32_t a, uint32_t b) noexcept {
        return static_cast<uint32_t>(static_cast<uint64_t>(a) * b);
    }
}

HandlePool::HandlePool(Config config)
    : _config(std::move(config)) {
    if (_config.name.empty()) {
        throw StorageException(StorageError::Misuse, "Pool name must not be empty");
    }
    IO::StorageCapabilities::require("HandlePool");

    _poolDir = _config.root / (_config.directory.empty() ? "." + _config.name : _config.directory);
    _slotDir = _poolDir / ".opaque";
    initialize();

    if (_config.registerVfs) {
        _vfs = std::make_unique<Vfs::PoolVfs>(*this, _config.makeDefaultVfs);
        _vfs->registerVfs();
    }
    log(LogLevel::Info, "Pool " + _config.name + " ready with capacity " + std::to_string(_slots.capacity()) +
                        " and " + std::to_string(_byName.size()) + " file(s)");
}

HandlePool::~HandlePool() {
    if (_vfs) {
        _vfs->unregisterVfs();
    }
    std::lock_guard<std::mutex> lock(_mutex);
    if (openFileCountLocked() > 0) {
        log(LogLevel::Warning, "Pool " + _config.name + " destroyed with open files");
    }
    closeAllHandlesLocked();
}

void HandlePool::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(_slotDir, ec);
    if (ec || !std::filesystem::is_directory(_slotDir)) {
        throw StorageException(StorageError::CantOpen, "Cannot create pool directory", _slotDir.string(),
                               ec ? std::optional<std::error_code>(ec) : std::nullopt);
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(_slotDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    if (ec) {
        throw StorageException(StorageError::IOError, "Cannot scan pool directory", _slotDir.string(), ec);
    }
    std::sort(files.begin(), files.end());

    std::lock_guard<std::mutex> lock(_mutex);
    try {
        for (const auto& file : files) {
            auto index = _slots.grow(1).front();
            SlotFile& slot = _slots.at(index);
            slot.hostPath = file;
            slot.handle = IO::SyncAccessHandle::open(file, false);

            if (_config.clearOnInit) {
                writeHeader(slot, "", 0);
                continue;
            }
            if (!readHeader(slot) || slot.name.empty()) continue;

            if (_byName.count(slot.name)) {
                log(LogLevel::Warning, "Duplicate association for " + slot.name + "; freeing " + file.filename().string());
                writeHeader(slot, "", 0);
                continue;
            }
            auto handle = _slots.allocateAt(index);
            if (handle) {
                _byName.emplace(slot.name, *handle);
                log(LogLevel::Debug, "Recovered " + slot.name + " in slot " + file.filename().string());
            }
        }
    } catch (const StorageException&) {
        closeAllHandlesLocked();
        throw;
    }

    if (_slots.capacity() < _config.initialCapacity) {
        createSlotFiles(_config.initialCapacity - _slots.capacity());
    }
}

void HandlePool::createSlotFiles(size_t count) {
    // Every file is opened before the slots join the free list, so a failure leaves capacity unchanged
    std::vector<SlotFile> fresh;
    fresh.reserve(count);
    try {
        for (size_t i = 0; i < count; ++i) {
            SlotFile slot;
            slot.hostPath = _slotDir / IO::OriginDirectory::randomFilename(16);
            slot.handle = IO::SyncAccessHandle::open(slot.hostPath, true);
            fresh.push_back(std::move(slot));
            writeHeader(fresh.back(), "", 0);
        }
    } catch (const StorageException&) {
        for (auto& slot : fresh) {
            try {
                slot.handle->close();
            } catch (const StorageException& e) {
                log(LogLevel::Error, std::string("Failed to close abandoned slot: ") + e.what());
            }
            std::error_code ec;
            std::filesystem::remove(slot.hostPath, ec);
        }
        throw;
    }

    auto indices = _slots.grow(count);
    for (size_t i = 0; i < indices.size(); ++i) {
        _slots.at(indices[i]) = std::move(fresh[i]);
    }
}

std::pair<uint32_t, uint32_t> HandlePool::computeDigest(std::span<const std::byte> bytes) noexcept {
    uint32_t h1 = 0xdeadbeefu;
    uint32_t h2 = 0x41c6ce57u;
    for (auto b : bytes) {
        const auto ch = static_cast<uint32_t>(b);
        h1 = imul(h1 ^ ch, 2654435761u);
        h2 = imul(h2 ^ ch, 1597334677u);
    }
    h1 = imul(h1 ^ (h1 >> 16), 2246822507u) ^ imul(h2 ^ (h2 >> 13), 3266489909u);
    h2 = imul(h2 ^ (h2 >> 16), 2246822507u) ^ imul(h1 ^ (h1 >> 13), 3266489909u);
    return {h1, h2};
}

void HandlePool::writeHeader(SlotFile& slot, const std::string& name, uint32_t flags) {
    std::array<std::byte, kHeaderSize> header{};
    std::memcpy(header.data(), name.data(), name.size());
    ByteOrder::storeLE<uint32_t>(header.data() + kFlagsOffset, flags);
    auto [h1, h2] = computeDigest(std::span<const std::byte>(header.data(), kDigestedBytes));
    ByteOrder::storeLE<uint32_t>(header.data() + kDigestOffset, h1);
    ByteOrder::storeLE<uint32_t>(header.data() + kDigestOffset + 4, h2);

    slot.handle->write(std::span<const std::byte>(header.data(), kDigestOffset + 8), 0);
    if (name.empty()) {
        slot.handle->truncate(kHeaderSize);
    }
    slot.handle->flush();
    slot.name = name;
    slot.flags = flags;
}

bool HandlePool::readHeader(SlotFile& slot) {
    std::array<std::byte, kDigestOffset + 8> header{};
    const size_t got = slot.handle->read(header, 0);
    if (got < header.size()) {
        // Short or empty slot file: never completed its first header write
        writeHeader(slot, "", 0);
        return false;
    }

    auto [h1, h2] = computeDigest(std::span<const std::byte>(header.data(), kDigestedBytes));
    if (h1 != ByteOrder::loadLE<uint32_t>(header.data() + kDigestOffset) ||
        h2 != ByteOrder::loadLE<uint32_t>(header.data() + kDigestOffset + 4)) {
        log(LogLevel::Warning, std::string(IO::toString(StorageError::Corruption)) + ": digest mismatch in slot " +
                               slot.hostPath.filename().string() + "; treating it as free");
        writeHeader(slot, "", 0);
        return false;
    }

    const auto* chars = reinterpret_cast<const char*>(header.data());
    slot.name.assign(chars, strnlen(chars, kNameCapacity));
    slot.flags = ByteOrder::loadLE<uint32_t>(header.data() + kFlagsOffset);
    return true;
}

std::string HandlePool::normalizeName(const std::string& name) {
    // Same form the VFS hands to xOpen, so imported names stay reachable from SQLite
    return IO::OriginDirectory::normalizePath(name);
}

void HandlePool::requireActiveLocked(const char* operation) const {
    if (_removed) {
        throw StorageException(StorageError::Misuse, std::string(operation) + ": VFS " + _config.name + " has been removed");
    }
}

size_t HandlePool::openFileCountLocked() const {
    size_t open = 0;
    _slots.forEachActive([&open](SlotHandle, const SlotFile& slot) {
        if (slot.openCount > 0) ++open;
    });
    return open;
}

void HandlePool::closeAllHandlesLocked() {
    _slots.forEachInCapacity([this](uint32_t, SlotPool<SlotFile>::State, SlotFile& slot) {
        if (!slot.handle) return;
        try {
            slot.handle->close();
        } catch (const StorageException& e) {
            log(LogLevel::Error, std::string("Failed to close slot: ") + e.what());
        }
    });
}

size_t HandlePool::getCapacity() const {
    return _slots.capacity();
}

size_t HandlePool::addCapacity(size_t count) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("addCapacity");
    createSlotFiles(count);
    log(LogLevel::Debug, "Capacity of " + _config.name + " is now " + std::to_string(_slots.capacity()));
    return _slots.capacity();
}

size_t HandlePool::reduceCapacity(size_t count) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("reduceCapacity");
    const size_t free = _slots.freeCount();
    if (free < count) {
        throw StorageException(StorageError::Busy, "Cannot reduce capacity by " + std::to_string(count) +
                                                   ": only " + std::to_string(free) + " slot(s) are free");
    }

    std::vector<std::filesystem::path> doomed;
    _slots.retireFree(count, [&doomed, this](uint32_t, SlotFile& slot) {
        if (slot.handle) {
            try {
                slot.handle->close();
            } catch (const StorageException& e) {
                log(LogLevel::Error, std::string("Failed to close retired slot: ") + e.what());
            }
            slot.handle.reset();
        }
        doomed.push_back(slot.hostPath);
        slot.hostPath.clear();
    });
    for (const auto& path : doomed) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) log(LogLevel::Warning, "Could not delete retired slot " + path.string() + ": " + ec.message());
    }
    return count;
}

std::vector<std::string> HandlePool::getFileNames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> names;
    names.reserve(_byName.size());
    for (const auto& [name, handle] : _byName) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

size_t HandlePool::getFileCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _byName.size();
}

bool HandlePool::hasFile(const std::string& rawName) const {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    return _byName.count(name) > 0;
}

size_t HandlePool::getOpenFileCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return openFileCountLocked();
}

SlotHandle HandlePool::associateLocked(const std::string& name, uint32_t flags) {
    if (name.size() >= kNameCapacity) {
        throw StorageException(StorageError::Misuse, "Path too long for a pool slot", name);
    }
    auto result = _slots.allocate();
    if (!result) {
        throw StorageException(StorageError::CapacityExceeded,
                               "No free slot in VFS " + _config.name + " (capacity " + std::to_string(_slots.capacity()) + ")",
                               name);
    }
    try {
        writeHeader(result->data, name, flags & PersistentFlags::Mask);
    } catch (const StorageException&) {
        _slots.release(result->handle);
        throw;
    }
    _byName.emplace(name, result->handle);
    log(LogLevel::Debug, "Associated " + name + " with slot " + result->data.hostPath.filename().string());
    return result->handle;
}

SlotHandle HandlePool::acquireSlotFor(const std::string& rawName, bool createIfMissing, uint32_t flags) {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("acquireSlotFor");
    auto it = _byName.find(name);
    if (it != _byName.end()) return it->second;
    if (!createIfMissing) {
        throw StorageException(StorageError::NotFound, "No such file in VFS " + _config.name, name);
    }
    return associateLocked(name, flags);
}

void HandlePool::releaseLocked(const std::string& name) {
    auto it = _byName.find(name);
    if (it == _byName.end()) return;
    SlotFile& slot = requireSlotLocked(it->second);
    if (slot.openCount > 0) {
        throw StorageException(StorageError::Busy, "Cannot release a file that is open", name);
    }
    writeHeader(slot, "", 0);
    _slots.release(it->second);
    _byName.erase(it);
    log(LogLevel::Debug, "Released " + name);
}

void HandlePool::release(const std::string& rawName) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("release");
    releaseLocked(normalizeName(rawName));
}

bool HandlePool::unlink(const std::string& rawName) {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("unlink");
    if (!_byName.count(name)) return false;
    releaseLocked(name);
    return true;
}

void HandlePool::wipeFiles() {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("wipeFiles");
    if (openFileCountLocked() > 0) {
        throw StorageException(StorageError::Misuse, "Cannot wipe VFS " + _config.name + " because it has opened files.");
    }
    std::vector<std::string> names;
    for (const auto& [name, handle] : _byName) names.push_back(name);
    for (const auto& name : names) releaseLocked(name);
}

SlotHandle HandlePool::openFile(const std::string& rawName, bool createIfMissing, uint32_t flags) {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("open");
    if (_paused) {
        throw StorageException(StorageError::Misuse, "VFS " + _config.name + " is paused", name);
    }
    auto it = _byName.find(name);
    SlotHandle handle;
    if (it != _byName.end()) {
        handle = it->second;
    } else if (createIfMissing) {
        handle = associateLocked(name, flags);
    } else {
        throw StorageException(StorageError::NotFound, "No such file in VFS " + _config.name, name);
    }
    ++requireSlotLocked(handle).openCount;
    return handle;
}

void HandlePool::closeFile(SlotHandle handle, bool deleteOnClose) {
    std::lock_guard<std::mutex> lock(_mutex);
    SlotFile* slot = _slots.getIfValid(handle);
    if (!slot) return;
    if (slot->openCount > 0) --slot->openCount;
    if (deleteOnClose && slot->openCount == 0 && !_removed) {
        const std::string name = slot->name;
        releaseLocked(name);
    }
}

HandlePool::SlotFile& HandlePool::requireSlotLocked(SlotHandle handle) {
    SlotFile* slot = _slots.getIfValid(handle);
    if (!slot || !slot->handle || !slot->handle->isOpen()) {
        throw StorageException(StorageError::Misuse, "Stale pool slot handle");
    }
    return *slot;
}

size_t HandlePool::readAt(SlotHandle handle, std::span<std::byte> buffer, uint64_t offset) {
    std::lock_guard<std::mutex> lock(_mutex);
    return requireSlotLocked(handle).handle->read(buffer, kHeaderSize + offset);
}

void HandlePool::writeAt(SlotHandle handle, std::span<const std::byte> data, uint64_t offset) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireSlotLocked(handle).handle->write(data, kHeaderSize + offset);
}

void HandlePool::truncateAt(SlotHandle handle, uint64_t size) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireSlotLocked(handle).handle->truncate(kHeaderSize + size);
}

void HandlePool::flushSlot(SlotHandle handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    requireSlotLocked(handle).handle->flush();
}

uint64_t HandlePool::dataSize(SlotHandle handle) {
    std::lock_guard<std::mutex> lock(_mutex);
    const uint64_t size = requireSlotLocked(handle).handle->size();
    return size > kHeaderSize ? size - kHeaderSize : 0;
}

std::vector<std::byte> HandlePool::exportFile(const std::string& rawName) {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("exportFile");
    auto it = _byName.find(name);
    if (it == _byName.end()) {
        throw StorageException(StorageError::NotFound, "File not found: " + name, name);
    }
    SlotFile& slot = requireSlotLocked(it->second);
    const uint64_t size = slot.handle->size();
    std::vector<std::byte> bytes(size > kHeaderSize ? static_cast<size_t>(size - kHeaderSize) : 0);
    const size_t got = slot.handle->read(bytes, kHeaderSize);
    if (got != bytes.size()) {
        throw StorageException(StorageError::IOError, "Expected to read " + std::to_string(bytes.size()) +
                                                      " bytes but read " + std::to_string(got), name);
    }
    return bytes;
}

size_t HandlePool::importDb(const std::string& name, std::span<const std::byte> bytes) {
    VectorChunkSource source(std::vector<std::byte>(bytes.begin(), bytes.end()), bytes.size() == 0 ? 1 : bytes.size());
    return importDb(name, source);
}

size_t HandlePool::importDb(const std::string& rawName, ChunkSource& source) {
    const std::string name = normalizeName(rawName);
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("importDb");

    auto existing = _byName.find(name);
    if (existing != _byName.end() && requireSlotLocked(existing->second).openCount > 0) {
        throw StorageException(StorageError::Busy, "Cannot import over a file that is open", name);
    }
    SlotHandle handle = existing != _byName.end() ? existing->second : associateLocked(name, PersistentFlags::MainDb);
    SlotFile& slot = requireSlotLocked(handle);

    uint64_t written = 0;
    try {
        slot.handle->truncate(kHeaderSize);
        std::vector<std::byte> head;
        bool headerChecked = false;
        while (true) {
            Chunk chunk = source.next();
            if (!chunk.bytes.empty()) {
                if (!headerChecked) {
                    const size_t take = std::min(DatabaseImage::kMagicSize - head.size(), chunk.bytes.size());
                    head.insert(head.end(), chunk.bytes.begin(), chunk.bytes.begin() + take);
                    if (head.size() == DatabaseImage::kMagicSize) {
                        DatabaseImage::requireHeader(head, name);
                        headerChecked = true;
                    }
                }
                slot.handle->write(chunk.bytes, kHeaderSize + written);
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
        static_assert(DatabaseImage::kReadVersionOffset == DatabaseImage::kWriteVersionOffset + 1);
        slot.handle->write(rollback, kHeaderSize + DatabaseImage::kWriteVersionOffset);
        slot.handle->flush();
    } catch (const StorageException&) {
        releaseLocked(name);
        throw;
    }

    log(LogLevel::Info, "Imported " + std::to_string(written) + " bytes into " + name);
    return static_cast<size_t>(written);
}

void HandlePool::pauseVfs() {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("pauseVfs");
    if (openFileCountLocked() > 0) {
        throw StorageException(StorageError::Misuse, "Cannot pause VFS " + _config.name + " because it has opened files.");
    }
    if (_paused) return;
    if (_vfs) _vfs->unregisterVfs();
    _paused = true;
    log(LogLevel::Info, "Paused VFS " + _config.name);
}

void HandlePool::unpauseVfs() {
    std::lock_guard<std::mutex> lock(_mutex);
    requireActiveLocked("unpauseVfs");
    if (!_paused) return;
    if (_vfs) _vfs->registerVfs();
    _paused = false;
    log(LogLevel::Info, "Unpaused VFS " + _config.name);
}

bool HandlePool::isPaused() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _paused;
}

bool HandlePool::removeVfs() {
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_removed) return false;
        if (openFileCountLocked() > 0) {
            throw StorageException(StorageError::Misuse, "Cannot remove VFS " + _config.name + " because it has opened files.");
        }
        if (_vfs) _vfs->unregisterVfs();
        closeAllHandlesLocked();
        _byName.clear();
        _removed = true;

        std::error_code ec;
        std::filesystem::remove_all(_poolDir, ec);
        if (ec) {
            log(LogLevel::Warning, "Could not delete pool directory " + _poolDir.string() + ": " + ec.message());
        }
        callback = std::move(_onRemoved);
    }
    log(LogLevel::Info, "Removed VFS " + _config.name);
    if (callback) callback(_config.name);
    return true;
}

bool HandlePool::isRemoved() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _removed;
}

void HandlePool::setRemovalCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _onRemoved = std::move(callback);
}

void HandlePool::log(LogLevel level, const std::string& message) const {
    // verbosity 0 keeps errors, 1 adds warnings, 2 info, 3 debug
    static constexpr LogLevel kThreshold[] = {LogLevel::Error, LogLevel::Warning, LogLevel::Info, LogLevel::Debug};
    const int v = std::clamp(_config.verbosity, 0, 3);
    if (level < kThreshold[v]) return;
    ORIGINVAULT_LOG_AT(level, "HandlePool", message);
}

} // namespace OriginVault::Core::Pool
