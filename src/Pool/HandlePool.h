/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file HandlePool.h
 * @brief Fixed set of always-open access handles reused across database files
 *
 * A HandlePool keeps N slot files under <root>/<directory>/.opaque/, each with random names
 * and an exclusive SyncAccessHandle held for the pool's lifetime. A logical filename such
 * as "/foo.db" is associated with one slot by writing it into the slot's 4096-byte header:
 *
 * @code
 *   offset 0    .. 511   associated name, NUL padded ("" = free)
 *   offset 512  .. 515   persisted open flags (u32 LE)
 *   offset 516  .. 523   digest of bytes 0..515 (two u32 LE lanes)
 *   offset 4096 ..       file contents
 * @endcode
 *
 * On start-up every slot header is read back; a slot whose digest does not match is
 * treated as free, so an interrupted header write can never leave a permanently wrong
 * association.
 *
 * The pool registers an SQLite VFS under its name (see PoolVfs). Reads and writes go
 * straight to the slot handles with no cross-thread hop; the pool mutex orders them.
 *
 * Pools are normally obtained through PoolRegistry::install() so that one name maps to one
 * instance per process.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
#include "ChunkSource.h"
#include "../Core/SlotPool.h"
#include "../Logging/LogLevel.h"
#include "../Storage/SyncAccessHandle.h"

namespace OriginVault::Core::Vfs { class PoolVfs; }

namespace OriginVault::Core::Pool {

// Open flags that survive in a slot header; values match SQLITE_OPEN_*
namespace PersistentFlags {
    constexpr uint32_t MainDb = 0x00000100;
    constexpr uint32_t MainJournal = 0x00000800;
    constexpr uint32_t SuperJournal = 0x00004000;
    constexpr uint32_t Wal = 0x00080000;
    constexpr uint32_t Mask = MainDb | MainJournal | SuperJournal | Wal;
}

class HandlePool {
public:
    static constexpr size_t kHeaderSize = 4096;
    static constexpr size_t kNameCapacity = 512;
    static constexpr size_t kFlagsOffset = 512;
    static constexpr size_t kDigestOffset = 516;
    static constexpr size_t kDigestedBytes = kDigestOffset;

    struct Config {
        std::string name;
        std::filesystem::path root;
        // Relative to root; empty means ".<name>"
        std::string directory;
        size_t initialCapacity;
        // Release every slot at start-up instead of recovering associations
        bool clearOnInit;
        // 0 errors, 1 warnings, 2 info, 3 debug
        int verbosity;
        // Read by PoolRegistry: retry an install whose previous attempt failed
        bool forceReinitIfPreviouslyFailed;
        // Register the SQLite VFS on construction
        bool registerVfs;
        bool makeDefaultVfs;

        Config()
            : name("opfs-sahpool")
            , root(std::filesystem::temp_directory_path() / "originvault")
            , initialCapacity(6)
            , clearOnInit(false)
            , verbosity(1)
            , forceReinitIfPreviouslyFailed(false)
            , registerVfs(true)
            , makeDefaultVfs(false) {}
    };

    /**
     * @brief Opens or creates the pool directory, recovers slot associations and registers the VFS
     * @throws StorageException CantOpen when the directory cannot be created, Busy when another
     *         owner holds the slot files
     */
    explicit HandlePool(Config config);
    ~HandlePool();

    HandlePool(const HandlePool&) = delete;
    HandlePool& operator=(const HandlePool&) = delete;

    const std::string& vfsName() const noexcept { return _config.name; }
    const Config& config() const noexcept { return _config; }
    const std::filesystem::path& directory() const noexcept { return _poolDir; }

    size_t getCapacity() const;
    // Returns the new capacity
    size_t addCapacity(size_t count);
    // Throws Busy when fewer than count slots are free; otherwise returns count
    size_t reduceCapacity(size_t count);

    std::vector<std::string> getFileNames() const;
    size_t getFileCount() const;
    bool hasFile(const std::string& name) const;
    size_t getOpenFileCount() const;

    std::vector<std::byte> exportFile(const std::string& name);

    /**
     * @brief Writes a complete database image into the slot for name
     *
     * The image must start with "SQLite format 3\0" and be a positive multiple of 512
     * bytes (NotADatabase otherwise). Header bytes 18 and 19 are set to 1 so the copy
     * opens in rollback-journal mode. A failed import releases the slot.
     * @return Bytes written
     */
    size_t importDb(const std::string& name, std::span<const std::byte> bytes);
    size_t importDb(const std::string& name, ChunkSource& source);

    // True when an association was removed
    bool unlink(const std::string& name);
    // Releases every slot; Misuse while any file is open
    void wipeFiles();

    /**
     * @brief Detaches the VFS so no new opens can reach the pool
     * @throws StorageException Misuse if any file is currently open
     */
    void pauseVfs();
    // No-op when not paused
    void unpauseVfs();
    bool isPaused() const;

    /**
     * @brief Unregisters the VFS, closes every handle and deletes the pool directory
     * @return true the first time, false afterwards
     */
    bool removeVfs();
    bool isRemoved() const;

    // Called once after a successful removeVfs(); used by PoolRegistry
    void setRemovalCallback(std::function<void(const std::string&)> callback);

    // Slot-level API used by PoolVfs

    /**
     * @brief Returns the slot associated with name, associating a free one when asked
     * @throws StorageException NotFound (no association and !createIfMissing),
     *         CapacityExceeded (no free slot), Misuse (name too long)
     */
    SlotHandle acquireSlotFor(const std::string& name, bool createIfMissing, uint32_t flags = PersistentFlags::MainDb);

    // Disassociates name; no-op when name is not associated. Busy while the file is open.
    void release(const std::string& name);

    SlotHandle openFile(const std::string& name, bool createIfMissing, uint32_t flags);
    void closeFile(SlotHandle slot, bool deleteOnClose);

    size_t readAt(SlotHandle slot, std::span<std::byte> buffer, uint64_t offset);
    void writeAt(SlotHandle slot, std::span<const std::byte> data, uint64_t offset);
    void truncateAt(SlotHandle slot, uint64_t size);
    void flushSlot(SlotHandle slot);
    uint64_t dataSize(SlotHandle slot);

    // Canonical name form shared with OriginDirectory::normalizePath; Misuse when '..' escapes the root
    static std::string normalizeName(const std::string& name);

    // cyrb53-style digest of a header's name and flag bytes
    static std::pair<uint32_t, uint32_t> computeDigest(std::span<const std::byte> bytes) noexcept;

private:
    struct SlotFile {
        std::filesystem::path hostPath;
        std::unique_ptr<IO::SyncAccessHandle> handle;
        std::string name;
        uint32_t flags = 0;
        size_t openCount = 0;
    };

    void initialize();
    void createSlotFiles(size_t count);
    void writeHeader(SlotFile& slot, const std::string& name, uint32_t flags);
    bool readHeader(SlotFile& slot);
    SlotHandle associateLocked(const std::string& name, uint32_t flags);
    void releaseLocked(const std::string& name);
    SlotFile& requireSlotLocked(SlotHandle slot);
    void requireActiveLocked(const char* operation) const;
    size_t openFileCountLocked() const;
    void closeAllHandlesLocked();
    void log(Logging::LogLevel level, const std::string& message) const;

    Config _config;
    std::filesystem::path _poolDir;
    std::filesystem::path _slotDir;

    mutable std::mutex _mutex;
    SlotPool<SlotFile> _slots;
    std::unordered_map<std::string, SlotHandle> _byName;
    bool _paused = false;
    bool _removed = false;
    std::function<void(const std::string&)> _onRemoved;

    std::unique_ptr<Vfs::PoolVfs> _vfs;
};

} // namespace OriginVault::Core::Pool
