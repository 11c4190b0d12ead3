/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file OriginDirectory.h
 * @brief Sandboxed, origin-scoped storage root
 *
 * OriginDirectory confines every path to a single host directory (the origin root). Paths are
 * origin-relative ("/dir/file.db"); they are normalized and may never escape the root. It opens
 * SyncAccessHandles and implements the directory utilities (exists, mkdir, unlink, list,
 * traverse) directly, without a command round trip.
 *
 * Every operation checks the directory's ContextAffinity. The async proxy binds the affinity to
 * its I/O thread, so any call from a driving thread fails with StorageError::WrongContext.
 *
 * @code
 * OriginDirectory dir("/var/lib/app/origin");
 * dir.mkdir("/a/b");
 * auto h = dir.open("/a/b/data.db", {.create = true});
 * dir.traverse({.root = "/", .recursive = true, .visitor = [](const auto& e, size_t) {
 *     ORIGINVAULT_LOG_INFO(e.path);
 *     return true;
 * }});
 * @endcode
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "ContextAffinity.h"
#include "SyncAccessHandle.h"

namespace OriginVault::Core::IO {

/**
 * @brief Options for OriginDirectory::open()
 * @param create Create the file if it does not exist
 * @param readOnly Open with a shared lock; writes fail with ReadOnly
 * @param createParentDirs Create missing parent directories when creating the file
 */
struct OpenOptions {
    bool create = false;
    bool readOnly = false;
    bool createParentDirs = true;
};

enum class EntryKind { File, Directory };

struct DirectoryEntry {
    std::string name;   // final path component
    std::string path;   // origin-relative path, always starting with '/'
    EntryKind kind = EntryKind::File;
    uint64_t size = 0;  // bytes, files only
};

/**
 * @brief Options for OriginDirectory::traverse()
 * @param root Directory to start from (origin-relative)
 * @param recursive Descend into subdirectories
 * @param visitor Called for each entry with its depth (1 = direct child); return false to stop
 */
struct TraverseOptions {
    std::string root = "/";
    bool recursive = true;
    std::function<bool(const DirectoryEntry&, size_t depth)> visitor;
};

class OriginDirectory {
public:
    /**
     * @brief Creates the root directory if needed
     * @throws StorageException CantOpen when the root cannot be created
     */
    explicit OriginDirectory(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return _root; }
    ContextAffinity& affinity() noexcept { return _affinity; }
    const ContextAffinity& affinity() const noexcept { return _affinity; }

    /**
     * @brief Canonical origin-relative form of a path
     *
     * Collapses duplicate separators and "." segments and resolves "..". Always starts with '/'.
     * @throws StorageException Misuse when ".." would leave the root
     */
    static std::string normalizePath(std::string_view path);

    // Host path for an origin-relative path
    std::filesystem::path resolve(std::string_view path) const;

    std::unique_ptr<SyncAccessHandle> open(std::string_view path, const OpenOptions& options = {});

    bool entryExists(std::string_view path) const;
    // True if the directory was created or already exists
    bool mkdir(std::string_view path);
    /**
     * @brief Removes a file or directory
     * @return false when nothing was deleted (missing entry, non-empty directory without
     *         recursive, or the root itself)
     */
    bool unlink(std::string_view path, bool recursive = false);
    std::vector<DirectoryEntry> listEntries(std::string_view path) const;
    void traverse(const TraverseOptions& options) const;

    /**
     * @brief Splits a filename into its directory (host path) and final component
     * @param createDirs Create the directory chain when missing
     * @throws StorageException NotFound when the directory is missing and !createDirs
     */
    std::pair<std::filesystem::path, std::string> getDirForFilename(std::string_view filename, bool createDirs);

    // Random name from [a-zA-Z0-9], used for opaque slot files and anonymous temp files
    static std::string randomFilename(size_t length = 16);

private:
    std::filesystem::path _root;
    ContextAffinity _affinity;
};

} // namespace OriginVault::Core::IO
