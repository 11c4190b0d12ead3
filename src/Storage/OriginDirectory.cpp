/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "OriginDirectory.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <random>

namespace OriginVault::Core::IO {

namespace {
    DirectoryEntry makeEntry(const std::filesystem::directory_entry& fsEntry, const std::string& parent) {
        DirectoryEntry entry;
        entry.name = fsEntry.path().filename().string();
        entry.path = (parent == "/" ? std::string("/") : parent + "/") + entry.name;
        std::error_code ec;
        if (fsEntry.is_directory(ec)) {
            entry.kind = EntryKind::Directory;
        } else {
            entry.kind = EntryKind::File;
            entry.size = fsEntry.file_size(ec);
            if (ec) entry.size = 0;
        }
        return entry;
    }

    // Returns false when the visitor asked to stop
    bool walk(const std::filesystem::path& hostDir, const std::string& relDir, size_t depth,
              const TraverseOptions& options) {
        std::error_code ec;
        std::vector<DirectoryEntry> entries;
        for (std::filesystem::directory_iterator it(hostDir, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(makeEntry(*it, relDir));
        }
        if (ec) {
            throw StorageException(StorageError::IOError, "Cannot list directory", relDir, ec);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });

        for (const auto& entry : entries) {
            if (options.visitor && !options.visitor(entry, depth)) return false;
            if (options.recursive && entry.kind == EntryKind::Directory) {
                if (!walk(hostDir / entry.name, entry.path, depth + 1, options)) return false;
            }
        }
        return true;
    }
}

OriginDirectory::OriginDirectory(std::filesystem::path root)
    : _root(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(_root, ec);
    if (ec || !std::filesystem::is_directory(_root, ec)) {
        throw StorageException(StorageError::CantOpen, "Cannot create storage root", _root.string(),
                               ec ? std::optional<std::error_code>(ec) : std::nullopt);
    }
}

std::string OriginDirectory::normalizePath(std::string_view path) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string_view::npos) j = path.size();
        std::string_view seg = path.substr(i, j - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (parts.empty()) {
                throw StorageException(StorageError::Misuse, "Path escapes the storage root", std::string(path));
            }
            parts.pop_back();
        } else {
            parts.emplace_back(seg);
        }
        i = j + 1;
    }

    std::string out;
    for (const auto& p : parts) {
        out += '/';
        out += p;
    }
    return out.empty() ? std::string("/") : out;
}

std::filesystem::path OriginDirectory::resolve(std::string_view path) const {
    auto norm = normalizePath(path);
    if (norm == "/") return _root;
    return _root / std::filesystem::path(norm.substr(1));
}

std::unique_ptr<SyncAccessHandle> OriginDirectory::open(std::string_view path, const OpenOptions& options) {
    _affinity.require("open");
    auto norm = normalizePath(path);
    if (norm == "/") {
        throw StorageException(StorageError::CantOpen, "Cannot open the storage root as a file", norm);
    }
    auto host = resolve(norm);
    if (options.create && options.createParentDirs && !options.readOnly) {
        std::error_code ec;
        std::filesystem::create_directories(host.parent_path(), ec);
        if (ec) {
            throw StorageException(StorageError::CantOpen, "Cannot create parent directories", norm, ec);
        }
    }
    auto mode = options.readOnly ? SyncAccessHandle::Mode::ReadOnly : SyncAccessHandle::Mode::ReadWrite;
    return SyncAccessHandle::open(host, options.create, mode);
}

bool OriginDirectory::entryExists(std::string_view path) const {
    _affinity.require("entryExists");
    std::error_code ec;
    return std::filesystem::exists(resolve(path), ec);
}

bool OriginDirectory::mkdir(std::string_view path) {
    _affinity.require("mkdir");
    auto host = resolve(path);
    std::error_code ec;
    std::filesystem::create_directories(host, ec);
    if (ec) {
        ORIGINVAULT_LOG_DEBUG_CAT("OriginDirectory", "mkdir failed for " + std::string(path) + ": " + ec.message());
        return false;
    }
    return std::filesystem::is_directory(host, ec);
}

bool OriginDirectory::unlink(std::string_view path, bool recursive) {
    _affinity.require("unlink");
    auto norm = normalizePath(path);
    if (norm == "/") return false;
    auto host = resolve(norm);

    std::error_code ec;
    auto status = std::filesystem::symlink_status(host, ec);
    if (ec || !std::filesystem::exists(status)) return false;

    if (std::filesystem::is_directory(status)) {
        if (recursive) {
            auto removed = std::filesystem::remove_all(host, ec);
            if (ec) {
                throw StorageException(StorageError::IOError, "Cannot remove directory", norm, ec);
            }
            return removed > 0;
        }
        if (!std::filesystem::is_empty(host, ec) || ec) return false;
    }

    bool removed = std::filesystem::remove(host, ec);
    if (ec) {
        throw StorageException(mapErrnoToStorageError(ec.value()), "Cannot remove entry", norm, ec);
    }
    return removed;
}

std::vector<DirectoryEntry> OriginDirectory::listEntries(std::string_view path) const {
    _affinity.require("listEntries");
    auto norm = normalizePath(path);
    auto host = resolve(norm);
    std::error_code ec;
    if (!std::filesystem::is_directory(host, ec)) {
        throw StorageException(StorageError::NotFound, "Directory not found", norm, ec ? std::optional<std::error_code>(ec) : std::nullopt);
    }
    std::vector<DirectoryEntry> entries;
    TraverseOptions options;
    options.root = norm;
    options.recursive = false;
    options.visitor = [&entries](const DirectoryEntry& e, size_t) {
        entries.push_back(e);
        return true;
    };
    walk(host, norm, 1, options);
    return entries;
}

void OriginDirectory::traverse(const TraverseOptions& options) const {
    _affinity.require("traverse");
    auto norm = normalizePath(options.root);
    auto host = resolve(norm);
    std::error_code ec;
    if (!std::filesystem::is_directory(host, ec)) {
        throw StorageException(StorageError::NotFound, "Directory not found", norm);
    }
    walk(host, norm, 1, options);
}

std::pair<std::filesystem::path, std::string> OriginDirectory::getDirForFilename(std::string_view filename, bool createDirs) {
    _affinity.require("getDirForFilename");
    auto norm = normalizePath(filename);
    if (norm == "/") {
        throw StorageException(StorageError::Misuse, "Filename has no final component", norm);
    }
    auto slash = norm.rfind('/');
    auto dirPart = norm.substr(0, slash == 0 ? 1 : slash);
    auto filePart = norm.substr(slash + 1);
    auto hostDir = resolve(dirPart);

    std::error_code ec;
    if (createDirs) {
        std::filesystem::create_directories(hostDir, ec);
        if (ec) {
            throw StorageException(StorageError::CantOpen, "Cannot create directory", dirPart, ec);
        }
    } else if (!std::filesystem::is_directory(hostDir, ec)) {
        throw StorageException(StorageError::NotFound, "Directory not found", dirPart);
    }
    return {hostDir, filePart};
}

std::string OriginDirectory::randomFilename(size_t length) {
    static constexpr char kAlphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(kAlphabet[dist(gen)]);
    }
    return out;
}

} // namespace OriginVault::Core::IO
