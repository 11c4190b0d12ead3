/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "DirectoryClient.h"

namespace OriginVault::Core::Concurrency {

using IO::StorageException;

DirectoryClient::DirectoryClient(AsyncProxy& proxy, std::optional<std::chrono::milliseconds> timeout)
    : _client(proxy, timeout) {
}

int64_t DirectoryClient::valueOrThrow(CommandMessage msg) {
    auto result = _client.submit(std::move(msg));
    if (!result.ok()) {
        throw StorageException(result.error);
    }
    return result.value;
}

bool DirectoryClient::entryExists(const std::string& path) {
    CommandMessage msg;
    msg.opcode = Opcode::Exists;
    msg.path = path;
    return valueOrThrow(std::move(msg)) != 0;
}

bool DirectoryClient::mkdir(const std::string& path) {
    CommandMessage msg;
    msg.opcode = Opcode::Mkdir;
    msg.path = path;
    return valueOrThrow(std::move(msg)) != 0;
}

bool DirectoryClient::unlink(const std::string& path, bool recursive) {
    CommandMessage msg;
    msg.opcode = Opcode::Unlink;
    msg.path = path;
    msg.flags = recursive ? UnlinkFlags::Recursive : 0;
    return valueOrThrow(std::move(msg)) != 0;
}

std::vector<IO::DirectoryEntry> DirectoryClient::listEntries(const std::string& path) {
    const std::string parent = IO::OriginDirectory::normalizePath(path);
    std::vector<IO::DirectoryEntry> entries;
    int64_t cursor = 0;
    while (cursor >= 0) {
        CommandMessage msg;
        msg.opcode = Opcode::List;
        msg.path = parent;
        msg.offset = static_cast<uint64_t>(cursor);
        auto result = _client.submit(std::move(msg));
        if (!result.ok()) {
            throw StorageException(result.error);
        }
        auto page = decodeDirectoryEntries(result.payload, parent);
        entries.insert(entries.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
        cursor = result.value;
    }
    return entries;
}

void DirectoryClient::traverse(const IO::TraverseOptions& options) {
    walk(IO::OriginDirectory::normalizePath(options.root), 1, options);
}

bool DirectoryClient::walk(const std::string& dir, size_t depth, const IO::TraverseOptions& options) {
    for (const auto& entry : listEntries(dir)) {
        if (options.visitor && !options.visitor(entry, depth)) return false;
        if (options.recursive && entry.kind == IO::EntryKind::Directory) {
            if (!walk(entry.path, depth + 1, options)) return false;
        }
    }
    return true;
}

} // namespace OriginVault::Core::Concurrency
