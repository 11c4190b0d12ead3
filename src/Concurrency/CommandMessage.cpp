/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "CommandMessage.h"
#include "../Core/ByteOrder.h"
#include "../Storage/StorageError.h"
#include <algorithm>
#include <cstring>
#include <limits>

namespace OriginVault::Core::Concurrency {

using Core::ByteOrder::loadLE;
using Core::ByteOrder::storeLE;
using IO::StorageError;
using IO::StorageException;

std::string_view toString(Opcode op) noexcept {
    switch (op) {
        case Opcode::Open:     return "Open";
        case Opcode::Close:    return "Close";
        case Opcode::Read:     return "Read";
        case Opcode::Write:    return "Write";
        case Opcode::Truncate: return "Truncate";
        case Opcode::Sync:     return "Sync";
        case Opcode::FileSize: return "FileSize";
        case Opcode::Delete:   return "Delete";
        case Opcode::Exists:   return "Exists";
        case Opcode::Mkdir:    return "Mkdir";
        case Opcode::Unlink:   return "Unlink";
        case Opcode::List:     return "List";
    }
    return "Unknown";
}

std::vector<std::byte> encodeCommand(const CommandMessage& msg) {
    if (msg.path.size() > std::numeric_limits<uint16_t>::max()) {
        throw StorageException(StorageError::Misuse, "Command path too long", msg.path);
    }
    if (msg.payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw StorageException(StorageError::Misuse, "Command payload too large");
    }

    std::vector<std::byte> out(kCommandHeaderSize + msg.path.size() + msg.payload.size());
    std::byte* p = out.data();
    storeLE<uint8_t>(p + 0, static_cast<uint8_t>(msg.opcode));
    storeLE<uint8_t>(p + 1, 0);
    storeLE<uint16_t>(p + 2, static_cast<uint16_t>(msg.path.size()));
    storeLE<int32_t>(p + 4, msg.fd);
    storeLE<uint32_t>(p + 8, msg.slot);
    storeLE<uint32_t>(p + 12, msg.flags);
    storeLE<uint64_t>(p + 16, msg.requestId);
    storeLE<uint64_t>(p + 24, msg.offset);
    storeLE<uint64_t>(p + 32, msg.length);
    storeLE<uint32_t>(p + 40, static_cast<uint32_t>(msg.payload.size()));
    if (!msg.path.empty()) {
        std::memcpy(p + kCommandHeaderSize, msg.path.data(), msg.path.size());
    }
    if (!msg.payload.empty()) {
        std::memcpy(p + kCommandHeaderSize + msg.path.size(), msg.payload.data(), msg.payload.size());
    }
    return out;
}

CommandMessage decodeCommand(std::span<const std::byte> bytes) {
    if (bytes.size() < kCommandHeaderSize) {
        throw StorageException(StorageError::Misuse, "Truncated command header");
    }
    const std::byte* p = bytes.data();
    const auto op = loadLE<uint8_t>(p);
    if (op < static_cast<uint8_t>(Opcode::Open) || op > static_cast<uint8_t>(Opcode::List)) {
        throw StorageException(StorageError::Misuse, "Unknown opcode " + std::to_string(op));
    }

    CommandMessage msg;
    msg.opcode = static_cast<Opcode>(op);
    const auto pathLen = loadLE<uint16_t>(p + 2);
    msg.fd = loadLE<int32_t>(p + 4);
    msg.slot = loadLE<uint32_t>(p + 8);
    msg.flags = loadLE<uint32_t>(p + 12);
    msg.requestId = loadLE<uint64_t>(p + 16);
    msg.offset = loadLE<uint64_t>(p + 24);
    msg.length = loadLE<uint64_t>(p + 32);
    const auto payloadLen = loadLE<uint32_t>(p + 40);

    if (bytes.size() != kCommandHeaderSize + pathLen + static_cast<size_t>(payloadLen)) {
        throw StorageException(StorageError::Misuse, "Command length does not match its header");
    }
    msg.path.assign(reinterpret_cast<const char*>(p + kCommandHeaderSize), pathLen);
    msg.payload.assign(bytes.begin() + kCommandHeaderSize + pathLen, bytes.end());
    return msg;
}

bool appendDirectoryEntry(std::vector<std::byte>& page, const IO::DirectoryEntry& entry, size_t maxBytes) {
    const size_t nameLen = std::min<size_t>(entry.name.size(), std::numeric_limits<uint16_t>::max());
    const size_t need = 1 + 8 + 2 + nameLen;
    if (page.size() + need > maxBytes) return false;

    const size_t at = page.size();
    page.resize(at + need);
    std::byte* p = page.data() + at;
    storeLE<uint8_t>(p, entry.kind == IO::EntryKind::Directory ? 1 : 0);
    storeLE<uint64_t>(p + 1, entry.size);
    storeLE<uint16_t>(p + 9, static_cast<uint16_t>(nameLen));
    std::memcpy(p + 11, entry.name.data(), nameLen);
    return true;
}

std::vector<IO::DirectoryEntry> decodeDirectoryEntries(std::span<const std::byte> page, const std::string& parentPath) {
    std::vector<IO::DirectoryEntry> entries;
    size_t pos = 0;
    while (pos < page.size()) {
        if (page.size() - pos < 11) {
            throw StorageException(StorageError::Misuse, "Truncated directory entry");
        }
        const std::byte* p = page.data() + pos;
        IO::DirectoryEntry entry;
        entry.kind = loadLE<uint8_t>(p) ? IO::EntryKind::Directory : IO::EntryKind::File;
        entry.size = loadLE<uint64_t>(p + 1);
        const auto nameLen = loadLE<uint16_t>(p + 9);
        if (page.size() - pos - 11 < nameLen) {
            throw StorageException(StorageError::Misuse, "Truncated directory entry name");
        }
        entry.name.assign(reinterpret_cast<const char*>(p + 11), nameLen);
        entry.path = (parentPath == "/" ? std::string("/") : parentPath + "/") + entry.name;
        entries.push_back(std::move(entry));
        pos += 11 + nameLen;
    }
    return entries;
}

} // namespace OriginVault::Core::Concurrency
