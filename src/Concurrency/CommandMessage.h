/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file CommandMessage.h
 * @brief Serialized I/O requests passed from driving threads to the async proxy
 *
 * A CommandMessage crosses the context boundary as a flat little-endian byte image, so the
 * proxy never shares request objects with the requester. Layout:
 *
 *   u8 opcode | u8 reserved | u16 pathLen | i32 fd | u32 slot | u32 flags |
 *   u64 requestId | u64 offset | u64 length | u32 payloadLen | path | payload
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../Storage/OriginDirectory.h"

namespace OriginVault::Core::Concurrency {

enum class Opcode : uint8_t {
    Open = 1,
    Close,
    Read,
    Write,
    Truncate,
    Sync,
    FileSize,
    Delete,
    Exists,
    Mkdir,
    Unlink,
    List
};

std::string_view toString(Opcode op) noexcept;

// Opcodes that address an open descriptor rather than a path
constexpr bool isDescriptorOp(Opcode op) noexcept {
    return op == Opcode::Open || op == Opcode::Close || op == Opcode::Read || op == Opcode::Write ||
           op == Opcode::Truncate || op == Opcode::Sync || op == Opcode::FileSize;
}

namespace OpenFlags {
    constexpr uint32_t Create = 1u << 0;
    constexpr uint32_t ReadOnly = 1u << 1;
    constexpr uint32_t DeleteOnClose = 1u << 2;
    constexpr uint32_t DeleteBeforeOpen = 1u << 3;
}

namespace UnlinkFlags {
    constexpr uint32_t Recursive = 1u << 0;
}

// Slot value for fire-and-forget commands that publish no result
constexpr uint32_t kNoReplySlot = 0xFFFFFFFFu;

struct CommandMessage {
    Opcode opcode = Opcode::Sync;
    uint64_t requestId = 0;
    int32_t fd = 0;
    uint32_t slot = kNoReplySlot;
    uint32_t flags = 0;
    uint64_t offset = 0;        ///< Byte offset; new size for Truncate; cursor for List
    uint64_t length = 0;        ///< Bytes requested by Read
    std::string path;
    std::vector<std::byte> payload;
};

constexpr size_t kCommandHeaderSize = 44;

std::vector<std::byte> encodeCommand(const CommandMessage& msg);

/**
 * @brief Parses a byte image produced by encodeCommand()
 * @throws StorageException Misuse when the image is truncated or names an unknown opcode
 */
CommandMessage decodeCommand(std::span<const std::byte> bytes);

/**
 * @brief Appends one listing entry to a List result page
 *
 * Entry layout: u8 kind | u64 size | u16 nameLen | name.
 * @return false (nothing appended) when the entry would push the page past maxBytes
 */
bool appendDirectoryEntry(std::vector<std::byte>& page, const IO::DirectoryEntry& entry, size_t maxBytes);

// Decodes a List result page; entry paths are rebuilt under parentPath
std::vector<IO::DirectoryEntry> decodeDirectoryEntries(std::span<const std::byte> page, const std::string& parentPath);

} // namespace OriginVault::Core::Concurrency
