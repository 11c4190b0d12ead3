/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "ProxyClient.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cstring>

namespace OriginVault::Core::Concurrency {

using IO::StorageError;

ProxyClient::ProxyClient(AsyncProxy& proxy, std::optional<std::chrono::milliseconds> timeout)
    : _proxy(proxy)
    , _timeout(timeout.value_or(proxy.config().defaultTimeout)) {
}

CommandResult ProxyClient::submit(CommandMessage msg) {
    if (!_proxy.isRunning()) {
        return CommandResult::failure(StorageError::IOError, "Async proxy is not running", msg.path);
    }

    const auto deadline = std::chrono::steady_clock::now() + _timeout;
    auto& results = _proxy.results();
    msg.requestId = _proxy.nextRequestId();

    auto slot = results.claim(msg.requestId, deadline);
    if (!slot) {
        return CommandResult::failure(StorageError::IOTimeout, "No result slot became free before the deadline", msg.path);
    }
    msg.slot = *slot;

    const auto requestId = msg.requestId;
    const auto opcode = msg.opcode;
    if (!_proxy.post(encodeCommand(msg))) {
        results.cancel(*slot, requestId);
        return CommandResult::failure(StorageError::IOError, "Async proxy is not running", msg.path);
    }

    auto result = results.wait(*slot, requestId, deadline);
    if (result.code() == StorageError::IOTimeout) {
        ORIGINVAULT_LOG_WARN_CAT("ProxyClient", std::string(toString(opcode)) + " request " +
                                 std::to_string(requestId) + " timed out after " +
                                 std::to_string(_timeout.count()) + "ms; outcome unknown");
    }
    return result;
}

bool ProxyClient::submitNoReply(CommandMessage msg) {
    msg.requestId = _proxy.nextRequestId();
    msg.slot = kNoReplySlot;
    return _proxy.post(encodeCommand(msg));
}

CommandResult ProxyClient::open(int32_t fd, const std::string& path, uint32_t flags) {
    CommandMessage msg;
    msg.opcode = Opcode::Open;
    msg.fd = fd;
    msg.path = path;
    msg.flags = flags;
    auto result = submit(std::move(msg));
    if (result.code() == StorageError::IOTimeout) {
        // The open may still land; queue a close so the descriptor does not leak a handle
        CommandMessage closeMsg;
        closeMsg.opcode = Opcode::Close;
        closeMsg.fd = fd;
        if (!submitNoReply(std::move(closeMsg))) {
            ORIGINVAULT_LOG_WARN_CAT("ProxyClient", "Could not queue close for timed-out open of " + path);
        }
    }
    return result;
}

CommandResult ProxyClient::close(int32_t fd) {
    CommandMessage msg;
    msg.opcode = Opcode::Close;
    msg.fd = fd;
    return submit(std::move(msg));
}

CommandResult ProxyClient::read(int32_t fd, std::span<std::byte> out, uint64_t offset) {
    const size_t chunk = _proxy.results().payloadCapacity();
    size_t done = 0;
    while (done < out.size()) {
        CommandMessage msg;
        msg.opcode = Opcode::Read;
        msg.fd = fd;
        msg.offset = offset + done;
        const size_t want = std::min(chunk, out.size() - done);
        msg.length = want;
        auto result = submit(std::move(msg));
        if (!result.ok()) return result;

        const size_t got = std::min(result.payload.size(), out.size() - done);
        if (got > 0) {
            std::memcpy(out.data() + done, result.payload.data(), got);
        }
        done += got;
        if (got < want) break;
    }
    CommandResult total;
    total.value = static_cast<int64_t>(done);
    return total;
}

CommandResult ProxyClient::write(int32_t fd, std::span<const std::byte> data, uint64_t offset) {
    const size_t chunk = _proxy.results().payloadCapacity();
    size_t done = 0;
    do {
        const size_t n = std::min(chunk, data.size() - done);
        CommandMessage msg;
        msg.opcode = Opcode::Write;
        msg.fd = fd;
        msg.offset = offset + done;
        msg.payload.assign(data.begin() + done, data.begin() + done + n);
        auto result = submit(std::move(msg));
        if (!result.ok()) return result;
        done += n;
    } while (done < data.size());

    CommandResult total;
    total.value = static_cast<int64_t>(done);
    return total;
}

CommandResult ProxyClient::truncate(int32_t fd, uint64_t size) {
    CommandMessage msg;
    msg.opcode = Opcode::Truncate;
    msg.fd = fd;
    msg.offset = size;
    return submit(std::move(msg));
}

CommandResult ProxyClient::sync(int32_t fd) {
    CommandMessage msg;
    msg.opcode = Opcode::Sync;
    msg.fd = fd;
    return submit(std::move(msg));
}

CommandResult ProxyClient::fileSize(int32_t fd) {
    CommandMessage msg;
    msg.opcode = Opcode::FileSize;
    msg.fd = fd;
    return submit(std::move(msg));
}

CommandResult ProxyClient::remove(const std::string& path) {
    CommandMessage msg;
    msg.opcode = Opcode::Delete;
    msg.path = path;
    return submit(std::move(msg));
}

} // namespace OriginVault::Core::Concurrency
