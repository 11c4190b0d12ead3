/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file ProxyClient.h
 * @brief Driving-side client that turns calls into proxied command round trips
 *
 * Every call claims a result slot, posts a CommandMessage naming it, and blocks until the
 * proxy publishes or the timeout passes. A timeout returns IOTimeout; the command may
 * still take effect later (see AsyncProxy::Config::lateResultPolicy), so treat it as an
 * unknown outcome. The descriptor stays usable for later calls.
 *
 * Reads and writes larger than one result slot are split into several commands.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include "AsyncProxy.h"

namespace OriginVault::Core::Concurrency {

class ProxyClient {
public:
    explicit ProxyClient(AsyncProxy& proxy, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Sends one command and waits for its result
    CommandResult submit(CommandMessage msg);

    // Posts a command without waiting; returns false if the proxy is not accepting commands
    bool submitNoReply(CommandMessage msg);

    int32_t allocateDescriptor() { return _proxy.nextDescriptor(); }

    CommandResult open(int32_t fd, const std::string& path, uint32_t flags);
    CommandResult close(int32_t fd);
    // value = total bytes read; fewer than out.size() only at end of file
    CommandResult read(int32_t fd, std::span<std::byte> out, uint64_t offset);
    CommandResult write(int32_t fd, std::span<const std::byte> data, uint64_t offset);
    CommandResult truncate(int32_t fd, uint64_t size);
    CommandResult sync(int32_t fd);
    CommandResult fileSize(int32_t fd);
    CommandResult remove(const std::string& path);

    void setTimeout(std::chrono::milliseconds timeout) noexcept { _timeout = timeout; }
    std::chrono::milliseconds timeout() const noexcept { return _timeout; }

    AsyncProxy& proxy() noexcept { return _proxy; }

private:
    AsyncProxy& _proxy;
    std::chrono::milliseconds _timeout;
};

} // namespace OriginVault::Core::Concurrency
