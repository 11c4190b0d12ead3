/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file DirectoryClient.h
 * @brief Directory utilities for driving threads, executed by the async proxy
 *
 * Mirrors the in-context OriginDirectory helpers, but each call is a command round trip.
 * Failures throw StorageException with the code the proxy reported (IOTimeout included).
 *
 * @code
 * DirectoryClient dirs(proxy);
 * dirs.mkdir("/a/b/c");
 * dirs.traverse({.root = "/", .recursive = true, .visitor = [](const DirectoryEntry& e, size_t depth) {
 *     return depth < 2;
 * }});
 * dirs.unlink("/a", true);
 * @endcode
 */
#pragma once

#include <string>
#include <vector>
#include "ProxyClient.h"

namespace OriginVault::Core::Concurrency {

class DirectoryClient {
public:
    explicit DirectoryClient(AsyncProxy& proxy, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool entryExists(const std::string& path);
    // True if the directory was created or already exists
    bool mkdir(const std::string& path);
    // False if nothing was deleted
    bool unlink(const std::string& path, bool recursive = false);
    std::vector<IO::DirectoryEntry> listEntries(const std::string& path);
    void traverse(const IO::TraverseOptions& options);

private:
    int64_t valueOrThrow(CommandMessage msg);
    bool walk(const std::string& dir, size_t depth, const IO::TraverseOptions& options);

    ProxyClient _client;
};

} // namespace OriginVault::Core::Concurrency
