/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file PoolRegistry.h
 * @brief Process-wide map from pool name to its single HandlePool instance
 *
 * install() is safe to call concurrently: the first caller for a name constructs the pool
 * and every other caller waits on the same shared future, so all of them receive the same
 * instance. A failed construction is remembered; later install() calls rethrow the very
 * same exception object until one passes forceReinitIfPreviouslyFailed.
 *
 * @code
 * HandlePool::Config cfg;
 * cfg.name = "app-pool";
 * cfg.root = dataDir;
 * auto pool = PoolRegistry::global().install(cfg);
 * sqlite3_open_v2("/main.db", &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, "app-pool");
 * @endcode
 */
#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "HandlePool.h"

namespace OriginVault::Core::Pool {

class PoolRegistry {
public:
    static PoolRegistry& global();

    /**
     * @brief Returns the pool for config.name, creating it on first use
     * @throws The exception that made the (possibly earlier) initialization fail
     */
    std::shared_ptr<HandlePool> install(const HandlePool::Config& config);

    // Live instance, or nullptr when absent or failed
    std::shared_ptr<HandlePool> find(const std::string& name) const;

    // Drops the entry (failed or live) without touching the pool
    void forget(const std::string& name);

private:
    struct Entry {
        std::shared_future<std::shared_ptr<HandlePool>> future;
        bool failed = false;
    };

    mutable std::mutex _mutex;
    std::unordered_map<std::string, Entry> _entries;
};

} // namespace OriginVault::Core::Pool
