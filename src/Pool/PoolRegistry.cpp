/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "PoolRegistry.h"
#include "../Logging/Logger.h"
#include <chrono>

namespace OriginVault::Core::Pool {

PoolRegistry& PoolRegistry::global() {
    static PoolRegistry instance;
    return instance;
}

std::shared_ptr<HandlePool> PoolRegistry::install(const HandlePool::Config& config) {
    std::promise<std::shared_ptr<HandlePool>> promise;
    std::shared_future<std::shared_ptr<HandlePool>> future;
    bool builder = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _entries.find(config.name);
        if (it != _entries.end() && it->second.failed && config.forceReinitIfPreviouslyFailed) {
            ORIGINVAULT_LOG_INFO_CAT("PoolRegistry", "Retrying previously failed pool " + config.name);
            _entries.erase(it);
            it = _entries.end();
        }
        if (it == _entries.end()) {
            future = promise.get_future().share();
            _entries[config.name] = Entry{future, false};
            builder = true;
        } else {
            future = it->second.future;
        }
    }

    if (builder) {
        try {
            auto pool = std::make_shared<HandlePool>(config);
            pool->setRemovalCallback([this](const std::string& name) { forget(name); });
            promise.set_value(std::move(pool));
        } catch (...) {
            // The failure is cached for every waiter and later caller
            {
                std::lock_guard<std::mutex> lock(_mutex);
                auto it = _entries.find(config.name);
                if (it != _entries.end()) it->second.failed = true;
            }
            ORIGINVAULT_LOG_ERROR_CAT("PoolRegistry", "Initialization of pool " + config.name + " failed");
            promise.set_exception(std::current_exception());
        }
    }
    return future.get();
}

std::shared_ptr<HandlePool> PoolRegistry::find(const std::string& name) const {
    std::shared_future<std::shared_ptr<HandlePool>> future;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _entries.find(name);
        if (it == _entries.end() || it->second.failed) return nullptr;
        future = it->second.future;
    }
    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return nullptr;
    try {
        return future.get();
    } catch (const std::exception& e) {
        // Failed between the lookup and here
        ORIGINVAULT_LOG_DEBUG_CAT("PoolRegistry", "Pool " + name + " is in a failed state: " + e.what());
        return nullptr;
    }
}

void PoolRegistry::forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(_mutex);
    _entries.erase(name);
}

} // namespace OriginVault::Core::Pool
