/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once
#include <atomic>
#include <string>
#include <string_view>
#include <thread>
#include "StorageError.h"

namespace OriginVault::Core::IO {

/**
 * @brief Records which execution context owns a piece of synchronous storage
 *
 * An unbound affinity admits every caller; that mode is used by owners that confine
 * access with their own lock (the handle pool). Once bound, only the binding thread
 * passes require().
 */
class ContextAffinity {
public:
    ContextAffinity() = default;

    void bindToCurrentThread() noexcept { _owner.store(std::this_thread::get_id(), std::memory_order_release); }
    void unbind() noexcept { _owner.store(std::thread::id{}, std::memory_order_release); }

    bool isBound() const noexcept { return _owner.load(std::memory_order_acquire) != std::thread::id{}; }

    bool isCurrent() const noexcept {
        auto owner = _owner.load(std::memory_order_acquire);
        return owner == std::thread::id{} || owner == std::this_thread::get_id();
    }

    // Throws StorageError::WrongContext when called off the owning context
    void require(std::string_view operation) const {
        if (!isCurrent()) {
            throw StorageException(StorageError::WrongContext,
                                   std::string(operation) + " called outside the context that owns the storage root");
        }
    }

private:
    std::atomic<std::thread::id> _owner{};
};

} // namespace OriginVault::Core::IO
