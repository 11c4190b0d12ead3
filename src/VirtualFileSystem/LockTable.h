/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file LockTable.h
 * @brief Rollback-journal lock levels shared by every connection of one VFS
 *
 * Levels follow SQLite's protocol: any number of SHARED holders; at most one RESERVED,
 * PENDING or EXCLUSIVE holder; a PENDING holder blocks new SHARED locks so that a writer
 * waiting for readers to drain is not starved. Escalating to EXCLUSIVE passes through
 * PENDING, and if other SHARED holders remain the caller is left at PENDING and gets Busy.
 *
 * The table never waits; a refused request returns false and the caller (SQLite's busy
 * handler) decides whether to retry.
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace OriginVault::Core::Vfs {

// Values match SQLITE_LOCK_*
enum class LockLevel : int {
    None = 0,
    Shared = 1,
    Reserved = 2,
    Pending = 3,
    Exclusive = 4
};

std::string_view toString(LockLevel level) noexcept;

class LockTable {
public:
    using Owner = const void*;

    /**
     * @brief Raises owner's lock on path to at least level
     * @return false when a conflicting holder exists (Busy); the owner may have been
     *         raised to PENDING on a failed EXCLUSIVE request
     */
    bool tryLock(const std::string& path, Owner owner, LockLevel level);

    // Lowers owner's lock to level (None or Shared); never raises
    void unlock(const std::string& path, Owner owner, LockLevel level);

    // True if any holder has RESERVED or higher
    bool checkReserved(const std::string& path) const;

    LockLevel levelOf(const std::string& path, Owner owner) const;
    size_t holderCount(const std::string& path) const;

private:
    using Holders = std::unordered_map<Owner, LockLevel>;

    static bool othersAtLeast(const Holders& holders, Owner self, LockLevel level);

    mutable std::mutex _mutex;
    std::unordered_map<std::string, Holders> _files;
};

} // namespace OriginVault::Core::Vfs
