/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "LockTable.h"

namespace OriginVault::Core::Vfs {

std::string_view toString(LockLevel level) noexcept {
    switch (level) {
        case LockLevel::None:      return "NONE";
        case LockLevel::Shared:    return "SHARED";
        case LockLevel::Reserved:  return "RESERVED";
        case LockLevel::Pending:   return "PENDING";
        case LockLevel::Exclusive: return "EXCLUSIVE";
    }
    return "UNKNOWN";
}

bool LockTable::othersAtLeast(const Holders& holders, Owner self, LockLevel level) {
    for (const auto& [owner, held] : holders) {
        if (owner != self && held >= level) return true;
    }
    return false;
}

bool LockTable::tryLock(const std::string& path, Owner owner, LockLevel level) {
    std::lock_guard<std::mutex> lock(_mutex);
    Holders& holders = _files[path];
    LockLevel current = LockLevel::None;
    if (auto it = holders.find(owner); it != holders.end()) current = it->second;

    if (level <= current) return true;
    if (level > LockLevel::Shared && current == LockLevel::None) {
        // SQLite always takes SHARED first
        if (holders.empty()) _files.erase(path);
        return false;
    }

    switch (level) {
        case LockLevel::None:
            return true;

        case LockLevel::Shared:
            if (othersAtLeast(holders, owner, LockLevel::Pending)) return false;
            holders[owner] = LockLevel::Shared;
            return true;

        case LockLevel::Reserved:
            if (othersAtLeast(holders, owner, LockLevel::Reserved)) return false;
            holders[owner] = LockLevel::Reserved;
            return true;

        case LockLevel::Pending:
        case LockLevel::Exclusive:
            if (current < LockLevel::Pending) {
                if (othersAtLeast(holders, owner, LockLevel::Reserved)) return false;
                holders[owner] = LockLevel::Pending;
            }
            if (level == LockLevel::Pending) return true;
            if (othersAtLeast(holders, owner, LockLevel::Shared)) return false;
            holders[owner] = LockLevel::Exclusive;
            return true;
    }
    return false;
}

void LockTable::unlock(const std::string& path, Owner owner, LockLevel level) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto file = _files.find(path);
    if (file == _files.end()) return;
    auto it = file->second.find(owner);
    if (it == file->second.end() || level >= it->second) return;

    if (level == LockLevel::None) {
        file->second.erase(it);
        if (file->second.empty()) _files.erase(file);
    } else {
        it->second = LockLevel::Shared;
    }
}

bool LockTable::checkReserved(const std::string& path) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto file = _files.find(path);
    if (file == _files.end()) return false;
    return othersAtLeast(file->second, nullptr, LockLevel::Reserved);
}

LockLevel LockTable::levelOf(const std::string& path, Owner owner) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto file = _files.find(path);
    if (file == _files.end()) return LockLevel::None;
    auto it = file->second.find(owner);
    return it == file->second.end() ? LockLevel::None : it->second;
}

size_t LockTable::holderCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto file = _files.find(path);
    return file == _files.end() ? 0 : file->second.size();
}

} // namespace OriginVault::Core::Vfs
