/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "StorageCapabilities.h"
#include "OriginDirectory.h"
#include "../Logging/Logger.h"
#include <array>
#include <mutex>

namespace OriginVault::Core::IO {

namespace {
    StorageCapabilities probe() {
        StorageCapabilities caps;
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            caps.reason = "No temporary directory: " + ec.message();
            return caps;
        }
        auto file = dir / ("originvault_probe_" + OriginDirectory::randomFilename(12));

        try {
            auto handle = SyncAccessHandle::open(file, true);
            const std::array<std::byte, 4> bytes{std::byte{'O'}, std::byte{'V'}, std::byte{'C'}, std::byte{'P'}};
            handle->write(bytes, 0);
            std::array<std::byte, 4> back{};
            caps.available = handle->read(back, 0) == back.size() && back == bytes;
            if (!caps.available) caps.reason = "Probe read-back mismatch";

            try {
                handle->flush();
                caps.durableSync = true;
            } catch (const StorageException& e) {
                ORIGINVAULT_LOG_WARN_CAT("Capabilities", std::string("flush unsupported: ") + e.what());
            }

            try {
                auto second = SyncAccessHandle::open(file, false);
                second->close();
            } catch (const StorageException& e) {
                caps.exclusiveLocks = e.code() == StorageError::Busy;
            }
            handle->close();
        } catch (const StorageException& e) {
            caps.available = false;
            caps.reason = e.what();
        }

        std::filesystem::remove(file, ec);
        return caps;
    }
}

const StorageCapabilities& StorageCapabilities::get() {
    static std::once_flag once;
    static StorageCapabilities caps;
    std::call_once(once, [] {
        caps = probe();
        if (caps.available) {
            ORIGINVAULT_LOG_DEBUG_CAT("Capabilities", std::string("Storage available; exclusiveLocks=") +
                                      (caps.exclusiveLocks ? "yes" : "no") + " durableSync=" +
                                      (caps.durableSync ? "yes" : "no"));
        } else {
            ORIGINVAULT_LOG_ERROR_CAT("Capabilities", "Storage unavailable: " + caps.reason);
        }
    });
    return caps;
}

void StorageCapabilities::require(const char* component) {
    const auto& caps = get();
    if (!caps.available) {
        throw StorageException(StorageError::CantOpen,
                               std::string(component) + " requires synchronous storage: " + caps.reason);
    }
}

} // namespace OriginVault::Core::IO
