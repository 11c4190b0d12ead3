/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once
#include <string>

namespace OriginVault::Core::IO {

/**
 * @brief Result of the one-time storage capability probe
 *
 * The probe runs on first call to StorageCapabilities::get() and is never repeated.
 * AsyncProxy and HandlePool refuse to start (CantOpen) when !available.
 */
struct StorageCapabilities {
    bool available = false;      ///< Synchronous access handles can be created at all
    bool exclusiveLocks = false; ///< A second handle on the same file is refused
    bool durableSync = false;    ///< flush() reaches stable storage
    std::string reason;          ///< Why the probe failed, empty when available

    static const StorageCapabilities& get();

    // Throws StorageException CantOpen with the probe's reason when storage is unavailable
    static void require(const char* component);
};

} // namespace OriginVault::Core::IO
