/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once

#include "LogEntry.h"

namespace OriginVault::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are invoked under the Logger's dispatch lock, so implementations do not need
 * their own synchronization for write(). They must not log from inside write().
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}

    // Per-sink filter applied after the Logger's global minimum level
    void setMinLevel(LogLevel level) noexcept { _minLevel = level; }
    LogLevel minLevel() const noexcept { return _minLevel; }

private:
    LogLevel _minLevel = LogLevel::Trace;
};

} // namespace OriginVault::Core::Logging
