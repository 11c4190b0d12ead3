/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#pragma once

#include "ILogSink.h"

namespace OriginVault::Core::Logging {

/**
 * @brief Writes entries to stdout, or stderr for Warning and above
 *
 * Format: `2025-01-01 12:00:00.123 [WARN] [HandlePool] message`
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useStdErrForWarnings = true) : _useStdErr(useStdErrForWarnings) {}

    void write(const LogEntry& entry) override;
    void flush() override;

    static std::string formatEntry(const LogEntry& entry);

private:
    bool _useStdErr;
};

} // namespace OriginVault::Core::Logging
