/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

#include "ConsoleSink.h"
#include <cstdio>
#include <ctime>

namespace OriginVault::Core::Logging {

std::string ConsoleSink::formatEntry(const LogEntry& entry) {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(entry.timestamp);
    auto ms = duration_cast<milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm tmBuf{};
#if defined(_WIN32)
    localtime_s(&tmBuf, &t);
#else
    localtime_r(&t, &tmBuf);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmBuf);
    char msPart[8];
    std::snprintf(msPart, sizeof(msPart), ".%03d", static_cast<int>(ms));

    std::string out;
    out.reserve(entry.message.size() + entry.category.size() + 48);
    out += stamp;
    out += msPart;
    out += " [";
    out += toString(entry.level);
    out += "] ";
    if (!entry.category.empty()) {
        out += "[";
        out += entry.category;
        out += "] ";
    }
    out += entry.message;
    return out;
}

void ConsoleSink::write(const LogEntry& entry) {
    auto line = formatEntry(entry);
    FILE* stream = (_useStdErr && entry.level >= LogLevel::Warning) ? stderr : stdout;
    std::fprintf(stream, "%s\n", line.c_str());
}

void ConsoleSink::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

} // namespace OriginVault::Core::Logging
