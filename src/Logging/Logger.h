/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the OriginVault Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() is created on first use with a ConsoleSink attached. Its minimum
 * level defaults to Info and can be overridden with the ORIGINVAULT_LOG_LEVEL environment
 * variable (trace, debug, info, warn, error, fatal).
 *
 * @code
 * ORIGINVAULT_LOG_INFO("Proxy started");
 * ORIGINVAULT_LOG_WARN_CAT("HandlePool", "Discarding slot with bad digest: " + file);
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "ILogSink.h"
#include "LogLevel.h"

namespace OriginVault::Core::Logging {

class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& global();

    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    void addSink(std::shared_ptr<ILogSink> sink);
    bool removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    void flush();

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept { return level >= minLevel(); }

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace OriginVault::Core::Logging

#define ORIGINVAULT_LOG_AT(level, category, message)                                              \
    do {                                                                                          \
        auto& _ovLogger = ::OriginVault::Core::Logging::Logger::global();                         \
        if (_ovLogger.isEnabled(level)) _ovLogger.log((level), (category), (message));            \
    } while (0)

#define ORIGINVAULT_LOG_TRACE_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Trace, cat, msg)
#define ORIGINVAULT_LOG_DEBUG_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Debug, cat, msg)
#define ORIGINVAULT_LOG_INFO_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Info, cat, msg)
#define ORIGINVAULT_LOG_WARN_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Warning, cat, msg)
#define ORIGINVAULT_LOG_ERROR_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Error, cat, msg)
#define ORIGINVAULT_LOG_FATAL_CAT(cat, msg) ORIGINVAULT_LOG_AT(::OriginVault::Core::Logging::LogLevel::Fatal, cat, msg)

// Non-category variants use the enclosing function name as the category
#define ORIGINVAULT_LOG_TRACE(msg) ORIGINVAULT_LOG_TRACE_CAT(__func__, msg)
#define ORIGINVAULT_LOG_DEBUG(msg) ORIGINVAULT_LOG_DEBUG_CAT(__func__, msg)
#define ORIGINVAULT_LOG_INFO(msg) ORIGINVAULT_LOG_INFO_CAT(__func__, msg)
#define ORIGINVAULT_LOG_WARN(msg) ORIGINVAULT_LOG_WARN_CAT(__func__, msg)
#define ORIGINVAULT_LOG_ERROR(msg) ORIGINVAULT_LOG_ERROR_CAT(__func__, msg)
#define ORIGINVAULT_LOG_FATAL(msg) ORIGINVAULT_LOG_FATAL_CAT(__func__, msg)
