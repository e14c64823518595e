/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() starts with a single ConsoleSink at Info. Components log through
 * the FERRY_LOG_* macros; the non-category variants use the calling function name as
 * the category, the _CAT variants take an explicit one ("Executor", "Planner", ...).
 *
 * @code
 * FERRY_LOG_INFO_CAT("Executor", "Plan finished: " + std::to_string(done) + " done");
 * Logger::global().setMinLevel(LogLevel::Debug);
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

namespace Ferry::Core::Logging {

class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Process-wide instance used by the FERRY_LOG_* macros
     */
    static Logger& global();

    void log(LogLevel level, std::string_view category, std::string_view message);

    void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
    void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept { return level >= minLevel() && level != LogLevel::Off; }

    /**
     * @brief Applies FERRY_LOG_LEVEL if set; unrecognized values are reported and ignored
     */
    void configureFromEnvironment();

    void flush();

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace Ferry::Core::Logging

#define FERRY_LOG_AT(lvl, cat, msg)                                                        \
    do {                                                                                   \
        auto& ferryLogger_ = ::Ferry::Core::Logging::Logger::global();                     \
        if (ferryLogger_.isEnabled(lvl)) ferryLogger_.log((lvl), (cat), (msg));            \
    } while (0)

#define FERRY_LOG_TRACE(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Trace, __func__, msg)
#define FERRY_LOG_DEBUG(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Debug, __func__, msg)
#define FERRY_LOG_INFO(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Info, __func__, msg)
#define FERRY_LOG_WARNING(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Warning, __func__, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Error, __func__, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Fatal, __func__, msg)

#define FERRY_LOG_TRACE_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Trace, cat, msg)
#define FERRY_LOG_DEBUG_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Debug, cat, msg)
#define FERRY_LOG_INFO_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Info, cat, msg)
#define FERRY_LOG_WARNING_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Warning, cat, msg)
#define FERRY_LOG_ERROR_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Error, cat, msg)
#define FERRY_LOG_FATAL_CAT(cat, msg) FERRY_LOG_AT(::Ferry::Core::Logging::LogLevel::Fatal, cat, msg)
