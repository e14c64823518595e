/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <thread>

#include "../CoreCommon.h"
#include "ConsoleSink.h"
#include "LogEntry.h"

namespace Ferry::Core::Logging {

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

Logger& Logger::global() {
    static Logger* instance = [] {
        auto* logger = new Logger();
        logger->addSink(std::make_shared<ConsoleSink>());
        return logger;
    }();
    return *instance;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();
    entry.level = level;
    entry.category.assign(category.data(), category.size());
    entry.message.assign(message.data(), message.size());

    // Snapshot sinks so a sink may log or mutate the sink list without deadlocking
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    for (auto& sink : sinks) {
        if (sink->accepts(level)) {
            sink->write(entry);
        }
    }
    if (level == LogLevel::Fatal) {
        for (auto& sink : sinks) sink->flush();
    }
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    return _sinks.size();
}

void Logger::configureFromEnvironment() {
    auto raw = safeGetEnv("FERRY_LOG_LEVEL");
    if (!raw) return;
    if (auto level = parseLogLevel(*raw)) {
        setMinLevel(*level);
    } else {
        log(LogLevel::Warning, "Logger", "Ignoring unrecognized FERRY_LOG_LEVEL value: " + *raw);
    }
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        sinks = _sinks;
    }
    for (auto& sink : sinks) sink->flush();
}

} // namespace Ferry::Core::Logging
