/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ConsoleSink.h"

#include <cstdio>
#include <ctime>
#include <string>

namespace Ferry::Core::Logging {

namespace {
    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:
            case LogLevel::Fatal:   return "\033[31m";
            default:                return "";
        }
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        auto secs = std::chrono::system_clock::to_time_t(tp);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &secs);
#else
        localtime_r(&secs, &tm);
#endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(millis));
        return out;
    }
}

void ConsoleSink::write(const LogEntry& entry) {
    FILE* stream = entry.level >= LogLevel::Warning ? stderr : stdout;
    std::string line = formatTimestamp(entry.timestamp);
    line += " [";
    line += logLevelToString(entry.level);
    line += "] [";
    line += entry.category;
    line += "] ";
    line += entry.message;

    std::lock_guard<std::mutex> lock(_mutex);
    if (_useColor) {
        std::fprintf(stream, "%s%s\033[0m\n", colorFor(entry.level), line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::fflush(stdout);
    std::fflush(stderr);
}

} // namespace Ferry::Core::Logging
