/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

#include "LogEntry.h"

namespace Ferry::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are invoked from whichever thread logged. Implementations must be
 * thread-safe; the Logger does not serialize calls into a sink.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}

    void setMinLevel(LogLevel level) noexcept { _minLevel = level; }
    LogLevel minLevel() const noexcept { return _minLevel; }
    bool accepts(LogLevel level) const noexcept { return level >= _minLevel; }

private:
    LogLevel _minLevel = LogLevel::Trace;
};

} // namespace Ferry::Core::Logging
