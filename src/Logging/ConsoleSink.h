/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

#include <mutex>

#include "ILogSink.h"

namespace Ferry::Core::Logging {

/**
 * @brief Writes entries to stdout, or stderr for Warning and above
 *
 * Line format: `2025-01-01 12:00:00.123 [INFO] [Category] message`
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColor = false) : _useColor(useColor) {}

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::mutex _mutex;
    bool _useColor;
};

} // namespace Ferry::Core::Logging
