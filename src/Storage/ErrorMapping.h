/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <system_error>
#include "StorageTypes.h"

namespace Ferry::Core::Storage {

// Map errno to StorageError with platform-specific handling
StorageError mapErrnoToStorageError(int err) noexcept;

// Map a std::filesystem / system error code; non-errno categories become IOError
StorageError mapErrorCode(const std::error_code& ec) noexcept;

inline StorageErrorInfo makeSystemError(const std::error_code& ec, std::string message, std::string path) {
    return StorageErrorInfo{mapErrorCode(ec), std::move(message), std::move(path), ec};
}

} // namespace Ferry::Core::Storage
