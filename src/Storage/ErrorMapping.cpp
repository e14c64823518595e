/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ErrorMapping.h"
#include <cerrno>

namespace Ferry::Core::Storage {

StorageError mapErrnoToStorageError(int err) noexcept {
    switch (err) {
        case 0:
            return StorageError::None;
        case ENOENT:
        case ENOTDIR:
            return StorageError::NotFound;
        case EACCES:
        case EPERM:
#if defined(__unix__) || defined(__APPLE__)
        case EROFS:
#endif
            return StorageError::PermissionDenied;
        case EEXIST:
            return StorageError::AlreadyExists;
        case ENOTEMPTY:
            return StorageError::NotEmpty;
        case EINVAL:
        case ENAMETOOLONG:
        case EISDIR:
            return StorageError::InvalidPath;
        case EXDEV:
            return StorageError::Unsupported;
#if defined(__unix__) || defined(__APPLE__)
        case EDQUOT:  // Quota exceeded; may clear without intervention
        case ENETUNREACH:
        case ENETDOWN:
        case ETIMEDOUT:
        case ECONNRESET:
        case EAGAIN:
        case EBUSY:
            return StorageError::ProviderUnavailable;
#endif
        default:
            return StorageError::IOError;
    }
}

StorageError mapErrorCode(const std::error_code& ec) noexcept {
    if (!ec) return StorageError::None;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return mapErrnoToStorageError(ec.value());
    }
    return StorageError::IOError;
}

} // namespace Ferry::Core::Storage
