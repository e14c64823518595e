/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "StorageTypes.h"

namespace Ferry::Core::Storage {

std::string_view storageErrorToString(StorageError error) noexcept {
    switch (error) {
        case StorageError::None:                return "None";
        case StorageError::NotFound:            return "NotFound";
        case StorageError::PermissionDenied:    return "PermissionDenied";
        case StorageError::AlreadyExists:       return "AlreadyExists";
        case StorageError::NotEmpty:            return "NotEmpty";
        case StorageError::ProviderUnavailable: return "ProviderUnavailable";
        case StorageError::Unsupported:         return "Unsupported";
        case StorageError::ConfigurationError:  return "ConfigurationError";
        case StorageError::PartialTransfer:     return "PartialTransfer";
        case StorageError::Cancelled:           return "Cancelled";
        case StorageError::DependencyFailed:    return "DependencyFailed";
        case StorageError::InvalidPath:         return "InvalidPath";
        case StorageError::IOError:             return "IOError";
    }
    return "Unknown";
}

std::string StorageErrorInfo::describe() const {
    std::string out(storageErrorToString(code));
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    if (!path.empty()) {
        out += " (";
        out += path;
        out += ")";
    }
    if (systemError) {
        out += " [";
        out += systemError->message();
        out += "]";
    }
    return out;
}

} // namespace Ferry::Core::Storage
