/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace Ferry::Core::Storage {

using ProviderId = std::string;

enum class EntryKind { File, Directory };

/**
 * Public error taxonomy surfaced by providers and the transfer engine.
 * Mapping guidelines:
 * - NotFound: path (or its parent, for creates) does not exist
 * - PermissionDenied: OS or backend refused access
 * - AlreadyExists: destination occupied; never resolved by overwriting
 * - NotEmpty: directory removal while children remain
 * - ProviderUnavailable: transient transport/auth/quota failure; the only retried error
 * - Unsupported: capability not offered by this backend (e.g. native move)
 * - ConfigurationError: provider construction rejected its options
 * - PartialTransfer: plan-level summary, at least one task failed
 * - Cancelled: caller aborted the operation
 * - DependencyFailed: task skipped because a prerequisite task failed
 * - InvalidPath: malformed path or wrong entry kind for the operation
 * - IOError: other local I/O failures
 */
enum class StorageError {
    None = 0,
    NotFound,
    PermissionDenied,
    AlreadyExists,
    NotEmpty,
    ProviderUnavailable,
    Unsupported,
    ConfigurationError,
    PartialTransfer,
    Cancelled,
    DependencyFailed,
    InvalidPath,
    IOError
};

std::string_view storageErrorToString(StorageError error) noexcept;

/**
 * @brief Only ProviderUnavailable is worth retrying without external action
 */
constexpr bool isTransient(StorageError error) noexcept {
    return error == StorageError::ProviderUnavailable;
}

struct StorageErrorInfo {
    StorageError code = StorageError::None;
    std::string message;
    std::string path;
    std::optional<std::error_code> systemError;

    std::string describe() const;
};

/**
 * @brief Thrown when a provider is constructed from invalid or incomplete options
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief One file or directory as listed by a provider
 *
 * Entries are value snapshots; they are re-fetched on every listing and carry no
 * reference back to the provider beyond its id.
 */
struct Entry {
    std::string path;                    ///< Absolute provider path, '/'-separated
    std::string name;                    ///< Final path segment
    EntryKind kind = EntryKind::File;
    std::optional<uint64_t> size;        ///< Absent for directories
    ProviderId providerId;
    std::optional<std::chrono::system_clock::time_point> lastModified;
    bool isSymlink = false;              ///< Listed as a leaf; never followed

    bool isDirectory() const noexcept { return kind == EntryKind::Directory; }
    bool isFile() const noexcept { return kind == EntryKind::File; }
};

/**
 * @brief Value-or-error result returned by provider operations
 *
 * Providers never throw for runtime conditions; they return a StorageResult whose
 * error() describes what went wrong.
 *
 * @code
 * auto listing = provider.list("/home/user");
 * if (!listing) {
 *     FERRY_LOG_WARNING(listing.error().describe());
 *     return;
 * }
 * for (const auto& e : listing.value()) { ... }
 * @endcode
 */
template<class T>
class StorageResult {
public:
    StorageResult(T value) : _value(std::move(value)) {}
    StorageResult(StorageErrorInfo error) : _error(std::move(error)) {
        if (_error.code == StorageError::None) _error.code = StorageError::IOError;
    }

    static StorageResult failure(StorageError code, std::string message, std::string path = {},
                                 std::optional<std::error_code> ec = std::nullopt) {
        return StorageResult(StorageErrorInfo{code, std::move(message), std::move(path), ec});
    }

    bool ok() const noexcept { return _value.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return *_value; }
    const T& value() const& { return *_value; }
    T&& value() && { return std::move(*_value); }

    const StorageErrorInfo& error() const noexcept { return _error; }
    StorageError code() const noexcept { return ok() ? StorageError::None : _error.code; }

private:
    std::optional<T> _value;
    StorageErrorInfo _error;
};

template<>
class StorageResult<void> {
public:
    StorageResult() = default;
    StorageResult(StorageErrorInfo error) : _error(std::move(error)) {}

    static StorageResult success() { return StorageResult(); }
    static StorageResult failure(StorageError code, std::string message, std::string path = {},
                                 std::optional<std::error_code> ec = std::nullopt) {
        return StorageResult(StorageErrorInfo{code, std::move(message), std::move(path), ec});
    }

    bool ok() const noexcept { return _error.code == StorageError::None; }
    explicit operator bool() const noexcept { return ok(); }

    const StorageErrorInfo& error() const noexcept { return _error; }
    StorageError code() const noexcept { return _error.code; }

private:
    StorageErrorInfo _error;
};

using StorageStatus = StorageResult<void>;

} // namespace Ferry::Core::Storage
