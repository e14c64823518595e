/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file IStorageProvider.h
 * @brief Backend interface for file-like storage
 *
 * Implementations expose a uniform capability set (list, stat, read, write,
 * mkdir, remove, optional native move) over a local filesystem, an object store
 * or anything else that can be presented as a tree of files and directories.
 * Panes and the transfer engine only ever talk to this interface.
 */
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "StorageTypes.h"
#include "ByteStream.h"
#include "../Concurrency/CancellationToken.h"

namespace Ferry::Core::Storage {

/**
 * @brief Capabilities advertised by a provider
 * @note The planner emits NativeMove tasks only when supportsNativeMove is set;
 *       the executor bounds in-flight tasks by maxConcurrency (0 = unlimited).
 */
struct ProviderCapabilities {
    bool supportsNativeMove = false;
    bool isRemote = false;
    size_t maxConcurrency = 0;
};

/**
 * @brief Options controlling streamed writes
 * @param chunkSize Preferred chunk size in bytes
 * @param progressCallback Optional callback receiving the running byte total
 */
struct WriteOptions {
    size_t chunkSize = 256 * 1024;
    std::function<void(uint64_t written)> progressCallback;
};

class IStorageProvider {
public:
    virtual ~IStorageProvider() = default;

    /**
     * @brief Lists the immediate children of a directory
     * @param path Absolute provider path of the directory
     * @return Complete snapshot in the backend's natural order
     */
    virtual StorageResult<std::vector<Entry>> list(const std::string& path) = 0;

    /**
     * @brief Refreshes a single entry
     * @return The entry, or NotFound
     */
    virtual StorageResult<Entry> stat(const std::string& path) = 0;

    /**
     * @brief Opens a file for streaming
     *
     * The returned source is finite, forward-only and not restartable. It never
     * buffers the whole object.
     */
    virtual StorageResult<std::unique_ptr<ByteSource>> openRead(const std::string& path) = 0;

    /**
     * @brief Creates a file from a stream
     * @param path Destination path; its parent must be an existing directory
     * @param source Stream consumed completely on success
     * @param cancel Checked between chunks
     * @param options Chunking and progress
     * @return The new entry
     *
     * @note Never overwrites: an occupied destination fails with AlreadyExists.
     * @note On any failure, cancellation included, no partial destination remains.
     */
    virtual StorageResult<Entry> write(const std::string& path,
                                       ByteSource& source,
                                       const Concurrency::CancellationToken& cancel,
                                       const WriteOptions& options = {}) = 0;

    /**
     * @brief Creates a directory whose parent exists
     * @note Succeeds if a directory is already present; AlreadyExists if a file is.
     */
    virtual StorageStatus createDirectory(const std::string& path) = 0;

    /**
     * @brief Removes a file or an empty directory
     * @note A directory with children fails with NotEmpty.
     */
    virtual StorageStatus remove(const std::string& path) = 0;

    /**
     * @brief Atomically relocates an entry within this provider
     *
     * Optional capability. The default reports Unsupported; providers that
     * override it must also set ProviderCapabilities::supportsNativeMove.
     */
    virtual StorageResult<Entry> nativeMove(const std::string& from, const std::string& to) {
        (void)to;
        return StorageResult<Entry>::failure(StorageError::Unsupported,
                                             "Native move not supported by " + providerType(), from);
    }

    virtual ProviderCapabilities capabilities() const = 0;

    /// Short backend tag used in pane titles ("local", "bucket", "memory")
    virtual std::string providerType() const = 0;

    /// Resource the provider is bound to (root directory, bucket name)
    virtual std::string resourceName() const = 0;

    bool exists(const std::string& path) { return stat(path).ok(); }

    // Assigned by ProviderRegistry; stamped onto every Entry this provider returns
    const ProviderId& id() const noexcept { return _id; }
    void setId(ProviderId id) { _id = std::move(id); }

protected:
    ProviderId _id;
};

} // namespace Ferry::Core::Storage
