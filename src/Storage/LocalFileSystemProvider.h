/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <filesystem>
#include "IStorageProvider.h"

namespace Ferry::Core::Storage {

/**
 * @brief Provider over the host filesystem, rooted at a directory
 *
 * Provider paths are resolved beneath the root after normalization, so ".."
 * can never reach outside it. Symbolic links are never followed: a link is
 * listed as a leaf entry, cannot be read or listed into, and a path that
 * passes through one is rejected with InvalidPath. Writes stream into a
 * hidden temporary sibling and are published without overwrite.
 */
class LocalFileSystemProvider : public IStorageProvider {
public:
    struct Config {
        std::filesystem::path root = "/";
        size_t maxConcurrency = 0;
    };

    /// @throws ConfigurationError if the root is not an existing directory
    explicit LocalFileSystemProvider(Config config);
    explicit LocalFileSystemProvider(std::filesystem::path root)
        : LocalFileSystemProvider(Config{std::move(root), 0}) {}
    ~LocalFileSystemProvider() override = default;

    StorageResult<std::vector<Entry>> list(const std::string& path) override;
    StorageResult<Entry> stat(const std::string& path) override;
    StorageResult<std::unique_ptr<ByteSource>> openRead(const std::string& path) override;
    StorageResult<Entry> write(const std::string& path,
                               ByteSource& source,
                               const Concurrency::CancellationToken& cancel,
                               const WriteOptions& options = {}) override;
    StorageStatus createDirectory(const std::string& path) override;
    StorageStatus remove(const std::string& path) override;
    StorageResult<Entry> nativeMove(const std::string& from, const std::string& to) override;

    ProviderCapabilities capabilities() const override;
    std::string providerType() const override { return "local"; }
    std::string resourceName() const override { return _root.string(); }

    const std::filesystem::path& root() const noexcept { return _root; }

    /// Host path for a provider path
    std::filesystem::path toNative(const std::string& path) const;

    /// True for the hidden staging files write() creates
    static bool isStagingName(const std::string& name);

private:
    /// InvalidPath if any directory above the final segment is a symbolic link
    StorageStatus checkLinkFreeAncestors(const std::string& logicalPath) const;
    StorageResult<Entry> entryFor(const std::string& logicalPath, const std::filesystem::path& native);
    StorageStatus publishNoOverwrite(const std::filesystem::path& staged,
                                     const std::filesystem::path& destination,
                                     const std::string& logicalPath);

    std::filesystem::path _root;
    Config _config;
};

} // namespace Ferry::Core::Storage
