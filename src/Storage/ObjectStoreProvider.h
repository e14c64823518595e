/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <memory>
#include "IStorageProvider.h"
#include "IObjectStoreClient.h"

namespace Ferry::Core::Storage {

/**
 * @brief Provider presenting a flat bucket as a directory tree
 *
 * Path "/a/b.txt" maps to key "a/b.txt". A directory "/a" exists when the
 * zero-byte marker key "a/" exists or any key starts with "a/". Writes go
 * through conditional multipart uploads so nothing is visible or overwritten
 * until commit.
 *
 * Native move is not offered; the planner falls back to copy+delete.
 */
class ObjectStoreProvider : public IStorageProvider {
public:
    struct Config {
        std::string providerType = "bucket";
        size_t maxConcurrency = 0;
    };

    explicit ObjectStoreProvider(std::shared_ptr<IObjectStoreClient> client);
    ObjectStoreProvider(std::shared_ptr<IObjectStoreClient> client, Config config);
    ~ObjectStoreProvider() override = default;

    StorageResult<std::vector<Entry>> list(const std::string& path) override;
    StorageResult<Entry> stat(const std::string& path) override;
    StorageResult<std::unique_ptr<ByteSource>> openRead(const std::string& path) override;
    StorageResult<Entry> write(const std::string& path,
                               ByteSource& source,
                               const Concurrency::CancellationToken& cancel,
                               const WriteOptions& options = {}) override;
    StorageStatus createDirectory(const std::string& path) override;
    StorageStatus remove(const std::string& path) override;

    ProviderCapabilities capabilities() const override;
    std::string providerType() const override { return _config.providerType; }
    std::string resourceName() const override { return _client->bucket(); }

    IObjectStoreClient& client() noexcept { return *_client; }

    static std::string keyFor(const std::string& path);
    static std::string directoryPrefix(const std::string& path);

private:
    Entry makeFileEntry(const std::string& path, const ObjectInfo& info) const;
    Entry makeDirectoryEntry(const std::string& path) const;
    StorageStatus keepParentDirectory(const std::string& path);

    std::shared_ptr<IObjectStoreClient> _client;
    Config _config;
};

} // namespace Ferry::Core::Storage
