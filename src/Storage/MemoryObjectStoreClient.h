/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <map>
#include <mutex>
#include "IObjectStoreClient.h"

namespace Ferry::Core::Storage {

/**
 * @brief In-process bucket
 *
 * Objects are immutable byte buffers shared with open readers, so a delete or
 * replace never disturbs a stream already in flight.
 */
class MemoryObjectStoreClient : public IObjectStoreClient {
public:
    explicit MemoryObjectStoreClient(std::string bucket);

    StorageResult<ObjectListing> listObjects(const std::string& prefix,
                                             std::optional<char> delimiter) override;
    StorageResult<ObjectInfo> headObject(const std::string& key) override;
    StorageResult<std::unique_ptr<ByteSource>> getObject(const std::string& key) override;
    StorageResult<std::unique_ptr<IObjectUpload>> createUpload(const std::string& key,
                                                               bool ifNoneMatch) override;
    StorageStatus deleteObject(const std::string& key) override;
    std::string bucket() const override { return _bucket; }

    // Direct seeding for tests and fixtures
    void putObject(const std::string& key, std::string_view body);
    size_t objectCount() const;

private:
    class Upload;

    struct StoredObject {
        std::shared_ptr<const std::vector<std::byte>> data;
        std::chrono::system_clock::time_point lastModified;
    };

    StorageResult<ObjectInfo> commitUpload(const std::string& key,
                                           std::vector<std::byte> data,
                                           bool ifNoneMatch);

    std::string _bucket;
    mutable std::mutex _mutex;
    std::map<std::string, StoredObject> _objects;
};

} // namespace Ferry::Core::Storage
