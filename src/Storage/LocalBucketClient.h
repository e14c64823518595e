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
#include <mutex>
#include "IObjectStoreClient.h"

namespace Ferry::Core::Storage {

/**
 * @brief Bucket persisted in a local directory
 *
 * Layout under <root>/<bucket>:
 * - each '/'-separated key segment before the last is a directory named by the
 *   escaped segment plus "~"; the last segment names the object file
 * - segments are percent-escaped, and an empty segment is stored as "%"
 * - .uploads/ holding staged multipart bodies until commit links them in
 *
 * Escaping never produces '~' or a lone '%', so "a" and "a/b" can coexist.
 * Directories left empty by a delete are pruned. Each escaped segment is still
 * bound by the host's file name limit (255 bytes on most filesystems).
 *
 * Useful as a durable object store for tests and offline use; it has the same
 * flat-key semantics as a remote bucket.
 */
class LocalBucketClient : public IObjectStoreClient {
public:
    /// @throws ConfigurationError if the bucket directory cannot be created
    LocalBucketClient(std::filesystem::path root, std::string bucket);

    StorageResult<ObjectListing> listObjects(const std::string& prefix,
                                             std::optional<char> delimiter) override;
    StorageResult<ObjectInfo> headObject(const std::string& key) override;
    StorageResult<std::unique_ptr<ByteSource>> getObject(const std::string& key) override;
    StorageResult<std::unique_ptr<IObjectUpload>> createUpload(const std::string& key,
                                                               bool ifNoneMatch) override;
    StorageStatus deleteObject(const std::string& key) override;
    std::string bucket() const override { return _bucket; }

    const std::filesystem::path& bucketDirectory() const noexcept { return _bucketDir; }
    std::filesystem::path uploadsDirectory() const { return _bucketDir / ".uploads"; }

    /// Host file holding @p key
    std::filesystem::path objectPath(const std::string& key) const;

    static std::string escapeSegment(const std::string& segment);
    static std::optional<std::string> unescapeSegment(const std::string& name);

private:
    class Upload;

    void pruneEmptyDirectories(std::filesystem::path directory);

    std::string _bucket;
    std::filesystem::path _bucketDir;
    std::mutex _layoutMutex;   ///< Orders directory creation on commit against pruning on delete
};

} // namespace Ferry::Core::Storage
