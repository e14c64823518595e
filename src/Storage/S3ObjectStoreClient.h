/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file S3ObjectStoreClient.h
 * @brief IObjectStoreClient over an S3-compatible service (aws-sdk-cpp)
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include "IObjectStoreClient.h"

namespace Ferry::Core::Storage {

/**
 * @brief Bucket client speaking the S3 API
 *
 * Reads are ranged GETs pinned to the ETag seen at open, so an object is never
 * buffered whole and a concurrent overwrite surfaces as an IOError instead of
 * a spliced stream. Writes buffer up to partSize bytes; anything larger goes
 * through a multipart upload that is aborted unless committed.
 *
 * The SDK is initialized by the first client and shut down with the last one.
 * Streams and uploads keep it alive past their client.
 *
 * @code
 * S3ObjectStoreClient::Config config;
 * config.bucket = "backup";
 * config.region = "eu-west-1";
 * config.endpoint = "http://127.0.0.1:9000";   // MinIO, Ceph, ...
 * auto client = std::make_shared<S3ObjectStoreClient>(config);
 * @endcode
 */
class S3ObjectStoreClient : public IObjectStoreClient {
public:
    static constexpr uint64_t MinPartSize = 5ull * 1024 * 1024;
    static constexpr uint64_t DefaultReadChunk = 8ull * 1024 * 1024;

    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;                       ///< Empty for AWS; may carry an http:// or https:// scheme
        std::optional<std::string> accessKeyId;     ///< Both keys or neither; neither uses the default chain
        std::optional<std::string> secretAccessKey;
        bool useHttps = true;
        bool verifyTls = true;
        bool virtualAddressing = true;              ///< Path-style when false, as most self-hosted stores want
        uint64_t partSize = MinPartSize;
        uint64_t readChunk = DefaultReadChunk;
        long connectTimeoutMs = 10'000;
    };

    /// Host part of an endpoint plus the scheme it names, if any
    struct Endpoint {
        std::string host;
        std::optional<bool> https;
    };

    /// @throws ConfigurationError on an unusable config
    explicit S3ObjectStoreClient(Config config);
    ~S3ObjectStoreClient() override;

    S3ObjectStoreClient(const S3ObjectStoreClient&) = delete;
    S3ObjectStoreClient& operator=(const S3ObjectStoreClient&) = delete;

    StorageResult<ObjectListing> listObjects(const std::string& prefix,
                                             std::optional<char> delimiter) override;
    StorageResult<ObjectInfo> headObject(const std::string& key) override;
    StorageResult<std::unique_ptr<ByteSource>> getObject(const std::string& key) override;
    StorageResult<std::unique_ptr<IObjectUpload>> createUpload(const std::string& key,
                                                               bool ifNoneMatch) override;
    StorageStatus deleteObject(const std::string& key) override;
    std::string bucket() const override { return _config.bucket; }
    bool isRemote() const override { return true; }

    const Config& config() const { return _config; }

    /// Strips a scheme and trailing slashes from @p endpoint
    static Endpoint parseEndpoint(const std::string& endpoint);

    /**
     * @brief Maps an HTTP status from the service to a StorageError
     *
     * Zero or below stands for "no response at all" (connection, DNS, timeout).
     */
    static StorageError classifyHttpStatus(int status);

private:
    class Session;
    class Source;
    class Upload;

    Config _config;
    std::shared_ptr<Session> _session;
};

} // namespace Ferry::Core::Storage
