/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "S3ObjectStoreClient.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <cstring>
#include <mutex>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/CoreErrors.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3EndpointProvider.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

namespace Ferry::Core::Storage {

namespace {
    constexpr const char* LogCategory = "S3ObjectStoreClient";
    constexpr const char* AllocationTag = "FerryS3";
    constexpr size_t MaxParts = 10000;

    std::string toStd(const Aws::String& text) {
        return std::string(text.c_str(), text.size());
    }

    Aws::String toAws(const std::string& text) {
        return Aws::String(text.c_str(), text.size());
    }

    std::optional<std::chrono::system_clock::time_point> toTimePoint(const Aws::Utils::DateTime& time) {
        if (!time.WasParseSuccessful()) return std::nullopt;
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(time.Millis()));
    }

    std::shared_ptr<Aws::IOStream> makeBody(const std::byte* data, size_t size) {
        auto body = Aws::MakeShared<Aws::StringStream>(AllocationTag);
        body->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        return body;
    }

    /**
     * One SDK initialization shared by every client, stream and upload.
     * InitAPI and ShutdownAPI must not overlap, so the count sits under a mutex.
     */
    class SdkReference {
    public:
        SdkReference() {
            std::lock_guard<std::mutex> lock(mutex());
            if (count()++ == 0) {
                FERRY_LOG_DEBUG_CAT(LogCategory, "Initializing AWS SDK");
                Aws::InitAPI(options());
            }
        }

        ~SdkReference() {
            std::lock_guard<std::mutex> lock(mutex());
            if (--count() == 0) {
                FERRY_LOG_DEBUG_CAT(LogCategory, "Shutting down AWS SDK");
                Aws::ShutdownAPI(options());
            }
        }

        SdkReference(const SdkReference&) = delete;
        SdkReference& operator=(const SdkReference&) = delete;

    private:
        static std::mutex& mutex() {
            static std::mutex instance;
            return instance;
        }
        static size_t& count() {
            static size_t instance = 0;
            return instance;
        }
        static Aws::SDKOptions& options() {
            static Aws::SDKOptions instance;
            return instance;
        }
    };

    template<typename Errors>
    StorageErrorInfo toStorageError(const Aws::Client::AWSError<Errors>& err,
                                    const std::string& operation,
                                    const std::string& key) {
        using Aws::Client::CoreErrors;

        StorageError code = S3ObjectStoreClient::classifyHttpStatus(static_cast<int>(err.GetResponseCode()));
        const int errType = static_cast<int>(err.GetErrorType());
        if (errType == static_cast<int>(CoreErrors::NETWORK_CONNECTION) ||
            errType == static_cast<int>(CoreErrors::ENDPOINT_RESOLUTION_FAILURE) ||
            errType == static_cast<int>(CoreErrors::REQUEST_TIMEOUT) ||
            errType == static_cast<int>(CoreErrors::SLOW_DOWN) ||
            errType == static_cast<int>(CoreErrors::THROTTLING)) {
            code = StorageError::ProviderUnavailable;
        } else if (errType == static_cast<int>(CoreErrors::ACCESS_DENIED) ||
                   errType == static_cast<int>(CoreErrors::INVALID_ACCESS_KEY_ID) ||
                   errType == static_cast<int>(CoreErrors::INVALID_SIGNATURE) ||
                   errType == static_cast<int>(CoreErrors::SIGNATURE_DOES_NOT_MATCH) ||
                   errType == static_cast<int>(CoreErrors::UNRECOGNIZED_CLIENT)) {
            code = StorageError::PermissionDenied;
        } else if (errType == static_cast<int>(CoreErrors::USER_CANCELLED)) {
            code = StorageError::Cancelled;
        } else if (code == StorageError::IOError && err.ShouldRetry()) {
            code = StorageError::ProviderUnavailable;
        }

        std::string message = operation + " failed";
        if (!err.GetExceptionName().empty()) message += ": " + toStd(err.GetExceptionName());
        if (!err.GetMessage().empty()) message += " (" + toStd(err.GetMessage()) + ")";
        return StorageErrorInfo{code, std::move(message), key, std::nullopt};
    }

    Aws::Client::ClientConfiguration makeClientConfig(const S3ObjectStoreClient::Config& config) {
        Aws::Client::ClientConfiguration cfg;
        cfg.region = toAws(config.region);
        cfg.scheme = config.useHttps ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
        cfg.verifySSL = config.verifyTls;

        if (!config.endpoint.empty()) {
            auto endpoint = S3ObjectStoreClient::parseEndpoint(config.endpoint);
            if (endpoint.https) {
                cfg.scheme = *endpoint.https ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
            }
            cfg.endpointOverride = toAws(endpoint.host);
        }

        cfg.connectTimeoutMs = config.connectTimeoutMs;
        // TransferExecutor owns retries and backoff
        cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(AllocationTag, 0);
        return cfg;
    }
}

class S3ObjectStoreClient::Session {
public:
    explicit Session(const Config& config) : _bucket(toAws(config.bucket)) {
        Aws::S3::S3ClientConfiguration s3cfg(makeClientConfig(config),
                                             Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                             config.virtualAddressing,
                                             Aws::S3::US_EAST_1_REGIONAL_ENDPOINT_OPTION::NOT_SET);
        if (config.accessKeyId && config.secretAccessKey) {
            Aws::Auth::AWSCredentials credentials(toAws(*config.accessKeyId), toAws(*config.secretAccessKey));
            _client = std::make_unique<Aws::S3::S3Client>(
                credentials, Aws::MakeShared<Aws::S3::Endpoint::S3EndpointProvider>(AllocationTag), s3cfg);
        } else {
            _client = std::make_unique<Aws::S3::S3Client>(s3cfg);
        }
    }

    ~Session() {
        // The client must go before the SDK reference shuts the SDK down
        _client.reset();
    }

    Aws::S3::S3Client& client() { return *_client; }
    const Aws::String& bucket() const { return _bucket; }

private:
    SdkReference _sdk;
    Aws::String _bucket;
    std::unique_ptr<Aws::S3::S3Client> _client;
};

// Ranged reads pinned to one ETag
class S3ObjectStoreClient::Source : public ByteSource {
public:
    Source(std::shared_ptr<Session> session, std::string key, Aws::String etag, uint64_t size, uint64_t chunk)
        : _session(std::move(session)), _key(std::move(key)), _etag(std::move(etag)), _size(size),
          _chunk(chunk) {}

    IoResult read(std::span<std::byte> buffer) override {
        IoResult result;
        if (_position >= _buffer.size()) {
            if (_offset >= _size) {
                result.complete = true;
                return result;
            }
            auto fetched = fetch();
            if (!fetched) {
                result.error = fetched.error();
                return result;
            }
        }

        size_t count = std::min(buffer.size(), _buffer.size() - _position);
        std::memcpy(buffer.data(), _buffer.data() + _position, count);
        _position += count;
        result.bytesTransferred = count;
        result.complete = eof();
        return result;
    }

    bool eof() const override { return _offset >= _size && _position >= _buffer.size(); }
    std::optional<uint64_t> sizeHint() const override { return _size; }
    std::string path() const override { return _key; }

private:
    StorageStatus fetch() {
        const uint64_t length = std::min(_chunk, _size - _offset);
        Aws::S3::Model::GetObjectRequest request;
        request.SetBucket(_session->bucket());
        request.SetKey(toAws(_key));
        request.SetRange(toAws("bytes=" + std::to_string(_offset) + "-" + std::to_string(_offset + length - 1)));
        if (!_etag.empty()) request.SetIfMatch(_etag);

        auto outcome = _session->client().GetObject(request);
        if (!outcome.IsSuccess()) {
            const auto& err = outcome.GetError();
            if (err.GetResponseCode() == Aws::Http::HttpResponseCode::PRECONDITION_FAILED) {
                return StorageStatus::failure(StorageError::IOError, "Object changed while it was being read", _key);
            }
            return StorageStatus(toStorageError(err, "GetObject", _key));
        }

        auto object = outcome.GetResultWithOwnership();
        auto& body = object.GetBody();
        _buffer.resize(static_cast<size_t>(length));
        body.read(reinterpret_cast<char*>(_buffer.data()), static_cast<std::streamsize>(length));
        const auto received = static_cast<uint64_t>(body.gcount());
        if (received != length) {
            _buffer.clear();
            _position = 0;
            return StorageStatus::failure(StorageError::ProviderUnavailable,
                                          "Short read: got " + std::to_string(received) + " of " +
                                              std::to_string(length) + " bytes",
                                          _key);
        }
        _offset += received;
        _position = 0;
        return StorageStatus::success();
    }

    std::shared_ptr<Session> _session;
    std::string _key;
    Aws::String _etag;
    uint64_t _size;
    uint64_t _chunk;
    uint64_t _offset = 0;
    std::vector<std::byte> _buffer;
    size_t _position = 0;
};

/**
 * Small objects go out as one PutObject at commit. Once the buffer reaches
 * partSize the upload turns multipart and flushes the whole buffer as a part.
 */
class S3ObjectStoreClient::Upload : public IObjectUpload {
public:
    Upload(std::shared_ptr<Session> session, std::string key, bool ifNoneMatch, uint64_t partSize)
        : _session(std::move(session)), _key(std::move(key)), _ifNoneMatch(ifNoneMatch), _partSize(partSize) {}

    ~Upload() override { abort(); }

    StorageStatus appendPart(std::span<const std::byte> data) override {
        if (_finished) {
            return StorageStatus::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }
        _buffer.insert(_buffer.end(), data.begin(), data.end());
        if (_buffer.size() >= _partSize) {
            auto flushed = flushPart();
            if (!flushed) {
                abort();
                return flushed;
            }
        }
        return StorageStatus::success();
    }

    StorageResult<ObjectInfo> commit() override {
        if (_finished) {
            return StorageResult<ObjectInfo>::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }

        auto published = _uploadId.empty() ? putWhole() : completeMultipart();
        if (!published) {
            abort();
            return StorageResult<ObjectInfo>(published.error());
        }
        _finished = true;
        FERRY_LOG_DEBUG_CAT(LogCategory, "Committed " + _key + " (" + std::to_string(_total) + " bytes, " +
                                             std::to_string(_parts.size()) + " parts)");
        return ObjectInfo{_key, _total, std::chrono::system_clock::now()};
    }

    void abort() noexcept override {
        _finished = true;
        _buffer.clear();
        if (_uploadId.empty()) return;

        try {
            Aws::S3::Model::AbortMultipartUploadRequest request;
            request.SetBucket(_session->bucket());
            request.SetKey(toAws(_key));
            request.SetUploadId(_uploadId);
            auto outcome = _session->client().AbortMultipartUpload(request);
            if (!outcome.IsSuccess()) {
                FERRY_LOG_WARNING_CAT(LogCategory, "Could not abort multipart upload of " + _key + ": " +
                                                       toStorageError(outcome.GetError(), "AbortMultipartUpload", _key).message);
            }
        } catch (const std::exception& e) {
            FERRY_LOG_WARNING_CAT(LogCategory, "Could not abort multipart upload of " + _key + ": " + e.what());
        }
        _uploadId.clear();
    }

    const std::string& key() const override { return _key; }

private:
    StorageStatus putWhole() {
        Aws::S3::Model::PutObjectRequest request;
        request.SetBucket(_session->bucket());
        request.SetKey(toAws(_key));
        request.SetContentLength(static_cast<long long>(_buffer.size()));
        request.SetBody(makeBody(_buffer.data(), _buffer.size()));
        if (_ifNoneMatch) request.SetIfNoneMatch("*");

        auto outcome = _session->client().PutObject(request);
        if (!outcome.IsSuccess()) {
            return StorageStatus(toStorageError(outcome.GetError(), "PutObject", _key));
        }
        _total = _buffer.size();
        _buffer.clear();
        return StorageStatus::success();
    }

    StorageStatus startMultipart() {
        Aws::S3::Model::CreateMultipartUploadRequest request;
        request.SetBucket(_session->bucket());
        request.SetKey(toAws(_key));
        auto outcome = _session->client().CreateMultipartUpload(request);
        if (!outcome.IsSuccess()) {
            return StorageStatus(toStorageError(outcome.GetError(), "CreateMultipartUpload", _key));
        }
        _uploadId = outcome.GetResult().GetUploadId();
        return StorageStatus::success();
    }

    StorageStatus flushPart() {
        if (_uploadId.empty()) {
            auto started = startMultipart();
            if (!started) return started;
        }
        if (_parts.size() >= MaxParts) {
            return StorageStatus::failure(StorageError::IOError, "Object needs more than " +
                                              std::to_string(MaxParts) + " parts", _key);
        }

        const int partNumber = static_cast<int>(_parts.size()) + 1;
        Aws::S3::Model::UploadPartRequest request;
        request.SetBucket(_session->bucket());
        request.SetKey(toAws(_key));
        request.SetUploadId(_uploadId);
        request.SetPartNumber(partNumber);
        request.SetContentLength(static_cast<long long>(_buffer.size()));
        request.SetBody(makeBody(_buffer.data(), _buffer.size()));

        auto outcome = _session->client().UploadPart(request);
        if (!outcome.IsSuccess()) {
            return StorageStatus(toStorageError(outcome.GetError(), "UploadPart", _key));
        }

        Aws::S3::Model::CompletedPart part;
        part.SetPartNumber(partNumber);
        part.SetETag(outcome.GetResult().GetETag());
        _parts.push_back(std::move(part));
        _total += _buffer.size();
        _buffer.clear();
        return StorageStatus::success();
    }

    StorageStatus completeMultipart() {
        if (!_buffer.empty()) {
            auto flushed = flushPart();
            if (!flushed) return flushed;
        }

        Aws::S3::Model::CompletedMultipartUpload completed;
        completed.SetParts(_parts);

        Aws::S3::Model::CompleteMultipartUploadRequest request;
        request.SetBucket(_session->bucket());
        request.SetKey(toAws(_key));
        request.SetUploadId(_uploadId);
        request.SetMultipartUpload(completed);
        if (_ifNoneMatch) request.SetIfNoneMatch("*");

        auto outcome = _session->client().CompleteMultipartUpload(request);
        if (!outcome.IsSuccess()) {
            return StorageStatus(toStorageError(outcome.GetError(), "CompleteMultipartUpload", _key));
        }
        _uploadId.clear();
        return StorageStatus::success();
    }

    std::shared_ptr<Session> _session;
    std::string _key;
    bool _ifNoneMatch;
    uint64_t _partSize;
    bool _finished = false;
    std::vector<std::byte> _buffer;
    Aws::String _uploadId;
    Aws::Vector<Aws::S3::Model::CompletedPart> _parts;
    uint64_t _total = 0;
};

S3ObjectStoreClient::S3ObjectStoreClient(Config config)
    : _config(std::move(config)) {
    if (!isValidBucketName(_config.bucket)) {
        throw ConfigurationError("s3: invalid bucket name '" + _config.bucket + "'");
    }
    if (_config.region.empty()) {
        throw ConfigurationError("s3: region must not be empty");
    }
    if (_config.accessKeyId.has_value() != _config.secretAccessKey.has_value()) {
        throw ConfigurationError("s3: access key id and secret access key must be given together");
    }
    if (!_config.endpoint.empty() && parseEndpoint(_config.endpoint).host.empty()) {
        throw ConfigurationError("s3: endpoint has no host: '" + _config.endpoint + "'");
    }
    if (_config.partSize < MinPartSize) {
        throw ConfigurationError("s3: part size must be at least " + std::to_string(MinPartSize) + " bytes");
    }
    if (_config.readChunk == 0) {
        throw ConfigurationError("s3: read chunk must not be zero");
    }

    _session = std::make_shared<Session>(_config);
    FERRY_LOG_INFO_CAT(LogCategory, "Bucket " + _config.bucket + " in " + _config.region +
                                        (_config.endpoint.empty() ? std::string() : " at " + _config.endpoint));
}

S3ObjectStoreClient::~S3ObjectStoreClient() = default;

StorageResult<ObjectListing> S3ObjectStoreClient::listObjects(const std::string& prefix,
                                                              std::optional<char> delimiter) {
    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(_session->bucket());
    request.SetPrefix(toAws(prefix));
    if (delimiter) request.SetDelimiter(Aws::String(1, *delimiter));

    ObjectListing listing;
    for (;;) {
        auto outcome = _session->client().ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return StorageResult<ObjectListing>(toStorageError(outcome.GetError(), "ListObjectsV2", prefix));
        }

        const auto& page = outcome.GetResult();
        for (const auto& object : page.GetContents()) {
            listing.objects.push_back(ObjectInfo{toStd(object.GetKey()),
                                                 static_cast<uint64_t>(std::max<long long>(object.GetSize(), 0)),
                                                 toTimePoint(object.GetLastModified())});
        }
        for (const auto& common : page.GetCommonPrefixes()) {
            listing.commonPrefixes.push_back(toStd(common.GetPrefix()));
        }

        if (!page.GetIsTruncated()) break;
        if (page.GetNextContinuationToken().empty()) {
            FERRY_LOG_WARNING_CAT(LogCategory, "Truncated listing of '" + prefix + "' without a continuation token");
            break;
        }
        request.SetContinuationToken(page.GetNextContinuationToken());
    }
    return listing;
}

StorageResult<ObjectInfo> S3ObjectStoreClient::headObject(const std::string& key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(_session->bucket());
    request.SetKey(toAws(key));

    auto outcome = _session->client().HeadObject(request);
    if (!outcome.IsSuccess()) {
        return StorageResult<ObjectInfo>(toStorageError(outcome.GetError(), "HeadObject", key));
    }
    const auto& head = outcome.GetResult();
    return ObjectInfo{key, static_cast<uint64_t>(std::max<long long>(head.GetContentLength(), 0)),
                      toTimePoint(head.GetLastModified())};
}

StorageResult<std::unique_ptr<ByteSource>> S3ObjectStoreClient::getObject(const std::string& key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(_session->bucket());
    request.SetKey(toAws(key));

    auto outcome = _session->client().HeadObject(request);
    if (!outcome.IsSuccess()) {
        return StorageResult<std::unique_ptr<ByteSource>>(toStorageError(outcome.GetError(), "HeadObject", key));
    }
    const auto& head = outcome.GetResult();
    const auto size = static_cast<uint64_t>(std::max<long long>(head.GetContentLength(), 0));
    std::unique_ptr<ByteSource> source =
        std::make_unique<Source>(_session, key, head.GetETag(), size, _config.readChunk);
    return source;
}

StorageResult<std::unique_ptr<IObjectUpload>> S3ObjectStoreClient::createUpload(const std::string& key,
                                                                                bool ifNoneMatch) {
    std::unique_ptr<IObjectUpload> upload = std::make_unique<Upload>(_session, key, ifNoneMatch, _config.partSize);
    return upload;
}

StorageStatus S3ObjectStoreClient::deleteObject(const std::string& key) {
    // DeleteObject succeeds on absent keys; the head keeps NotFound meaningful
    auto head = headObject(key);
    if (!head) return StorageStatus(head.error());

    Aws::S3::Model::DeleteObjectRequest request;
    request.SetBucket(_session->bucket());
    request.SetKey(toAws(key));
    auto outcome = _session->client().DeleteObject(request);
    if (!outcome.IsSuccess()) {
        return StorageStatus(toStorageError(outcome.GetError(), "DeleteObject", key));
    }
    return StorageStatus::success();
}

S3ObjectStoreClient::Endpoint S3ObjectStoreClient::parseEndpoint(const std::string& endpoint) {
    constexpr std::string_view http = "http://";
    constexpr std::string_view https = "https://";

    Endpoint result;
    std::string_view rest = endpoint;
    if (rest.substr(0, http.size()) == http) {
        result.https = false;
        rest.remove_prefix(http.size());
    } else if (rest.substr(0, https.size()) == https) {
        result.https = true;
        rest.remove_prefix(https.size());
    }
    while (!rest.empty() && rest.back() == '/') rest.remove_suffix(1);
    result.host = std::string(rest);
    return result;
}

StorageError S3ObjectStoreClient::classifyHttpStatus(int status) {
    if (status <= 0) return StorageError::ProviderUnavailable;
    switch (status) {
        case 401:
        case 403:
            return StorageError::PermissionDenied;
        case 404:
            return StorageError::NotFound;
        case 412:
            return StorageError::AlreadyExists;
        case 408:
        case 409:   // concurrent conditional write; the next attempt sees the winner
        case 429:
            return StorageError::ProviderUnavailable;
        default:
            break;
    }
    if (status >= 500) return StorageError::ProviderUnavailable;
    return StorageError::IOError;
}

} // namespace Ferry::Core::Storage
