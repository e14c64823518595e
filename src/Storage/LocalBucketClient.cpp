/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "LocalBucketClient.h"
#include "ErrorMapping.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <fstream>
#include <random>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace Ferry::Core::Storage {

namespace {
    std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type lwt) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            lwt - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    std::string uniqueUploadName() {
        static std::atomic<uint64_t> counter{0};
        std::random_device rd;
        return std::to_string(rd()) + "-" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }

    constexpr char kDirectorySuffix = '~';
    constexpr const char* kEmptySegment = "%";

    bool sharesPrefix(const std::string& a, const std::string& b) {
        size_t n = std::min(a.size(), b.size());
        return a.compare(0, n, b, 0, n) == 0;
    }

    StorageResult<ObjectInfo> infoFor(const std::string& key, const std::filesystem::path& file) {
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) {
                return StorageResult<ObjectInfo>::failure(StorageError::NotFound, "No such key", key);
            }
            return StorageResult<ObjectInfo>(makeSystemError(ec, "Failed to stat object", key));
        }
        ObjectInfo info{key, static_cast<uint64_t>(size), std::nullopt};
        auto lwt = std::filesystem::last_write_time(file, ec);
        if (!ec) info.lastModified = toSystemTime(lwt);
        return info;
    }
}

class LocalBucketClient::Upload : public IObjectUpload {
public:
    Upload(std::string key, std::filesystem::path staged, std::filesystem::path destination,
           std::ofstream out, bool ifNoneMatch, std::mutex& layoutMutex)
        : _key(std::move(key))
        , _staged(std::move(staged))
        , _destination(std::move(destination))
        , _out(std::move(out))
        , _ifNoneMatch(ifNoneMatch)
        , _layoutMutex(layoutMutex) {}

    ~Upload() override { abort(); }

    StorageStatus appendPart(std::span<const std::byte> data) override {
        if (_finished) {
            return StorageStatus::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }
        errno = 0;
        _out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!_out) {
            int savedErrno = errno;
            auto code = savedErrno != 0 ? mapErrnoToStorageError(savedErrno) : StorageError::IOError;
            return StorageStatus::failure(code, "Failed to stage upload part", _key);
        }
        return StorageStatus::success();
    }

    StorageResult<ObjectInfo> commit() override {
        if (_finished) {
            return StorageResult<ObjectInfo>::failure(StorageError::InvalidPath, "Upload already finished", _key);
        }
        _out.flush();
        bool flushed = static_cast<bool>(_out);
        _out.close();
        if (!flushed) {
            abort();
            return StorageResult<ObjectInfo>::failure(StorageError::IOError, "Failed to flush staged upload", _key);
        }

        auto published = publish();
        abort();  // Drops the staging name either way
        if (!published) return StorageResult<ObjectInfo>(published.error());
        return infoFor(_key, _destination);
    }

    void abort() noexcept override {
        _finished = true;
        if (_out.is_open()) _out.close();
        std::error_code ec;
        std::filesystem::remove(_staged, ec);
    }

    const std::string& key() const override { return _key; }

private:
    StorageStatus publish() {
        std::lock_guard<std::mutex> lock(_layoutMutex);
        std::error_code ec;
        std::filesystem::create_directories(_destination.parent_path(), ec);
        if (ec) return StorageStatus(makeSystemError(ec, "Failed to create key prefix", _key));
        if (!_ifNoneMatch) {
            std::filesystem::rename(_staged, _destination, ec);
            if (ec) return StorageStatus(makeSystemError(ec, "Failed to commit upload", _key));
            return StorageStatus::success();
        }
#if defined(__unix__) || defined(__APPLE__)
        if (::link(_staged.c_str(), _destination.c_str()) != 0) {
            int savedErrno = errno;
            if (savedErrno == EEXIST) {
                return StorageStatus::failure(StorageError::AlreadyExists, "Key already exists", _key);
            }
            return StorageStatus(StorageErrorInfo{mapErrnoToStorageError(savedErrno), "Failed to commit upload",
                                                  _key, std::error_code(savedErrno, std::generic_category())});
        }
        return StorageStatus::success();
#else
        if (std::filesystem::exists(_destination, ec)) {
            return StorageStatus::failure(StorageError::AlreadyExists, "Key already exists", _key);
        }
        std::filesystem::rename(_staged, _destination, ec);
        if (ec) return StorageStatus(makeSystemError(ec, "Failed to commit upload", _key));
        return StorageStatus::success();
#endif
    }

    std::string _key;
    std::filesystem::path _staged;
    std::filesystem::path _destination;
    std::ofstream _out;
    bool _ifNoneMatch;
    std::mutex& _layoutMutex;
    bool _finished = false;
};

LocalBucketClient::LocalBucketClient(std::filesystem::path root, std::string bucket)
    : _bucket(std::move(bucket))
    , _bucketDir(root / _bucket) {
    std::error_code ec;
    std::filesystem::create_directories(uploadsDirectory(), ec);
    if (ec) {
        throw ConfigurationError("cannot create bucket directory " + _bucketDir.string() + ": " + ec.message());
    }
}

std::string LocalBucketClient::escapeSegment(const std::string& segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        auto c = static_cast<unsigned char>(segment[i]);
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                     c == '-' || c == '_' || (c == '.' && i != 0);
        if (plain) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out.empty() ? std::string(kEmptySegment) : out;
}

std::optional<std::string> LocalBucketClient::unescapeSegment(const std::string& name) {
    if (name == kEmptySegment) return std::string();
    if (name.empty()) return std::nullopt;
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '%') {
            out += name[i];
            continue;
        }
        if (i + 2 >= name.size()) return std::nullopt;
        int hi = hexValue(name[i + 1]);
        int lo = hexValue(name[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::filesystem::path LocalBucketClient::objectPath(const std::string& key) const {
    std::filesystem::path path = _bucketDir;
    size_t start = 0;
    for (size_t slash = key.find('/'); slash != std::string::npos; slash = key.find('/', start)) {
        path /= escapeSegment(key.substr(start, slash - start)) + kDirectorySuffix;
        start = slash + 1;
    }
    return path / escapeSegment(key.substr(start));
}

void LocalBucketClient::pruneEmptyDirectories(std::filesystem::path directory) {
    std::error_code ec;
    while (directory != _bucketDir && directory.parent_path() != directory) {
        if (!std::filesystem::is_empty(directory, ec) || ec) break;
        std::filesystem::remove(directory, ec);
        if (ec) {
            FERRY_LOG_DEBUG_CAT("LocalBucketClient", "Keeping " + directory.string() + ": " + ec.message());
            break;
        }
        directory = directory.parent_path();
    }
}

StorageResult<ObjectListing> LocalBucketClient::listObjects(const std::string& prefix,
                                                            std::optional<char> delimiter) {
    std::lock_guard<std::mutex> lock(_layoutMutex);
    std::vector<ObjectInfo> matched;

    // Directories to visit, with the key prefix they stand for
    std::vector<std::pair<std::filesystem::path, std::string>> pending{{_bucketDir, std::string()}};
    while (!pending.empty()) {
        auto [directory, keyPrefix] = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec) {
            return StorageResult<ObjectListing>(makeSystemError(ec, "Failed to list bucket", _bucket));
        }
        for (auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
            if (ec) break;
            auto name = it->path().filename().string();
            if (name.empty() || name.front() == '.') continue;

            std::error_code typeEc;
            bool isDirectory = it->is_directory(typeEc) && !it->is_symlink(typeEc);
            if (isDirectory && name.back() == kDirectorySuffix) {
                auto segment = unescapeSegment(name.substr(0, name.size() - 1));
                if (!segment) {
                    FERRY_LOG_WARNING_CAT("LocalBucketClient", "Ignoring foreign directory in bucket: " + name);
                    continue;
                }
                auto childPrefix = keyPrefix + *segment + "/";
                if (sharesPrefix(childPrefix, prefix)) pending.emplace_back(it->path(), std::move(childPrefix));
                continue;
            }

            auto segment = isDirectory ? std::nullopt : unescapeSegment(name);
            if (!segment) {
                FERRY_LOG_WARNING_CAT("LocalBucketClient", "Ignoring foreign file in bucket: " + it->path().string());
                continue;
            }
            auto key = keyPrefix + *segment;
            if (key.compare(0, prefix.size(), prefix) != 0) continue;
            auto info = infoFor(key, it->path());
            // Deleted between iteration and stat
            if (!info) continue;
            matched.push_back(std::move(info).value());
        }
        if (ec) {
            return StorageResult<ObjectListing>(makeSystemError(ec, "Bucket iteration failed", _bucket));
        }
    }

    std::sort(matched.begin(), matched.end(),
              [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });
    return groupByDelimiter(std::move(matched), prefix, delimiter);
}

StorageResult<ObjectInfo> LocalBucketClient::headObject(const std::string& key) {
    return infoFor(key, objectPath(key));
}

StorageResult<std::unique_ptr<ByteSource>> LocalBucketClient::getObject(const std::string& key) {
    return FileByteSource::open(objectPath(key), key);
}

StorageResult<std::unique_ptr<IObjectUpload>> LocalBucketClient::createUpload(const std::string& key,
                                                                              bool ifNoneMatch) {
    auto staged = uploadsDirectory() / uniqueUploadName();
    errno = 0;
    std::ofstream out(staged, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        int savedErrno = errno;
        auto code = savedErrno != 0 ? mapErrnoToStorageError(savedErrno) : StorageError::IOError;
        return StorageResult<std::unique_ptr<IObjectUpload>>::failure(code, "Failed to stage upload", key);
    }
    std::unique_ptr<IObjectUpload> upload =
        std::make_unique<Upload>(key, staged, objectPath(key), std::move(out), ifNoneMatch, _layoutMutex);
    return upload;
}

StorageStatus LocalBucketClient::deleteObject(const std::string& key) {
    auto path = objectPath(key);
    std::lock_guard<std::mutex> lock(_layoutMutex);
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            return StorageStatus::failure(StorageError::NotFound, "No such key", key);
        }
        return StorageStatus(makeSystemError(ec, "Failed to delete object", key));
    }
    if (!removed) return StorageStatus::failure(StorageError::NotFound, "No such key", key);
    pruneEmptyDirectories(path.parent_path());
    return StorageStatus::success();
}

} // namespace Ferry::Core::Storage
