/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "LocalFileSystemProvider.h"
#include "ErrorMapping.h"
#include "StoragePath.h"
#include "../Logging/Logger.h"
#include <cerrno>
#include <fstream>
#include <random>
#include <system_error>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#include <stdlib.h>
#endif

namespace Ferry::Core::Storage {

namespace {
    constexpr const char* kStagingMarker = ".ferrypart.";

    std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type lwt) {
        // Convert file_time_type to system_clock::time_point
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            lwt - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    // Create secure temporary file path beside the destination
    std::filesystem::path createSecureTempPath(const std::filesystem::path& dir,
                                               const std::string& base) {
        std::string stem = "." + base + kStagingMarker;
#if defined(__unix__) || defined(__APPLE__)
        std::string tmpl = (dir / (stem + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            return dir / (stem + std::to_string(std::random_device{}()));
        }
        ::close(fd);  // Reopened with fstream
        return std::filesystem::path(buf.data());
#else
        return dir / (stem + std::to_string(std::random_device{}()));
#endif
    }

    void discardStaging(const std::filesystem::path& staged) {
        std::error_code ec;
        std::filesystem::remove(staged, ec);
        if (ec) {
            FERRY_LOG_WARNING_CAT("LocalFileSystemProvider",
                "Failed to remove staging file " + staged.string() + ": " + ec.message());
        }
    }
}

LocalFileSystemProvider::LocalFileSystemProvider(Config config)
    : _config(std::move(config)) {
    std::error_code ec;
    if (_config.root.empty()) {
        throw ConfigurationError("local provider root must not be empty");
    }
    auto canonical = std::filesystem::weakly_canonical(_config.root, ec);
    _root = ec ? _config.root : canonical;
    if (!std::filesystem::is_directory(_root, ec)) {
        throw ConfigurationError("local provider root is not an existing directory: " + _root.string());
    }
}

bool LocalFileSystemProvider::isStagingName(const std::string& name) {
    return !name.empty() && name.front() == '.' && name.find(kStagingMarker) != std::string::npos;
}

std::filesystem::path LocalFileSystemProvider::toNative(const std::string& path) const {
    std::filesystem::path native = _root;
    for (const auto& segment : StoragePath::segments(path)) {
        native /= segment;
    }
    return native;
}

ProviderCapabilities LocalFileSystemProvider::capabilities() const {
    ProviderCapabilities caps;
    caps.supportsNativeMove = true;
    caps.isRemote = false;
    caps.maxConcurrency = _config.maxConcurrency;
    return caps;
}

StorageStatus LocalFileSystemProvider::checkLinkFreeAncestors(const std::string& logicalPath) const {
    auto parts = StoragePath::segments(logicalPath);
    std::filesystem::path native = _root;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        native /= parts[i];
        std::error_code ec;
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(native, ec))) {
            return StorageStatus::failure(StorageError::InvalidPath,
                "Path passes through a symbolic link", logicalPath);
        }
    }
    return StorageStatus::success();
}

StorageResult<Entry> LocalFileSystemProvider::entryFor(const std::string& logicalPath,
                                                       const std::filesystem::path& native) {
    std::error_code ec;
    auto st = std::filesystem::symlink_status(native, ec);
    if (ec || !std::filesystem::exists(st)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return StorageResult<Entry>(makeSystemError(ec, "Failed to stat", logicalPath));
        }
        return StorageResult<Entry>::failure(StorageError::NotFound, "No such entry", logicalPath);
    }

    Entry entry;
    entry.path = StoragePath::normalize(logicalPath);
    entry.name = StoragePath::isRoot(entry.path) ? std::string("/") : StoragePath::filename(entry.path);
    entry.providerId = _id;

    if (std::filesystem::is_symlink(st)) {
        // Leaf regardless of the target, so traversals stay inside the subtree
        entry.kind = EntryKind::File;
        entry.isSymlink = true;
        return entry;
    }
    if (std::filesystem::is_directory(st)) {
        entry.kind = EntryKind::Directory;
    } else if (std::filesystem::is_regular_file(st)) {
        entry.kind = EntryKind::File;
        auto size = std::filesystem::file_size(native, ec);
        if (!ec) entry.size = static_cast<uint64_t>(size);
    } else {
        // FIFO, device, socket
        return StorageResult<Entry>::failure(StorageError::InvalidPath, "Special files are not supported", logicalPath);
    }

    auto lwt = std::filesystem::last_write_time(native, ec);
    if (!ec) entry.lastModified = toSystemTime(lwt);
    return entry;
}

StorageResult<std::vector<Entry>> LocalFileSystemProvider::list(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (auto linked = checkLinkFreeAncestors(logical); !linked) {
        return StorageResult<std::vector<Entry>>(linked.error());
    }
    auto native = toNative(logical);

    std::error_code ec;
    auto st = std::filesystem::symlink_status(native, ec);
    if (ec || !std::filesystem::exists(st)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return StorageResult<std::vector<Entry>>(makeSystemError(ec, "Failed to stat directory", logical));
        }
        return StorageResult<std::vector<Entry>>::failure(StorageError::NotFound, "Directory not found", logical);
    }
    if (std::filesystem::is_symlink(st)) {
        return StorageResult<std::vector<Entry>>::failure(StorageError::InvalidPath,
            "Symbolic links are not followed", logical);
    }
    if (!std::filesystem::is_directory(st)) {
        return StorageResult<std::vector<Entry>>::failure(StorageError::InvalidPath, "Not a directory", logical);
    }

    std::filesystem::directory_iterator it(native, ec);
    if (ec) {
        return StorageResult<std::vector<Entry>>(makeSystemError(ec, "Failed to open directory", logical));
    }

    std::vector<Entry> entries;
    for (auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return StorageResult<std::vector<Entry>>(makeSystemError(ec, "Directory iteration failed", logical));
        }
        auto name = it->path().filename().string();
        if (isStagingName(name)) continue;

        auto entry = entryFor(StoragePath::join(logical, name), it->path());
        if (!entry) {
            // Special files vanish from listings
            FERRY_LOG_DEBUG_CAT("LocalFileSystemProvider",
                "Skipping " + it->path().string() + ": " + entry.error().describe());
            continue;
        }
        entries.push_back(std::move(entry).value());
    }
    if (ec) {
        return StorageResult<std::vector<Entry>>(makeSystemError(ec, "Directory iteration failed", logical));
    }
    return entries;
}

StorageResult<Entry> LocalFileSystemProvider::stat(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (auto linked = checkLinkFreeAncestors(logical); !linked) {
        return StorageResult<Entry>(linked.error());
    }
    return entryFor(logical, toNative(logical));
}

StorageResult<std::unique_ptr<ByteSource>> LocalFileSystemProvider::openRead(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (auto linked = checkLinkFreeAncestors(logical); !linked) {
        return StorageResult<std::unique_ptr<ByteSource>>(linked.error());
    }
    auto native = toNative(logical);
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(native, ec))) {
        return StorageResult<std::unique_ptr<ByteSource>>::failure(StorageError::InvalidPath,
            "Symbolic links are not followed", logical);
    }
    return FileByteSource::open(native, logical);
}

StorageStatus LocalFileSystemProvider::publishNoOverwrite(const std::filesystem::path& staged,
                                                          const std::filesystem::path& destination,
                                                          const std::string& logicalPath) {
#if defined(__unix__) || defined(__APPLE__)
    // link() refuses an existing destination atomically
    if (::link(staged.c_str(), destination.c_str()) == 0) {
        discardStaging(staged);
        return StorageStatus::success();
    }
    int savedErrno = errno;
    if (savedErrno == EEXIST) {
        return StorageStatus::failure(StorageError::AlreadyExists, "Destination already exists", logicalPath);
    }
    if (savedErrno != EPERM && savedErrno != ENOTSUP && savedErrno != EOPNOTSUPP && savedErrno != EMLINK) {
        return StorageStatus(StorageErrorInfo{mapErrnoToStorageError(savedErrno), "Failed to publish file",
                                              logicalPath, std::error_code(savedErrno, std::generic_category())});
    }
    // Filesystem without hard links: fall through to checked rename
#endif
    std::error_code ec;
    if (std::filesystem::exists(destination, ec)) {
        return StorageStatus::failure(StorageError::AlreadyExists, "Destination already exists", logicalPath);
    }
    std::filesystem::rename(staged, destination, ec);
    if (ec) {
        return StorageStatus(makeSystemError(ec, "Failed to publish file", logicalPath));
    }
    return StorageStatus::success();
}

StorageResult<Entry> LocalFileSystemProvider::write(const std::string& path,
                                                    ByteSource& source,
                                                    const Concurrency::CancellationToken& cancel,
                                                    const WriteOptions& options) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) {
        return StorageResult<Entry>::failure(StorageError::InvalidPath, "Cannot write to the provider root", logical);
    }
    if (auto linked = checkLinkFreeAncestors(logical); !linked) {
        return StorageResult<Entry>(linked.error());
    }
    auto native = toNative(logical);
    auto parent = native.parent_path();

    std::error_code ec;
    if (!std::filesystem::is_directory(parent, ec)) {
        return StorageResult<Entry>::failure(StorageError::NotFound, "Parent directory does not exist", logical);
    }
    if (std::filesystem::exists(std::filesystem::symlink_status(native, ec))) {
        return StorageResult<Entry>::failure(StorageError::AlreadyExists, "Destination already exists", logical);
    }

    auto staged = createSecureTempPath(parent, native.filename().string());
    {
        errno = 0;
        std::ofstream out(staged, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            int savedErrno = errno;
            discardStaging(staged);
            auto code = savedErrno != 0 ? mapErrnoToStorageError(savedErrno) : StorageError::IOError;
            return StorageResult<Entry>::failure(code, "Failed to create staging file", logical);
        }

        uint64_t written = 0;
        auto status = pumpChunks(source, cancel, options.chunkSize,
            [&](std::span<const std::byte> chunk) {
                errno = 0;
                out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
                if (!out) {
                    int savedErrno = errno;
                    auto code = savedErrno != 0 ? mapErrnoToStorageError(savedErrno) : StorageError::IOError;
                    return StorageStatus::failure(code, "Write operation failed", logical);
                }
                return StorageStatus::success();
            }, written, options.progressCallback);

        if (status) {
            out.flush();
            if (!out) {
                status = StorageStatus::failure(StorageError::IOError, "Failed to flush staging file", logical);
            }
        }
        out.close();
        if (!status) {
            discardStaging(staged);
            return StorageResult<Entry>(status.error());
        }
    }

    auto published = publishNoOverwrite(staged, native, logical);
    if (!published) {
        discardStaging(staged);
        return StorageResult<Entry>(published.error());
    }
    return entryFor(logical, native);
}

StorageStatus LocalFileSystemProvider::createDirectory(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (auto linked = checkLinkFreeAncestors(logical); !linked) return linked;
    auto native = toNative(logical);

    std::error_code ec;
    auto st = std::filesystem::symlink_status(native, ec);
    if (std::filesystem::exists(st)) {
        if (std::filesystem::is_directory(st)) return StorageStatus::success();
        return StorageStatus::failure(StorageError::AlreadyExists, "A file occupies the directory path", logical);
    }
    if (!std::filesystem::is_directory(native.parent_path(), ec)) {
        return StorageStatus::failure(StorageError::NotFound, "Parent directory does not exist", logical);
    }

    std::filesystem::create_directory(native, ec);
    if (ec) {
        // Lost a race with another creator
        if (std::filesystem::is_directory(native)) return StorageStatus::success();
        return StorageStatus(makeSystemError(ec, "Failed to create directory", logical));
    }
    return StorageStatus::success();
}

StorageStatus LocalFileSystemProvider::remove(const std::string& path) {
    auto logical = StoragePath::normalize(path);
    if (StoragePath::isRoot(logical)) {
        return StorageStatus::failure(StorageError::PermissionDenied, "Refusing to remove the provider root", logical);
    }
    if (auto linked = checkLinkFreeAncestors(logical); !linked) return linked;
    auto native = toNative(logical);

    std::error_code ec;
    auto st = std::filesystem::symlink_status(native, ec);
    if (ec || !std::filesystem::exists(st)) {
        return StorageStatus::failure(StorageError::NotFound, "No such entry", logical);
    }

    if (std::filesystem::is_directory(st)) {
        std::filesystem::directory_iterator it(native, ec);
        if (!ec && it != std::filesystem::directory_iterator()) {
            return StorageStatus::failure(StorageError::NotEmpty, "Directory is not empty", logical);
        }
    }

    // Deletes a symlink itself, never its target
    std::filesystem::remove(native, ec);
    if (ec) {
        if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
            return StorageStatus::failure(StorageError::NotEmpty, "Directory is not empty", logical, ec);
        }
        return StorageStatus(makeSystemError(ec, "Failed to remove", logical));
    }
    return StorageStatus::success();
}

StorageResult<Entry> LocalFileSystemProvider::nativeMove(const std::string& from, const std::string& to) {
    auto src = StoragePath::normalize(from);
    auto dst = StoragePath::normalize(to);
    if (StoragePath::isRoot(src) || StoragePath::isRoot(dst)) {
        return StorageResult<Entry>::failure(StorageError::InvalidPath, "Cannot move the provider root", src);
    }
    if (StoragePath::isWithin(dst, src)) {
        return StorageResult<Entry>::failure(StorageError::InvalidPath, "Cannot move a directory into itself", dst);
    }

    if (auto linked = checkLinkFreeAncestors(src); !linked) return StorageResult<Entry>(linked.error());
    if (auto linked = checkLinkFreeAncestors(dst); !linked) return StorageResult<Entry>(linked.error());

    auto nativeSrc = toNative(src);
    auto nativeDst = toNative(dst);
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(nativeSrc, ec))) {
        return StorageResult<Entry>::failure(StorageError::NotFound, "Source does not exist", src);
    }
    if (std::filesystem::exists(std::filesystem::symlink_status(nativeDst, ec))) {
        return StorageResult<Entry>::failure(StorageError::AlreadyExists, "Destination already exists", dst);
    }
    if (!std::filesystem::is_directory(nativeDst.parent_path(), ec)) {
        return StorageResult<Entry>::failure(StorageError::NotFound, "Destination parent does not exist", dst);
    }

    std::filesystem::rename(nativeSrc, nativeDst, ec);
    if (ec) {
        return StorageResult<Entry>(makeSystemError(ec, "Rename failed", src));
    }
    return entryFor(dst, nativeDst);
}

} // namespace Ferry::Core::Storage
