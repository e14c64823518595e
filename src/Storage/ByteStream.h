/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "StorageTypes.h"
#include "../Concurrency/CancellationToken.h"

namespace Ferry::Core::Storage {

// Result structure for streaming reads
struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;              ///< Source is exhausted
    std::optional<StorageErrorInfo> error;

    bool success() const { return !error.has_value(); }
};

// Pure interface for a readable byte stream handed out by providers
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read into buffer, returns actual bytes read. A short read is not EOF;
    // complete is set once no more data will follow.
    virtual IoResult read(std::span<std::byte> buffer) = 0;

    virtual bool eof() const = 0;

    // Total length if known up front
    virtual std::optional<uint64_t> sizeHint() const { return std::nullopt; }

    virtual std::string path() const { return ""; }
};

// In-memory source; shares its buffer so object store reads avoid copies
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::shared_ptr<const std::vector<std::byte>> data, std::string path = {});
    explicit MemoryByteSource(std::string_view text, std::string path = {});

    IoResult read(std::span<std::byte> buffer) override;
    bool eof() const override { return _position >= _data->size(); }
    std::optional<uint64_t> sizeHint() const override { return _data->size(); }
    std::string path() const override { return _path; }

private:
    std::shared_ptr<const std::vector<std::byte>> _data;
    size_t _position = 0;
    std::string _path;
};

// Sequential reader over a host file
class FileByteSource : public ByteSource {
public:
    FileByteSource(std::ifstream stream, std::filesystem::path nativePath, std::string logicalPath,
                   std::optional<uint64_t> size);

    /**
     * @brief Opens a host file for sequential reading
     * @return The source, or NotFound/PermissionDenied/InvalidPath mapped from the OS
     */
    static StorageResult<std::unique_ptr<ByteSource>> open(const std::filesystem::path& nativePath,
                                                           std::string logicalPath);

    IoResult read(std::span<std::byte> buffer) override;
    bool eof() const override { return _eof; }
    std::optional<uint64_t> sizeHint() const override { return _size; }
    std::string path() const override { return _logicalPath; }

private:
    std::ifstream _stream;
    std::filesystem::path _nativePath;
    std::string _logicalPath;
    std::optional<uint64_t> _size;
    bool _eof = false;
};

/**
 * @brief Drains a source into a sink one chunk at a time
 *
 * The cancellation token is checked before every chunk. The sink receives each
 * chunk in order and may fail the pump by returning an error. On success
 * `transferred` holds the total byte count.
 *
 * @code
 * uint64_t total = 0;
 * auto status = pumpChunks(source, token, 64 * 1024,
 *     [&](std::span<const std::byte> chunk) { return upload.appendPart(chunk); }, total);
 * @endcode
 */
StorageStatus pumpChunks(ByteSource& source,
                         const Concurrency::CancellationToken& cancel,
                         size_t chunkSize,
                         const std::function<StorageStatus(std::span<const std::byte>)>& sink,
                         uint64_t& transferred,
                         const std::function<void(uint64_t)>& progress = {});

/// Reads a whole source into memory. Intended for small payloads and tests.
StorageResult<std::vector<std::byte>> readAll(ByteSource& source, size_t chunkSize = 64 * 1024);

std::shared_ptr<const std::vector<std::byte>> makeBytes(std::string_view text);

} // namespace Ferry::Core::Storage
