/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include "ByteStream.h"
#include "ErrorMapping.h"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace Ferry::Core::Storage {

std::shared_ptr<const std::vector<std::byte>> makeBytes(std::string_view text) {
    auto bytes = std::make_shared<std::vector<std::byte>>(text.size());
    if (!text.empty()) std::memcpy(bytes->data(), text.data(), text.size());
    return bytes;
}

MemoryByteSource::MemoryByteSource(std::shared_ptr<const std::vector<std::byte>> data, std::string path)
    : _data(data ? std::move(data) : std::make_shared<const std::vector<std::byte>>())
    , _path(std::move(path)) {
}

MemoryByteSource::MemoryByteSource(std::string_view text, std::string path)
    : _data(makeBytes(text))
    , _path(std::move(path)) {
}

IoResult MemoryByteSource::read(std::span<std::byte> buffer) {
    IoResult result;
    size_t available = _data->size() - std::min(_position, _data->size());
    size_t toCopy = std::min(available, buffer.size());
    if (toCopy > 0) {
        std::memcpy(buffer.data(), _data->data() + _position, toCopy);
        _position += toCopy;
    }
    result.bytesTransferred = toCopy;
    result.complete = eof();
    return result;
}

FileByteSource::FileByteSource(std::ifstream stream, std::filesystem::path nativePath,
                               std::string logicalPath, std::optional<uint64_t> size)
    : _stream(std::move(stream))
    , _nativePath(std::move(nativePath))
    , _logicalPath(std::move(logicalPath))
    , _size(size) {
}

StorageResult<std::unique_ptr<ByteSource>> FileByteSource::open(const std::filesystem::path& nativePath,
                                                                std::string logicalPath) {
    std::error_code ec;
    auto st = std::filesystem::status(nativePath, ec);
    if (ec || !std::filesystem::exists(st)) {
        return StorageResult<std::unique_ptr<ByteSource>>::failure(
            ec ? mapErrorCode(ec) : StorageError::NotFound, "File does not exist", logicalPath,
            ec ? std::optional<std::error_code>(ec) : std::nullopt);
    }
    if (!std::filesystem::is_regular_file(st)) {
        return StorageResult<std::unique_ptr<ByteSource>>::failure(
            StorageError::InvalidPath, "Not a regular file", logicalPath);
    }

    errno = 0;
    std::ifstream in(nativePath, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        int savedErrno = errno;
        auto code = savedErrno != 0 ? mapErrnoToStorageError(savedErrno) : StorageError::IOError;
        return StorageResult<std::unique_ptr<ByteSource>>::failure(
            code, "Failed to open file for reading", logicalPath,
            savedErrno != 0 ? std::optional<std::error_code>(std::error_code(savedErrno, std::generic_category()))
                            : std::nullopt);
    }

    std::optional<uint64_t> size;
    auto fileSize = std::filesystem::file_size(nativePath, ec);
    if (!ec) size = static_cast<uint64_t>(fileSize);

    std::unique_ptr<ByteSource> source =
        std::make_unique<FileByteSource>(std::move(in), nativePath, std::move(logicalPath), size);
    return source;
}

IoResult FileByteSource::read(std::span<std::byte> buffer) {
    IoResult result;
    if (_eof || buffer.empty()) {
        result.complete = _eof;
        return result;
    }

    _stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto got = _stream.gcount();
    result.bytesTransferred = got > 0 ? static_cast<size_t>(got) : 0;

    if (_stream.eof()) {
        _eof = true;
    } else if (_stream.fail()) {
        result.error = StorageErrorInfo{StorageError::IOError, "Read failed", _logicalPath, std::nullopt};
        return result;
    }
    result.complete = _eof;
    return result;
}

StorageStatus pumpChunks(ByteSource& source,
                         const Concurrency::CancellationToken& cancel,
                         size_t chunkSize,
                         const std::function<StorageStatus(std::span<const std::byte>)>& sink,
                         uint64_t& transferred,
                         const std::function<void(uint64_t)>& progress) {
    transferred = 0;
    std::vector<std::byte> buffer(std::max<size_t>(chunkSize, 1));

    while (true) {
        if (cancel.isCancelled()) {
            return StorageStatus::failure(StorageError::Cancelled, "Transfer cancelled", source.path());
        }

        auto chunk = source.read(buffer);
        if (!chunk.success()) {
            return StorageStatus(*chunk.error);
        }
        if (chunk.bytesTransferred > 0) {
            auto status = sink(std::span<const std::byte>(buffer.data(), chunk.bytesTransferred));
            if (!status) return status;
            transferred += chunk.bytesTransferred;
            if (progress) progress(transferred);
        }
        if (chunk.complete || source.eof()) break;
        if (chunk.bytesTransferred == 0) {
            return StorageStatus::failure(StorageError::IOError, "Source stalled before end of stream",
                                          source.path());
        }
    }
    return StorageStatus::success();
}

StorageResult<std::vector<std::byte>> readAll(ByteSource& source, size_t chunkSize) {
    std::vector<std::byte> out;
    if (auto hint = source.sizeHint()) out.reserve(static_cast<size_t>(*hint));
    uint64_t total = 0;
    Concurrency::CancellationToken never;
    auto status = pumpChunks(source, never, chunkSize,
        [&](std::span<const std::byte> chunk) {
            out.insert(out.end(), chunk.begin(), chunk.end());
            return StorageStatus::success();
        }, total);
    if (!status) return StorageResult<std::vector<std::byte>>(status.error());
    return out;
}

} // namespace Ferry::Core::Storage
