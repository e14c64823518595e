/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include "FerryCore.h"

namespace ferry::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "Ferry_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }

private:
    std::filesystem::path _path;
};

// Host file helpers
void writeHostFile(const std::filesystem::path& path, const std::string& contents);
std::string readHostFile(const std::filesystem::path& path);

// Provider helpers
std::string readText(Ferry::Core::Storage::IStorageProvider& provider, const std::string& path);
Ferry::Core::Storage::StorageResult<Ferry::Core::Storage::Entry>
writeText(Ferry::Core::Storage::IStorageProvider& provider, const std::string& path, const std::string& contents);
std::vector<std::string> listNames(Ferry::Core::Storage::IStorageProvider& provider, const std::string& path);

inline std::span<const std::byte> asBytes(const std::string& text) {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

// Deterministic payload of the given size
std::string makePayload(size_t size, unsigned seed = 7);

// Sink that keeps every entry for assertions
class CapturingSink : public Ferry::Core::Logging::ILogSink
{
public:
    void write(const Ferry::Core::Logging::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
    }

    std::vector<Ferry::Core::Logging::LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    bool contains(Ferry::Core::Logging::LogLevel level, const std::string& fragment) const;

private:
    mutable std::mutex _mutex;
    std::vector<Ferry::Core::Logging::LogEntry> _entries;
};

// Installs a CapturingSink on the global logger for the lifetime of the scope
class ScopedLogCapture
{
public:
    ScopedLogCapture();
    ~ScopedLogCapture();

    CapturingSink& sink() noexcept {
        return *_sink;
    }

private:
    std::shared_ptr<CapturingSink> _sink;
    Ferry::Core::Logging::LogLevel _previousLevel;
};

/**
 * Provider decorator that injects failures and records concurrency.
 *
 * Failures are keyed by (operation, path). Each rule fails the next `times`
 * calls with `code`; a negative count fails forever.
 */
class FaultInjectingProvider : public Ferry::Core::Storage::IStorageProvider
{
public:
    enum class Op { List, Stat, OpenRead, Write, CreateDirectory, Remove, NativeMove };

    explicit FaultInjectingProvider(std::shared_ptr<Ferry::Core::Storage::IStorageProvider> inner);

    void failNext(Op op, const std::string& path, Ferry::Core::Storage::StorageError code, int times = 1);
    void setNativeMoveSupported(bool supported) {
        _nativeMoveSupported = supported;
    }
    void setMaxConcurrency(size_t limit) {
        _maxConcurrency = limit;
    }
    // Each write sleeps this long so overlapping calls can be observed
    void setWriteDelay(std::chrono::milliseconds delay) {
        _writeDelay = delay;
    }

    size_t callCount(Op op, const std::string& path) const;
    size_t peakConcurrentWrites() const noexcept {
        return _peakWrites.load();
    }

    Ferry::Core::Storage::StorageResult<std::vector<Ferry::Core::Storage::Entry>> list(const std::string& path) override;
    Ferry::Core::Storage::StorageResult<Ferry::Core::Storage::Entry> stat(const std::string& path) override;
    Ferry::Core::Storage::StorageResult<std::unique_ptr<Ferry::Core::Storage::ByteSource>> openRead(const std::string& path) override;
    Ferry::Core::Storage::StorageResult<Ferry::Core::Storage::Entry> write(const std::string& path,
                                                                         Ferry::Core::Storage::ByteSource& source,
                                                                         const Ferry::Core::Concurrency::CancellationToken& cancel,
                                                                         const Ferry::Core::Storage::WriteOptions& options) override;
    Ferry::Core::Storage::StorageStatus createDirectory(const std::string& path) override;
    Ferry::Core::Storage::StorageStatus remove(const std::string& path) override;
    Ferry::Core::Storage::StorageResult<Ferry::Core::Storage::Entry> nativeMove(const std::string& from, const std::string& to) override;

    Ferry::Core::Storage::ProviderCapabilities capabilities() const override;
    std::string providerType() const override {
        return _inner->providerType();
    }
    std::string resourceName() const override {
        return _inner->resourceName();
    }

    Ferry::Core::Storage::IStorageProvider& inner() noexcept {
        return *_inner;
    }

private:
    std::optional<Ferry::Core::Storage::StorageErrorInfo> consume(Op op, const std::string& path);

    struct Rule {
        Ferry::Core::Storage::StorageError code;
        int remaining;
    };

    std::shared_ptr<Ferry::Core::Storage::IStorageProvider> _inner;
    mutable std::mutex _mutex;
    std::map<std::pair<Op, std::string>, Rule> _rules;
    std::map<std::pair<Op, std::string>, size_t> _calls;
    std::optional<bool> _nativeMoveSupported;
    std::optional<size_t> _maxConcurrency;
    std::chrono::milliseconds _writeDelay{0};
    std::atomic<size_t> _activeWrites{0};
    std::atomic<size_t> _peakWrites{0};
};

// Byte source that fails after yielding `failAfter` bytes
class FailingByteSource : public Ferry::Core::Storage::ByteSource
{
public:
    FailingByteSource(std::string payload, size_t failAfter, Ferry::Core::Storage::StorageError code);

    Ferry::Core::Storage::IoResult read(std::span<std::byte> buffer) override;
    bool eof() const override {
        return false;
    }

private:
    std::string _payload;
    size_t _position = 0;
    size_t _failAfter;
    Ferry::Core::Storage::StorageError _code;
};

// Byte source that requests cancellation once `cancelAfter` bytes were read
class CancellingByteSource : public Ferry::Core::Storage::ByteSource
{
public:
    CancellingByteSource(std::string payload, size_t cancelAfter, Ferry::Core::Concurrency::CancellationSource& source);

    Ferry::Core::Storage::IoResult read(std::span<std::byte> buffer) override;
    bool eof() const override {
        return _position >= _payload.size();
    }

private:
    std::string _payload;
    size_t _position = 0;
    size_t _cancelAfter;
    Ferry::Core::Concurrency::CancellationSource& _source;
};

}  // namespace ferry::test_helpers
