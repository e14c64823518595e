/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include <filesystem>
#include "Storage/LocalFileSystemProvider.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace ferry::test_helpers;

namespace {

size_t countStagingFiles(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (LocalFileSystemProvider::isStagingName(entry.path().filename().string())) ++count;
    }
    return count;
}

}  // namespace

class LocalFileSystemProviderTests : public ::testing::Test
{
protected:
    void SetUp() override {
        writeHostFile(tmp.join("home/user/a.txt"), "alpha");
        writeHostFile(tmp.join("home/user/sub/x"), "x-data");
        std::filesystem::create_directories(tmp.join("empty"));
        provider = std::make_unique<LocalFileSystemProvider>(tmp.path());
        provider->setId("local-1");
    }

    ScopedTempDir tmp;
    std::unique_ptr<LocalFileSystemProvider> provider;
};

TEST_F(LocalFileSystemProviderTests, ConstructionRejectsMissingRoot) {
    EXPECT_THROW({ LocalFileSystemProvider missing(tmp.join("nope")); }, ConfigurationError);
    EXPECT_THROW({ LocalFileSystemProvider file(tmp.join("home/user/a.txt")); }, ConfigurationError);
}

TEST_F(LocalFileSystemProviderTests, ListReportsKindsSizesAndProvider) {
    auto listing = provider->list("/home/user");
    ASSERT_TRUE(listing.ok()) << listing.error().describe();
    ASSERT_EQ(listing.value().size(), 2u);

    for (const auto& entry : listing.value()) {
        EXPECT_EQ(entry.providerId, "local-1");
        if (entry.name == "a.txt") {
            EXPECT_TRUE(entry.isFile());
            EXPECT_EQ(entry.path, "/home/user/a.txt");
            ASSERT_TRUE(entry.size.has_value());
            EXPECT_EQ(*entry.size, 5u);
        } else {
            EXPECT_EQ(entry.name, "sub");
            EXPECT_TRUE(entry.isDirectory());
        }
    }
}

TEST_F(LocalFileSystemProviderTests, ListErrors) {
    EXPECT_EQ(provider->list("/missing").code(), StorageError::NotFound);
    EXPECT_EQ(provider->list("/home/user/a.txt").code(), StorageError::InvalidPath);
    auto empty = provider->list("/empty");
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(LocalFileSystemProviderTests, ParentSegmentsCannotEscapeRoot) {
    auto native = provider->toNative("/../../etc/passwd");
    EXPECT_EQ(native, provider->root() / "etc" / "passwd");
    EXPECT_EQ(provider->stat("/../home/user/a.txt").value().path, "/home/user/a.txt");
}

TEST_F(LocalFileSystemProviderTests, StatAndRead) {
    auto entry = provider->stat("/home/user/sub/x");
    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().name, "x");
    EXPECT_TRUE(entry.value().lastModified.has_value());
    EXPECT_EQ(readText(*provider, "/home/user/sub/x"), "x-data");

    EXPECT_EQ(provider->stat("/home/ghost").code(), StorageError::NotFound);
    EXPECT_EQ(provider->openRead("/home/ghost").code(), StorageError::NotFound);
    EXPECT_EQ(provider->openRead("/home/user/sub").code(), StorageError::InvalidPath);
}

TEST_F(LocalFileSystemProviderTests, WriteCreatesFileAndRefusesOverwrite) {
    auto payload = makePayload(300 * 1024);
    auto written = writeText(*provider, "/empty/blob.bin", payload);
    ASSERT_TRUE(written.ok()) << written.error().describe();
    EXPECT_EQ(*written.value().size, payload.size());
    EXPECT_EQ(readHostFile(tmp.join("empty/blob.bin")), payload);

    auto again = writeText(*provider, "/empty/blob.bin", "other");
    EXPECT_EQ(again.code(), StorageError::AlreadyExists);
    EXPECT_EQ(readHostFile(tmp.join("empty/blob.bin")), payload);
    EXPECT_EQ(countStagingFiles(tmp.path()), 0u);
}

TEST_F(LocalFileSystemProviderTests, WriteRequiresExistingParent) {
    EXPECT_EQ(writeText(*provider, "/nowhere/file", "z").code(), StorageError::NotFound);
    EXPECT_EQ(writeText(*provider, "/", "z").code(), StorageError::InvalidPath);
}

TEST_F(LocalFileSystemProviderTests, FailedWriteLeavesNothingBehind) {
    FailingByteSource source(makePayload(4096), 1000, StorageError::ProviderUnavailable);
    WriteOptions options;
    options.chunkSize = 256;
    auto result = provider->write("/empty/broken", source, Concurrency::CancellationToken{}, options);

    EXPECT_EQ(result.code(), StorageError::ProviderUnavailable);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("empty/broken")));
    EXPECT_EQ(countStagingFiles(tmp.path()), 0u);
}

TEST_F(LocalFileSystemProviderTests, CancelledWriteLeavesNothingBehind) {
    Concurrency::CancellationSource cancel;
    CancellingByteSource source(makePayload(8192), 512, cancel);
    WriteOptions options;
    options.chunkSize = 128;
    auto result = provider->write("/empty/cancelled", source, cancel.token(), options);

    EXPECT_EQ(result.code(), StorageError::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("empty/cancelled")));
    EXPECT_EQ(countStagingFiles(tmp.path()), 0u);
}

TEST_F(LocalFileSystemProviderTests, ProgressReportsRunningTotal) {
    std::vector<uint64_t> progress;
    MemoryByteSource source(makePayload(1000));
    WriteOptions options;
    options.chunkSize = 400;
    options.progressCallback = [&](uint64_t bytes) { progress.push_back(bytes); };
    ASSERT_TRUE(provider->write("/empty/p", source, Concurrency::CancellationToken{}, options).ok());
    EXPECT_EQ(progress, (std::vector<uint64_t>{400, 800, 1000}));
}

TEST_F(LocalFileSystemProviderTests, StagingFilesAreHiddenFromListings) {
    writeHostFile(tmp.join("empty/.x.ferrypart.abc123"), "partial");
    EXPECT_TRUE(listNames(*provider, "/empty").empty());
}

TEST_F(LocalFileSystemProviderTests, CreateDirectorySemantics) {
    EXPECT_TRUE(provider->createDirectory("/empty/new").ok());
    EXPECT_TRUE(provider->createDirectory("/empty/new").ok()) << "Existing directory is success";
    EXPECT_EQ(provider->createDirectory("/home/user/a.txt").code(), StorageError::AlreadyExists);
    EXPECT_EQ(provider->createDirectory("/absent/child").code(), StorageError::NotFound);
    EXPECT_TRUE(std::filesystem::is_directory(tmp.join("empty/new")));
}

TEST_F(LocalFileSystemProviderTests, RemoveSemantics) {
    EXPECT_EQ(provider->remove("/home/user/sub").code(), StorageError::NotEmpty);
    EXPECT_TRUE(provider->remove("/home/user/sub/x").ok());
    EXPECT_TRUE(provider->remove("/home/user/sub").ok());
    EXPECT_EQ(provider->remove("/home/user/sub").code(), StorageError::NotFound);
    EXPECT_EQ(provider->remove("/").code(), StorageError::PermissionDenied);
}

TEST_F(LocalFileSystemProviderTests, NativeMoveRenames) {
    EXPECT_TRUE(provider->capabilities().supportsNativeMove);
    auto moved = provider->nativeMove("/home/user/sub", "/empty/sub");
    ASSERT_TRUE(moved.ok()) << moved.error().describe();
    EXPECT_TRUE(moved.value().isDirectory());
    EXPECT_EQ(readText(*provider, "/empty/sub/x"), "x-data");
    EXPECT_FALSE(std::filesystem::exists(tmp.join("home/user/sub")));
}

TEST_F(LocalFileSystemProviderTests, NativeMoveRefusesConflictsAndSelfNesting) {
    EXPECT_EQ(provider->nativeMove("/home/user/a.txt", "/home/user/sub/x").code(), StorageError::AlreadyExists);
    EXPECT_EQ(provider->nativeMove("/home/user", "/home/user/sub/inner").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->nativeMove("/ghost", "/empty/ghost").code(), StorageError::NotFound);
}

TEST_F(LocalFileSystemProviderTests, DescribesItself) {
    EXPECT_EQ(provider->providerType(), "local");
    EXPECT_EQ(provider->resourceName(), provider->root().string());
    EXPECT_FALSE(provider->capabilities().isRemote);
}

TEST_F(LocalFileSystemProviderTests, SymlinksAreListedAsLeavesAndNeverFollowed) {
    writeHostFile(tmp.join("outside/secret.txt"), "secret");
    std::filesystem::create_directory_symlink(tmp.join("outside"), tmp.join("home/user/dirlink"));
    std::filesystem::create_symlink(tmp.join("outside/secret.txt"), tmp.join("home/user/filelink"));

    auto listing = provider->list("/home/user");
    ASSERT_TRUE(listing.ok()) << listing.error().describe();
    size_t links = 0;
    for (const auto& entry : listing.value()) {
        if (entry.name == "dirlink" || entry.name == "filelink") {
            ++links;
            EXPECT_TRUE(entry.isSymlink) << entry.name;
            EXPECT_TRUE(entry.isFile()) << entry.name;
        }
    }
    EXPECT_EQ(links, 2u);

    EXPECT_EQ(provider->list("/home/user/dirlink").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->stat("/home/user/dirlink/secret.txt").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->openRead("/home/user/dirlink/secret.txt").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->openRead("/home/user/filelink").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->remove("/home/user/dirlink/secret.txt").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->createDirectory("/home/user/dirlink/new").code(), StorageError::InvalidPath);
    EXPECT_EQ(writeText(*provider, "/home/user/dirlink/new.txt", "x").code(), StorageError::InvalidPath);
    EXPECT_FALSE(std::filesystem::exists(tmp.join("outside/new.txt")));
}

TEST_F(LocalFileSystemProviderTests, RemovingSymlinkKeepsTarget) {
    writeHostFile(tmp.join("outside/secret.txt"), "secret");
    std::filesystem::create_directory_symlink(tmp.join("outside"), tmp.join("home/user/dirlink"));

    ASSERT_TRUE(provider->remove("/home/user/dirlink").ok());
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(tmp.join("home/user/dirlink"))));
    EXPECT_EQ(readHostFile(tmp.join("outside/secret.txt")), "secret");
}
