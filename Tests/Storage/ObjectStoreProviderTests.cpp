/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include "Storage/ObjectStoreProvider.h"
#include "Storage/MemoryObjectStoreClient.h"
#include "Storage/LocalBucketClient.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace ferry::test_helpers;

// Every client must give the provider the same behaviour
class ObjectStoreProviderTests : public ::testing::TestWithParam<std::string>
{
protected:
    void SetUp() override {
        if (GetParam() == "memory") {
            client = std::make_shared<MemoryObjectStoreClient>("test-bucket");
        } else {
            client = std::make_shared<LocalBucketClient>(tmp.path(), "test-bucket");
        }
        provider = std::make_unique<ObjectStoreProvider>(client);
        provider->setId("bucket-1");

        seed("docs/readme.md", "read me");
        seed("docs/img/logo.png", "png");
        seed("top.txt", "top");
    }

    void seed(const std::string& key, const std::string& body) {
        auto upload = client->createUpload(key, false);
        ASSERT_TRUE(upload.ok());
        ASSERT_TRUE(upload.value()->appendPart(asBytes(body)).ok());
        ASSERT_TRUE(upload.value()->commit().ok());
    }

    bool hasKey(const std::string& key) {
        return client->headObject(key).ok();
    }

    ScopedTempDir tmp;
    std::shared_ptr<IObjectStoreClient> client;
    std::unique_ptr<ObjectStoreProvider> provider;
};

TEST_P(ObjectStoreProviderTests, ListingDerivesDirectoriesFromPrefixes) {
    auto root = provider->list("/");
    ASSERT_TRUE(root.ok()) << root.error().describe();
    ASSERT_EQ(root.value().size(), 2u);
    EXPECT_EQ(root.value()[0].name, "docs");
    EXPECT_TRUE(root.value()[0].isDirectory());
    EXPECT_EQ(root.value()[1].name, "top.txt");
    EXPECT_TRUE(root.value()[1].isFile());
    EXPECT_EQ(*root.value()[1].size, 3u);
    EXPECT_EQ(root.value()[1].providerId, "bucket-1");

    EXPECT_EQ(listNames(*provider, "/docs"), (std::vector<std::string>{"img", "readme.md"}));
}

TEST_P(ObjectStoreProviderTests, ListingErrors) {
    EXPECT_EQ(provider->list("/nothing").code(), StorageError::NotFound);
    EXPECT_EQ(provider->list("/top.txt").code(), StorageError::InvalidPath);
}

TEST_P(ObjectStoreProviderTests, StatDistinguishesFilesAndDirectories) {
    EXPECT_TRUE(provider->stat("/docs/readme.md").value().isFile());
    EXPECT_TRUE(provider->stat("/docs/img").value().isDirectory());
    EXPECT_TRUE(provider->stat("/").value().isDirectory());
    EXPECT_EQ(provider->stat("/docs/ghost").code(), StorageError::NotFound);
}

TEST_P(ObjectStoreProviderTests, ReadReturnsObjectBody) {
    EXPECT_EQ(readText(*provider, "/docs/readme.md"), "read me");
    EXPECT_EQ(provider->openRead("/docs").code(), StorageError::InvalidPath);
    EXPECT_EQ(provider->openRead("/missing").code(), StorageError::NotFound);
}

TEST_P(ObjectStoreProviderTests, WriteIsConditionalAndNeedsParent) {
    auto payload = makePayload(70 * 1024);
    auto written = writeText(*provider, "/docs/data.bin", payload);
    ASSERT_TRUE(written.ok()) << written.error().describe();
    EXPECT_EQ(readText(*provider, "/docs/data.bin"), payload);

    EXPECT_EQ(writeText(*provider, "/docs/data.bin", "again").code(), StorageError::AlreadyExists);
    EXPECT_EQ(writeText(*provider, "/docs", "clash").code(), StorageError::AlreadyExists);
    EXPECT_EQ(writeText(*provider, "/absent/file", "x").code(), StorageError::NotFound);
    EXPECT_EQ(writeText(*provider, "/top.txt/child", "x").code(), StorageError::NotFound);
}

TEST_P(ObjectStoreProviderTests, AbortedUploadLeavesNoObject) {
    FailingByteSource source(makePayload(4096), 1024, StorageError::ProviderUnavailable);
    WriteOptions options;
    options.chunkSize = 256;
    auto result = provider->write("/docs/partial", source, Concurrency::CancellationToken{}, options);
    EXPECT_EQ(result.code(), StorageError::ProviderUnavailable);
    EXPECT_FALSE(hasKey("docs/partial"));
    EXPECT_EQ(listNames(*provider, "/docs"), (std::vector<std::string>{"img", "readme.md"}));
}

TEST_P(ObjectStoreProviderTests, CreateDirectoryWritesMarker) {
    ASSERT_TRUE(provider->createDirectory("/fresh").ok());
    EXPECT_TRUE(hasKey("fresh/"));
    EXPECT_TRUE(provider->createDirectory("/fresh").ok());
    EXPECT_TRUE(provider->createDirectory("/docs").ok()) << "Implicit directory already exists";

    auto listing = provider->list("/fresh");
    ASSERT_TRUE(listing.ok());
    EXPECT_TRUE(listing.value().empty()) << "Marker is not listed as an entry";

    EXPECT_EQ(provider->createDirectory("/top.txt").code(), StorageError::AlreadyExists);
    EXPECT_EQ(provider->createDirectory("/a/b").code(), StorageError::NotFound);
}

TEST_P(ObjectStoreProviderTests, RemoveKeepsDirectorySemantics) {
    EXPECT_EQ(provider->remove("/docs").code(), StorageError::NotEmpty);
    ASSERT_TRUE(provider->remove("/docs/img/logo.png").ok());

    // The emptied directory is still there and now removable
    EXPECT_TRUE(provider->stat("/docs/img").value().isDirectory());
    ASSERT_TRUE(provider->remove("/docs/img").ok());
    EXPECT_EQ(provider->stat("/docs/img").code(), StorageError::NotFound);
    EXPECT_EQ(provider->remove("/docs/img").code(), StorageError::NotFound);
    EXPECT_EQ(provider->remove("/").code(), StorageError::PermissionDenied);
}

TEST_P(ObjectStoreProviderTests, NativeMoveIsUnsupported) {
    EXPECT_FALSE(provider->capabilities().supportsNativeMove);
    EXPECT_EQ(provider->nativeMove("/top.txt", "/docs/top.txt").code(), StorageError::Unsupported);
    EXPECT_TRUE(hasKey("top.txt"));
}

TEST_P(ObjectStoreProviderTests, DescribesItself) {
    EXPECT_EQ(provider->providerType(), "bucket");
    EXPECT_EQ(provider->resourceName(), "test-bucket");
}

INSTANTIATE_TEST_SUITE_P(Clients, ObjectStoreProviderTests, ::testing::Values("memory", "local-bucket"));

TEST(ObjectStoreProviderShadowTests, FileShadowedByDirectoryIsDropped) {
    auto client = std::make_shared<MemoryObjectStoreClient>("b");
    client->putObject("a", "file");
    client->putObject("a/b", "nested");
    ObjectStoreProvider provider(client);

    ScopedLogCapture capture;
    auto listing = provider.list("/");
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.value().size(), 1u);
    EXPECT_TRUE(listing.value()[0].isDirectory());
    EXPECT_TRUE(capture.sink().contains(Logging::LogLevel::Warning, "shadowed"));
}

TEST(ObjectStoreProviderShadowTests, NullClientIsRejected) {
    EXPECT_THROW(ObjectStoreProvider(nullptr), std::invalid_argument);
}

TEST(LocalBucketClientTests, SegmentsRoundTripThroughEscaping) {
    EXPECT_EQ(LocalBucketClient::escapeSegment("b c"), "b%20c");
    EXPECT_EQ(LocalBucketClient::escapeSegment(".hidden"), "%2Ehidden");
    EXPECT_EQ(LocalBucketClient::escapeSegment("a~"), "a%7E");
    EXPECT_EQ(LocalBucketClient::escapeSegment(""), "%");
    EXPECT_EQ(LocalBucketClient::unescapeSegment("b%20c"), std::optional<std::string>("b c"));
    EXPECT_EQ(LocalBucketClient::unescapeSegment("%"), std::optional<std::string>(""));
    EXPECT_FALSE(LocalBucketClient::unescapeSegment("bad%2").has_value());
}

TEST(LocalBucketClientTests, KeySegmentsMapToDirectories) {
    ScopedTempDir tmp;
    LocalBucketClient client(tmp.path(), "bucket");
    const auto& dir = client.bucketDirectory();
    EXPECT_EQ(client.objectPath("docs/img/logo.png"), dir / "docs~" / "img~" / "logo.png");
    EXPECT_EQ(client.objectPath("docs/"), dir / "docs~" / "%");
    EXPECT_EQ(client.objectPath("a//b"), dir / "a~" / "%~" / "b");
}

TEST(LocalBucketClientTests, DeepKeysAndFilePrefixClashesAreStored) {
    ScopedTempDir tmp;
    auto client = std::make_shared<LocalBucketClient>(tmp.path(), "bucket");
    std::string deep;
    for (int i = 0; i < 40; ++i) deep += "segment-number-" + std::to_string(i) + "/";
    deep += "leaf.txt";
    ASSERT_GT(deep.size(), 255u);

    for (const std::string key : {deep, std::string("a"), std::string("a/b"), std::string("a/")}) {
        auto upload = client->createUpload(key, true);
        ASSERT_TRUE(upload.ok()) << key;
        ASSERT_TRUE(upload.value()->appendPart(asBytes(key)).ok()) << key;
        auto committed = upload.value()->commit();
        ASSERT_TRUE(committed.ok()) << key << ": " << committed.error().describe();
    }

    auto listing = client->listObjects("", std::nullopt);
    ASSERT_TRUE(listing.ok()) << listing.error().describe();
    std::vector<std::string> keys;
    for (const auto& object : listing.value().objects) keys.push_back(object.key);
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "a/", "a/b", deep}));
    EXPECT_EQ(readText(*std::make_unique<ObjectStoreProvider>(client), "/" + deep), deep);
}

TEST(LocalBucketClientTests, DeletingLastKeyPrunesEmptyDirectories) {
    ScopedTempDir tmp;
    LocalBucketClient client(tmp.path(), "bucket");
    auto upload = client.createUpload("x/y/z", false);
    ASSERT_TRUE(upload.ok());
    ASSERT_TRUE(upload.value()->commit().ok());
    ASSERT_TRUE(std::filesystem::exists(client.bucketDirectory() / "x~" / "y~"));

    ASSERT_TRUE(client.deleteObject("x/y/z").ok());
    EXPECT_FALSE(std::filesystem::exists(client.bucketDirectory() / "x~"));
    EXPECT_TRUE(std::filesystem::exists(client.uploadsDirectory()));
    EXPECT_EQ(client.deleteObject("x/y/z").code(), StorageError::NotFound);
}

TEST(LocalBucketClientTests, ConditionalUploadRejectsExistingKey) {
    ScopedTempDir tmp;
    LocalBucketClient client(tmp.path(), "bucket");
    auto first = client.createUpload("k", true);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first.value()->commit().ok());

    auto second = client.createUpload("k", true);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value()->commit().code(), StorageError::AlreadyExists);
    EXPECT_TRUE(std::filesystem::is_empty(client.uploadsDirectory()));
}

TEST(LocalBucketClientTests, DeleteMissingKeyIsNotFound) {
    ScopedTempDir tmp;
    LocalBucketClient client(tmp.path(), "bucket");
    EXPECT_EQ(client.deleteObject("ghost").code(), StorageError::NotFound);
}
