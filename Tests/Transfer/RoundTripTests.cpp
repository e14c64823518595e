/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include "Transfer/TransferExecutor.h"
#include "Transfer/TransferPlanner.h"
#include "Storage/LocalBucketClient.h"
#include "Storage/LocalFileSystemProvider.h"
#include "Storage/MemoryObjectStoreClient.h"
#include "Storage/ObjectStoreProvider.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace Ferry::Core::Transfer;
using namespace ferry::test_helpers;

namespace {

std::shared_ptr<IStorageProvider> makeProvider(const std::string& kind, const std::filesystem::path& dir) {
    std::filesystem::create_directories(dir);
    if (kind == "local") return std::make_shared<LocalFileSystemProvider>(dir);
    if (kind == "memory") return std::make_shared<ObjectStoreProvider>(std::make_shared<MemoryObjectStoreClient>("mem"));
    return std::make_shared<ObjectStoreProvider>(std::make_shared<LocalBucketClient>(dir, "disk"));
}

}  // namespace

// Copies a tree A -> B -> A under a fresh name and compares every byte
class RoundTripTests : public ::testing::TestWithParam<std::tuple<std::string, std::string>>
{
protected:
    void SetUp() override {
        registry.add(makeProvider(std::get<0>(GetParam()), tmp.join("a")), ProviderId("a"));
        registry.add(makeProvider(std::get<1>(GetParam()), tmp.join("b")), ProviderId("b"));
        auto& a = *registry.require("a");
        ASSERT_TRUE(a.createDirectory("/tree").ok());
        ASSERT_TRUE(a.createDirectory("/tree/nested").ok());
        ASSERT_TRUE(a.createDirectory("/back").ok());
        ASSERT_TRUE(writeText(a, "/tree/big.bin", makePayload(600 * 1024, 11)).ok());
        ASSERT_TRUE(writeText(a, "/tree/empty", "").ok());
        ASSERT_TRUE(writeText(a, "/tree/nested/small", "tiny").ok());
    }

    TransferSummary copy(const ProviderId& from, const std::string& path, const ProviderId& to,
                         const std::string& root) {
        auto entry = registry.require(from)->stat(path);
        EXPECT_TRUE(entry.ok());
        PlanRequest request{from, {MarkRequest{entry.value(), OperationKind::Copy}}, to, root};
        TransferExecutor::Config config;
        config.chunkSize = 64 * 1024;
        TransferExecutor executor(registry, config);
        return executor.execute(TransferPlanner(registry).plan(request));
    }

    ScopedTempDir tmp;
    ProviderRegistry registry;
};

TEST_P(RoundTripTests, ContentIsByteIdentical) {
    ASSERT_TRUE(copy("a", "/tree", "b", "/").succeeded());
    ASSERT_TRUE(copy("b", "/tree", "a", "/back").succeeded());

    auto& a = *registry.require("a");
    for (const char* file : {"big.bin", "empty", "nested/small"}) {
        EXPECT_EQ(readText(a, std::string("/back/tree/") + file), readText(a, std::string("/tree/") + file)) << file;
    }
    EXPECT_EQ(listNames(a, "/back/tree"), listNames(a, "/tree"));
}

INSTANTIATE_TEST_SUITE_P(ProviderPairs, RoundTripTests,
                         ::testing::Combine(::testing::Values("local", "memory", "bucket"),
                                            ::testing::Values("local", "memory", "bucket")));
