/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include "Panes/Pane.h"
#include "Storage/MemoryObjectStoreClient.h"
#include "Storage/ObjectStoreProvider.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core;
using namespace Ferry::Core::Panes;
using namespace Ferry::Core::Storage;
using namespace ferry::test_helpers;

class PaneTests : public ::testing::Test
{
protected:
    void SetUp() override {
        client = std::make_shared<MemoryObjectStoreClient>("pane-bucket");
        client->putObject("docs/a.txt", "a");
        client->putObject("docs/b.txt", "bb");
        client->putObject("docs/c/inner", "c");
        inner = std::make_shared<ObjectStoreProvider>(client);
        provider = std::make_shared<FaultInjectingProvider>(inner);
        provider->setId("bucket-1");
    }

    std::shared_ptr<MemoryObjectStoreClient> client;
    std::shared_ptr<ObjectStoreProvider> inner;
    std::shared_ptr<FaultInjectingProvider> provider;
};

TEST_F(PaneTests, ConstructionDoesNotList) {
    Pane pane(provider, "/docs/");
    EXPECT_EQ(pane.currentPath(), "/docs");
    EXPECT_TRUE(pane.entries().empty());
    EXPECT_EQ(provider->callCount(FaultInjectingProvider::Op::List, "/docs"), 0u);
    EXPECT_THROW(Pane(nullptr, "/"), std::invalid_argument);
}

TEST_F(PaneTests, RefreshLoadsEntriesAndTitle) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    ASSERT_EQ(pane.entries().size(), 3u);
    EXPECT_EQ(pane.entryUnderCursor()->name, "a.txt");
    EXPECT_EQ(pane.providerId(), "bucket-1");
    EXPECT_EQ(pane.title(), "pane-bucket@bucket:/docs");
}

TEST_F(PaneTests, CursorWrapsBothWays) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.moveCursor(-1);
    EXPECT_EQ(pane.cursorIndex(), 2u);
    pane.moveCursor(1);
    EXPECT_EQ(pane.cursorIndex(), 0u);
    pane.moveCursor(7);
    EXPECT_EQ(pane.cursorIndex(), 1u);
    EXPECT_FALSE(pane.setCursor(3));
    EXPECT_TRUE(pane.setCursorToPath("/docs/c"));
    EXPECT_EQ(pane.cursorIndex(), 2u);
}

TEST_F(PaneTests, MarkTogglesAndReplaces) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());

    EXPECT_TRUE(pane.toggleMark("/docs/a.txt", OperationKind::Copy));
    EXPECT_EQ(pane.markFor("/docs/a.txt")->kind, OperationKind::Copy);

    EXPECT_TRUE(pane.toggleMark("/docs/a.txt", OperationKind::Move));
    EXPECT_EQ(pane.marks().size(), 1u) << "A different kind replaces";
    EXPECT_EQ(pane.markFor("/docs/a.txt")->kind, OperationKind::Move);

    EXPECT_TRUE(pane.toggleMark("/docs/a.txt", OperationKind::Move));
    EXPECT_FALSE(pane.hasMarks()) << "The same kind toggles off";

    EXPECT_FALSE(pane.toggleMark("/docs/zzz", OperationKind::Copy));
}

TEST_F(PaneTests, MarkRequestsFollowListingOrder) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.toggleMark("/docs/c", OperationKind::Delete);
    pane.toggleMark("/docs/a.txt", OperationKind::Copy);

    auto requests = pane.markRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].entry.path, "/docs/a.txt");
    EXPECT_EQ(requests[0].kind, OperationKind::Copy);
    EXPECT_EQ(requests[1].entry.path, "/docs/c");
    EXPECT_TRUE(requests[1].entry.isDirectory());
}

TEST_F(PaneTests, RefreshDropsMarksForVanishedEntriesAndClampsCursor) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.toggleMark("/docs/a.txt", OperationKind::Copy);
    pane.toggleMark("/docs/c", OperationKind::Copy);
    pane.setCursor(2);

    ASSERT_TRUE(inner->remove("/docs/c/inner").ok());
    ASSERT_TRUE(inner->remove("/docs/c").ok());
    ASSERT_TRUE(pane.refresh().ok());

    EXPECT_EQ(pane.entries().size(), 2u);
    EXPECT_TRUE(pane.markFor("/docs/a.txt").has_value());
    EXPECT_FALSE(pane.markFor("/docs/c").has_value());
    EXPECT_EQ(pane.cursorIndex(), 1u);
}

TEST_F(PaneTests, ListingErrorKeepsPreviousEntries) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.toggleMark("/docs/b.txt", OperationKind::Copy);

    provider->failNext(FaultInjectingProvider::Op::List, "/docs", StorageError::ProviderUnavailable);
    auto status = pane.refresh();
    EXPECT_EQ(status.code(), StorageError::ProviderUnavailable);
    EXPECT_EQ(pane.entries().size(), 3u);
    EXPECT_TRUE(pane.hasMarks());
    ASSERT_TRUE(pane.error().has_value());
    EXPECT_EQ(pane.error()->code, StorageError::ProviderUnavailable);

    ASSERT_TRUE(pane.refresh().ok());
    EXPECT_FALSE(pane.error().has_value());
}

TEST_F(PaneTests, ChangeDirectory) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.setCursor(1);
    pane.toggleMark("/docs/a.txt", OperationKind::Copy);

    ASSERT_TRUE(pane.changeDirectory("/docs/c").ok());
    EXPECT_EQ(pane.currentPath(), "/docs/c");
    EXPECT_EQ(pane.cursorIndex(), 0u);
    EXPECT_FALSE(pane.hasMarks()) << "Marks never outlive their listing";

    EXPECT_EQ(pane.changeDirectory("/nowhere").code(), StorageError::NotFound);
    EXPECT_EQ(pane.currentPath(), "/docs/c");
}

TEST_F(PaneTests, MarkFailureAndProcessingFlags) {
    Pane pane(provider, "/docs");
    ASSERT_TRUE(pane.refresh().ok());
    pane.toggleMark("/docs/a.txt", OperationKind::Move);
    pane.setMarkFailure("/docs/a.txt", StorageErrorInfo{StorageError::AlreadyExists, "exists", "/a.txt", std::nullopt});
    EXPECT_EQ(pane.markFor("/docs/a.txt")->failure->code, StorageError::AlreadyExists);

    pane.setProcessing({"/docs/a.txt"});
    EXPECT_TRUE(pane.isProcessing("/docs/a.txt"));
    pane.clearProcessing();
    EXPECT_FALSE(pane.isProcessing("/docs/a.txt"));

    pane.markStale();
    EXPECT_TRUE(pane.isStale());
    ASSERT_TRUE(pane.refresh().ok());
    EXPECT_FALSE(pane.isStale());
}
