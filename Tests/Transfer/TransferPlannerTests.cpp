/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "Transfer/TransferPlanner.h"
#include "Storage/LocalFileSystemProvider.h"
#include "Storage/MemoryObjectStoreClient.h"
#include "Storage/ObjectStoreProvider.h"
#include "Storage/StoragePath.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core;
using namespace Ferry::Core::Storage;
using namespace Ferry::Core::Transfer;
using namespace ferry::test_helpers;

class TransferPlannerTests : public ::testing::Test
{
protected:
    void SetUp() override {
        writeHostFile(tmp.join("home/user/a.txt"), "alpha");
        writeHostFile(tmp.join("home/user/sub/x"), "x");
        writeHostFile(tmp.join("home/user/sub/deeper/y"), "y");
        std::filesystem::create_directories(tmp.join("dest"));

        local = std::make_shared<FaultInjectingProvider>(std::make_shared<LocalFileSystemProvider>(tmp.path()));
        registry.add(local, ProviderId("local"));
        bucket = std::make_shared<ObjectStoreProvider>(std::make_shared<MemoryObjectStoreClient>("bucket"));
        registry.add(bucket, ProviderId("bucket"));
    }

    MarkRequest mark(const std::string& path, OperationKind kind) {
        auto entry = local->stat(path);
        EXPECT_TRUE(entry.ok()) << path;
        return MarkRequest{entry.value(), kind};
    }

    PlanRequest request(std::vector<MarkRequest> marks, const ProviderId& destination, const std::string& root) {
        return PlanRequest{"local", std::move(marks), destination, root};
    }

    static const TransferTask* findTask(const TransferPlan& plan, TaskKind kind, const std::string& sourcePath) {
        for (const auto& task : plan.tasks) {
            if (task.kind == kind && task.sourcePath == sourcePath) return &task;
        }
        return nullptr;
    }

    ScopedTempDir tmp;
    ProviderRegistry registry;
    std::shared_ptr<FaultInjectingProvider> local;
    std::shared_ptr<ObjectStoreProvider> bucket;
};

TEST_F(TransferPlannerTests, FileCopyIsOneTask) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/a.txt", OperationKind::Copy)}, "bucket", "/"));

    ASSERT_EQ(plan.size(), 1u);
    const auto& task = plan.tasks[0];
    EXPECT_EQ(task.kind, TaskKind::CopyBytes);
    EXPECT_EQ(task.sourcePath, "/home/user/a.txt");
    EXPECT_EQ(task.destinationProviderId, ProviderId("bucket"));
    EXPECT_EQ(task.destinationPath, std::optional<std::string>("/a.txt"));
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_TRUE(task.dependsOn.empty());
}

TEST_F(TransferPlannerTests, DirectoryCopyCreatesParentsFirst) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Copy)}, "bucket", "/backup"));

    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan.tasks[0].kind, TaskKind::CreateDir);
    EXPECT_EQ(plan.tasks[0].destinationPath, std::optional<std::string>("/backup/sub"));

    auto* deeper = findTask(plan, TaskKind::CreateDir, "/home/user/sub/deeper");
    auto* y = findTask(plan, TaskKind::CopyBytes, "/home/user/sub/deeper/y");
    auto* x = findTask(plan, TaskKind::CopyBytes, "/home/user/sub/x");
    ASSERT_TRUE(deeper && x && y);
    EXPECT_EQ(x->dependsOn, std::vector<TaskId>{0});
    EXPECT_EQ(deeper->dependsOn, std::vector<TaskId>{0});
    EXPECT_EQ(y->dependsOn, std::vector<TaskId>{deeper->id});
    EXPECT_EQ(y->destinationPath, std::optional<std::string>("/backup/sub/deeper/y"));

    for (const auto& task : plan.tasks) {
        EXPECT_EQ(task.id, static_cast<TaskId>(&task - plan.tasks.data()));
        EXPECT_EQ(task.markPath, "/home/user/sub");
        for (TaskId dep : task.dependsOn) EXPECT_LT(dep, task.id);
    }
}

TEST_F(TransferPlannerTests, CrossProviderMoveDeletesAfterCopyInPostOrder) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Move)}, "bucket", "/"));

    // 4 copy tasks then 4 deletes
    ASSERT_EQ(plan.size(), 8u);
    auto* deleteY = findTask(plan, TaskKind::Delete, "/home/user/sub/deeper/y");
    auto* deleteDeeper = findTask(plan, TaskKind::Delete, "/home/user/sub/deeper");
    auto* deleteSub = findTask(plan, TaskKind::Delete, "/home/user/sub");
    auto* copyY = findTask(plan, TaskKind::CopyBytes, "/home/user/sub/deeper/y");
    ASSERT_TRUE(deleteY && deleteDeeper && deleteSub && copyY);

    EXPECT_NE(std::find(deleteY->dependsOn.begin(), deleteY->dependsOn.end(), copyY->id), deleteY->dependsOn.end());
    EXPECT_NE(std::find(deleteDeeper->dependsOn.begin(), deleteDeeper->dependsOn.end(), deleteY->id),
              deleteDeeper->dependsOn.end());
    EXPECT_EQ(deleteSub->id, plan.size() - 1) << "The marked directory is deleted last";
    EXPECT_FALSE(deleteSub->destinationPath.has_value());
}

TEST_F(TransferPlannerTests, DeleteOnlyPlanIgnoresDestination) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Delete)}, "unregistered", "/"));

    ASSERT_EQ(plan.size(), 4u);
    for (const auto& task : plan.tasks) EXPECT_EQ(task.kind, TaskKind::Delete);
    EXPECT_EQ(plan.tasks.back().sourcePath, "/home/user/sub");
    EXPECT_TRUE(plan.tasks[0].dependsOn.empty()) << "Leaves have no prerequisites";
}

TEST_F(TransferPlannerTests, SameProviderMoveUsesNativeMove) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Move)}, "local", "/dest"));

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.tasks[0].kind, TaskKind::NativeMove);
    EXPECT_EQ(plan.tasks[0].destinationPath, std::optional<std::string>("/dest/sub"));
    EXPECT_EQ(local->callCount(FaultInjectingProvider::Op::List, "/home/user/sub"), 0u) << "Subtree is not walked";
}

TEST_F(TransferPlannerTests, WithoutNativeMoveSameProviderMoveCopies) {
    local->setNativeMoveSupported(false);
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/a.txt", OperationKind::Move)}, "local", "/dest"));

    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan.tasks[0].kind, TaskKind::CopyBytes);
    EXPECT_EQ(plan.tasks[1].kind, TaskKind::Delete);
    EXPECT_EQ(plan.tasks[1].dependsOn, std::vector<TaskId>{0});
}

TEST_F(TransferPlannerTests, CopyIntoOwnSubtreeIsPlanningFailure) {
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Copy),
                                      mark("/home/user/a.txt", OperationKind::Copy)},
                                     "local", "/home/user/sub/deeper"));

    ASSERT_EQ(plan.planningFailures.size(), 1u);
    EXPECT_EQ(plan.planningFailures[0].markPath, "/home/user/sub");
    EXPECT_EQ(plan.planningFailures[0].error.code, StorageError::InvalidPath);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.tasks[0].sourcePath, "/home/user/a.txt");
}

TEST_F(TransferPlannerTests, EnumerationFailureSkipsOnlyThatMark) {
    local->failNext(FaultInjectingProvider::Op::List, "/home/user/sub/deeper", StorageError::PermissionDenied);
    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/a.txt", OperationKind::Copy),
                                      mark("/home/user/sub", OperationKind::Copy)},
                                     "bucket", "/"));

    ASSERT_EQ(plan.planningFailures.size(), 1u);
    EXPECT_EQ(plan.planningFailures[0].error.code, StorageError::PermissionDenied);
    EXPECT_EQ(plan.size(), 1u);
    EXPECT_TRUE(plan.tasksForMark("/home/user/sub").empty());
}

TEST_F(TransferPlannerTests, UnregisteredSourceIsFatal) {
    TransferPlanner planner(registry);
    ScopedLogCapture capture;
    PlanRequest bad{"ghost", {}, "bucket", "/"};
    EXPECT_THROW(planner.plan(bad), std::logic_error);
}

TEST_F(TransferPlannerTests, SymlinkedDirectoryIsNotEnumerated) {
    writeHostFile(tmp.join("keep/important.txt"), "important");
    std::filesystem::create_directory_symlink(tmp.join("keep"), tmp.join("home/user/sub/link"));

    TransferPlanner planner(registry);
    auto plan = planner.plan(request({mark("/home/user/sub", OperationKind::Delete)}, "", "/"));

    ASSERT_TRUE(plan.planningFailures.empty());
    EXPECT_NE(findTask(plan, TaskKind::Delete, "/home/user/sub/link"), nullptr);
    for (const auto& task : plan.tasks) {
        EXPECT_FALSE(Storage::StoragePath::isWithin(task.sourcePath, "/home/user/sub/link") &&
                     task.sourcePath != "/home/user/sub/link")
            << "Walked into the link: " << task.sourcePath;
    }
}
