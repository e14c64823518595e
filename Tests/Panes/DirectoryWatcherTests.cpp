/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include "Panes/DirectoryWatcher.h"
#include "TestHelpers/FerryTestHelpers.h"
#include <chrono>
#include <thread>

using namespace Ferry::Core::Panes;
using namespace ferry::test_helpers;

TEST(DirectoryWatcherTests, WatchesExistingDirectoriesOnly) {
    ScopedTempDir tmp;
    DirectoryWatcher watcher;
    EXPECT_TRUE(watcher.watch("left", tmp.path()));
    EXPECT_TRUE(watcher.isWatching("left"));

    ScopedLogCapture capture;
    EXPECT_FALSE(watcher.watch("right", tmp.join("missing")));
    EXPECT_FALSE(watcher.isWatching("right"));
    EXPECT_EQ(watcher.watchCount(), 1u);
}

TEST(DirectoryWatcherTests, RewatchingAKeyReplacesTheWatch) {
    ScopedTempDir tmp;
    std::filesystem::create_directories(tmp.join("a"));
    std::filesystem::create_directories(tmp.join("b"));
    DirectoryWatcher watcher;
    ASSERT_TRUE(watcher.watch("left", tmp.join("a")));
    ASSERT_TRUE(watcher.watch("left", tmp.join("b")));
    EXPECT_EQ(watcher.watchCount(), 1u);

    watcher.unwatch("left");
    EXPECT_EQ(watcher.watchCount(), 0u);
    watcher.unwatch("left");
}

TEST(DirectoryWatcherTests, ChangeRightAfterWatchIsNoticed) {
    ScopedTempDir tmp;
    DirectoryWatcher watcher;
    for (int round = 0; round < 5; ++round) {
        auto dir = tmp.join("round" + std::to_string(round));
        std::filesystem::create_directories(dir);
        ASSERT_TRUE(watcher.watch("left", dir));
        writeHostFile(dir / "new.txt", "hello");

        bool noticed = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!noticed && std::chrono::steady_clock::now() < deadline) {
            noticed = watcher.consumeChanged("left");
            if (!noticed) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        EXPECT_TRUE(noticed) << "round " << round;
    }
}

TEST(DirectoryWatcherTests, ChangeFlagIsConsumedOnce) {
    DirectoryWatcher watcher;
    EXPECT_FALSE(watcher.consumeChanged("left"));
    watcher.notifyChanged("left");
    watcher.notifyChanged("left");
    EXPECT_TRUE(watcher.consumeChanged("left"));
    EXPECT_FALSE(watcher.consumeChanged("left"));
    EXPECT_FALSE(watcher.consumeChanged("right"));
}

TEST(DirectoryWatcherTests, UnwatchClearsPendingChange) {
    ScopedTempDir tmp;
    DirectoryWatcher watcher;
    ASSERT_TRUE(watcher.watch("left", tmp.path()));
    watcher.notifyChanged("left");
    watcher.unwatch("left");
    EXPECT_FALSE(watcher.consumeChanged("left"));
}
