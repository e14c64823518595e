/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include "Storage/StoragePath.h"

namespace SP = Ferry::Core::Storage::StoragePath;

TEST(StoragePathTests, NormalizeCollapsesSeparatorsAndDots) {
    EXPECT_EQ(SP::normalize(""), "/");
    EXPECT_EQ(SP::normalize("/"), "/");
    EXPECT_EQ(SP::normalize("home//user/./docs/"), "/home/user/docs");
    EXPECT_EQ(SP::normalize("/home/user/../guest"), "/home/guest");
}

TEST(StoragePathTests, ParentTraversalStopsAtRoot) {
    EXPECT_EQ(SP::normalize("/../../etc"), "/etc");
    EXPECT_EQ(SP::join("/a", "../../b"), "/b");
}

TEST(StoragePathTests, ParentAndFilename) {
    EXPECT_EQ(SP::parent("/home/user/a.txt"), "/home/user");
    EXPECT_EQ(SP::parent("/home"), "/");
    EXPECT_EQ(SP::parent("/"), "/");
    EXPECT_EQ(SP::filename("/home/user/a.txt"), "a.txt");
    EXPECT_EQ(SP::filename("/"), "");
}

TEST(StoragePathTests, WithinRespectsSegmentBoundaries) {
    EXPECT_TRUE(SP::isWithin("/a/b", "/a"));
    EXPECT_TRUE(SP::isWithin("/a", "/a"));
    EXPECT_TRUE(SP::isWithin("/anything", "/"));
    EXPECT_FALSE(SP::isWithin("/ab", "/a"));
    EXPECT_FALSE(SP::isWithin("/a", "/a/b"));
}

TEST(StoragePathTests, RelativeTo) {
    EXPECT_EQ(SP::relativeTo("/home/user/sub/x", "/home/user"), "sub/x");
    EXPECT_EQ(SP::relativeTo("/home/user", "/home/user"), "");
    EXPECT_EQ(SP::relativeTo("/x/y", "/"), "x/y");
}

TEST(StoragePathTests, ValidNames) {
    EXPECT_TRUE(SP::isValidName("report.pdf"));
    EXPECT_TRUE(SP::isValidName(".hidden"));
    EXPECT_FALSE(SP::isValidName(""));
    EXPECT_FALSE(SP::isValidName(".."));
    EXPECT_FALSE(SP::isValidName("a/b"));
}
