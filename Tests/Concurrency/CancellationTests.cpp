/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "Concurrency/CancellationToken.h"
#include "Concurrency/CompletionChannel.h"

using namespace Ferry::Core::Concurrency;
using namespace std::chrono_literals;

TEST(CancellationTokenTests, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.waitFor(1ms));
}

TEST(CancellationTokenTests, CancelIsVisibleToAllTokens) {
    CancellationSource source;
    auto a = source.token();
    auto b = source.token();
    EXPECT_FALSE(a.isCancelled());

    source.cancel();
    source.cancel();  // idempotent
    EXPECT_TRUE(a.isCancelled());
    EXPECT_TRUE(b.isCancelled());
    EXPECT_TRUE(source.isCancelled());
}

TEST(CancellationTokenTests, CancelInterruptsWait) {
    CancellationSource source;
    auto token = source.token();

    std::thread canceller([&source] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(10s));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, 5s);
}

TEST(CompletionChannelTests, DeliversInOrderAcrossThreads) {
    CompletionChannel<int> channel;
    std::thread producer([&channel] {
        for (int i = 0; i < 100; ++i) channel.push(i);
    });
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(channel.pop(), i);
    }
    producer.join();
    EXPECT_FALSE(channel.tryPop().has_value());
}
