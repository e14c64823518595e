/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include "Logging/Logger.h"
#include "TestHelpers/FerryTestHelpers.h"

using namespace Ferry::Core::Logging;
using ferry::test_helpers::CapturingSink;

TEST(LoggerTests, EntriesBelowMinimumLevelAreDropped) {
    Logger logger;
    auto sink = std::make_shared<CapturingSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Warning);

    logger.info("Test", "quiet");
    logger.warning("Test", "loud");
    logger.error("Test", "louder");

    auto entries = sink->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "loud");
    EXPECT_EQ(entries[0].category, "Test");
    EXPECT_EQ(entries[1].level, LogLevel::Error);
}

TEST(LoggerTests, SinkLevelFiltersIndependently) {
    Logger logger;
    logger.setMinLevel(LogLevel::Trace);
    auto everything = std::make_shared<CapturingSink>();
    auto errorsOnly = std::make_shared<CapturingSink>();
    errorsOnly->setMinLevel(LogLevel::Error);
    logger.addSink(everything);
    logger.addSink(errorsOnly);

    logger.debug("Cat", "detail");
    logger.fatal("Cat", "stop");

    EXPECT_EQ(everything->entries().size(), 2u);
    ASSERT_EQ(errorsOnly->entries().size(), 1u);
    EXPECT_EQ(errorsOnly->entries()[0].level, LogLevel::Fatal);
}

TEST(LoggerTests, RemovedSinkReceivesNothing) {
    Logger logger;
    auto sink = std::make_shared<CapturingSink>();
    logger.addSink(sink);
    EXPECT_EQ(logger.sinkCount(), 1u);
    logger.removeSink(sink);
    EXPECT_EQ(logger.sinkCount(), 0u);

    logger.error("Cat", "unheard");
    EXPECT_TRUE(sink->entries().empty());
}

TEST(LoggerTests, MacrosUseCategoryAndRespectGlobalLevel) {
    ferry::test_helpers::ScopedLogCapture capture;
    FERRY_LOG_WARNING_CAT("Transfer", "disk almost full");
    FERRY_LOG_INFO("plain message");

    EXPECT_TRUE(capture.sink().contains(LogLevel::Warning, "disk almost full"));
    auto entries = capture.sink().entries();
    bool sawFunctionCategory = false;
    for (const auto& e : entries) {
        if (e.message == "plain message") sawFunctionCategory = !e.category.empty();
    }
    EXPECT_TRUE(sawFunctionCategory);
}

TEST(LoggerTests, ParseLogLevelAcceptsNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("fatal"), LogLevel::Fatal);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(LoggerTests, ConfigureFromEnvironmentAppliesLevel) {
    Logger logger;
    ::setenv("FERRY_LOG_LEVEL", "error", 1);
    logger.configureFromEnvironment();
    EXPECT_EQ(logger.minLevel(), LogLevel::Error);

    ::setenv("FERRY_LOG_LEVEL", "bogus", 1);
    logger.configureFromEnvironment();
    EXPECT_EQ(logger.minLevel(), LogLevel::Error) << "Malformed values leave the level unchanged";
    ::unsetenv("FERRY_LOG_LEVEL");
}
