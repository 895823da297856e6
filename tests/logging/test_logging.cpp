// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

/*
 * test_logging.cpp
 *
 * Tests for the logging setup
 * - Level name parsing
 * - Environment override of the configured level
 * - Installation of the default logger
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "logging/logging.hpp"

using namespace relata;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv(logging::LEVEL_ENV); }
    void TearDown() override { unsetenv(logging::LEVEL_ENV); }
};

TEST_F(LoggingTest, ParseLevel) {
    EXPECT_EQ(logging::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(logging::parseLevel("verbose"));
    EXPECT_FALSE(logging::parseLevel(""));
}

TEST_F(LoggingTest, EffectiveLevelFollowsSection) {
    config::LoggingSection section;
    section.level = "error";
    EXPECT_EQ(logging::effectiveLevel(section), spdlog::level::err);
}

TEST_F(LoggingTest, EnvironmentOverridesSection) {
    config::LoggingSection section;
    section.level = "error";
    setenv(logging::LEVEL_ENV, "trace", 1);
    EXPECT_EQ(logging::effectiveLevel(section), spdlog::level::trace);
}

TEST_F(LoggingTest, UnknownLevelFallsBackToInfo) {
    config::LoggingSection section;
    section.level = "chatty";
    EXPECT_EQ(logging::effectiveLevel(section), spdlog::level::info);
}

TEST_F(LoggingTest, InitializeInstallsDefaultLogger) {
    config::LoggingSection section;
    section.level = "debug";
    logging::initialize(section);

    auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), logging::LOGGER_NAME);
    EXPECT_EQ(logger->level(), spdlog::level::debug);

    section.level = "warn";
    logging::initialize(section);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
    EXPECT_EQ(spdlog::get(std::string(logging::LOGGER_NAME)),
              spdlog::default_logger());
}
