/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <gtest/gtest.h>

#include <common/logger/logger.hpp>

using namespace testing;

namespace bootkit::common::logger {

class LoggerTest : public Test {
protected:
    void TearDown() override { unsetenv(cLogLevelEnv); }
};

TEST_F(LoggerTest, ParseLogLevel)
{
    const std::vector<std::pair<std::string, LogLevelEnum>> testData = {
        {"debug", LogLevelEnum::eDebug},
        {"INFO", LogLevelEnum::eInfo},
        {"warn", LogLevelEnum::eWarning},
        {"Warning", LogLevelEnum::eWarning},
        {" error ", LogLevelEnum::eError},
    };

    for (const auto& [value, expected] : testData) {
        auto [level, err] = Logger::ParseLogLevel(value);

        ASSERT_TRUE(err.IsNone()) << value;
        EXPECT_EQ(level.GetValue(), expected) << value;
    }
}

TEST_F(LoggerTest, ParseInvalidLogLevel)
{
    for (const auto& value : {"", "verbose", "5"}) {
        auto [level, err] = Logger::ParseLogLevel(value);

        EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument)) << value;
    }
}

TEST_F(LoggerTest, EnvLogLevel)
{
    ASSERT_EQ(setenv(cLogLevelEnv, "debug", 1), 0);

    EXPECT_EQ(Logger::GetEnvLogLevel().GetValue(), LogLevelEnum::eDebug);
}

TEST_F(LoggerTest, InvalidEnvLogLevelFallsBackToDefault)
{
    ASSERT_EQ(setenv(cLogLevelEnv, "loud", 1), 0);

    EXPECT_EQ(Logger::GetEnvLogLevel().GetValue(), LogLevelEnum::eInfo);
}

TEST_F(LoggerTest, NoEnvLogLevel)
{
    unsetenv(cLogLevelEnv);

    EXPECT_EQ(Logger::GetEnvLogLevel().GetValue(), LogLevelEnum::eInfo);
}

TEST_F(LoggerTest, Init)
{
    Logger logger;

    logger.SetLogLevel(LogLevelEnum::eDebug);

    EXPECT_TRUE(logger.Init().IsNone());

    LOG_DBG() << "Logger initialized";
}

} // namespace bootkit::common::logger
