/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <core/common/tests/utils/utils.hpp>

#include <common/utils/time.hpp>

using namespace testing;

namespace bootkit::common::utils {

TEST(TimeTest, ParseDuration)
{
    const std::vector<std::pair<std::string, Duration>> testData = {
        {"30s", Time::cSeconds * 30},
        {"1 sec", Time::cSeconds},
        {"15   SECOND", Time::cSeconds * 15},
        {"5m", Time::cMinutes * 5},
        {"2 Min", Time::cMinutes * 2},
        {"10minute", Time::cMinutes * 10},
        {"1h", Time::cHours},
        {" 3 hour ", Time::cHours * 3},
    };

    for (const auto& [value, expected] : testData) {
        auto [duration, err] = ParseDuration(value);

        ASSERT_TRUE(err.IsNone()) << value << ": " << aos::tests::utils::ErrorToStr(err);
        EXPECT_EQ(duration, expected) << value;
    }
}

TEST(TimeTest, ParseTooLongDuration)
{
    for (const auto& value : {"3000000h", "200000000 min", "10000000000s"}) {
        auto [duration, err] = ParseDuration(value);

        EXPECT_TRUE(err.Is(ErrorEnum::eOutOfRange)) << value;
    }

    auto [duration, err] = ParseDuration("2000000h");

    ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);
    EXPECT_TRUE(duration > Duration());
}

TEST(TimeTest, ParseInvalidDuration)
{
    for (const auto& value : {"", "   ", "0s", "-5s", "5", "s", "5 days", "5ms", "1.5h", "h5", "99999999999999999999s"}) {
        auto [duration, err] = ParseDuration(value);

        EXPECT_FALSE(err.IsNone()) << value;
    }
}

} // namespace bootkit::common::utils
