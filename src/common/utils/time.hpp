/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_TIME_HPP_
#define BOOTKIT_COMMON_UTILS_TIME_HPP_

#include <chrono>
#include <string>

#include <common/types.hpp>

namespace bootkit::common::utils {

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses duration from string.
 *
 * Duration is a positive integer followed by optional whitespaces and a case insensitive unit:
 * s, sec, second, m, min, minute, h, hour.
 *
 * @param duration duration string.
 * @return parsed duration.
 */
RetWithError<Duration> ParseDuration(const std::string& duration);

/**
 * Converts duration to std::chrono milliseconds.
 *
 * @param duration duration.
 * @return std::chrono::milliseconds.
 */
inline std::chrono::milliseconds ToChrono(Duration duration)
{
    return std::chrono::milliseconds(duration.Milliseconds());
}

} // namespace bootkit::common::utils

#endif
