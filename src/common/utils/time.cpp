/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <limits>
#include <unordered_map>

#include <Poco/NumberParser.h>
#include <Poco/String.h>

#include "time.hpp"

namespace bootkit::common::utils {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::unordered_map<std::string, Duration> cUnits = {
    {"s", Time::cSeconds},
    {"sec", Time::cSeconds},
    {"second", Time::cSeconds},
    {"m", Time::cMinutes},
    {"min", Time::cMinutes},
    {"minute", Time::cMinutes},
    {"h", Time::cHours},
    {"hour", Time::cHours},
};

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Duration> ParseDuration(const std::string& duration)
{
    const auto trimmed = Poco::trim(duration);

    if (trimmed.empty()) {
        return {{}, Error(ErrorEnum::eInvalidArgument, "duration can't be empty")};
    }

    if (!std::isdigit(static_cast<unsigned char>(trimmed.front()))) {
        return {{}, Error(ErrorEnum::eInvalidArgument, "duration must start with an integer")};
    }

    size_t valueEnd = 0;

    while (valueEnd < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[valueEnd]))) {
        valueEnd++;
    }

    size_t unitStart = valueEnd;

    while (unitStart < trimmed.size() && std::isspace(static_cast<unsigned char>(trimmed[unitStart]))) {
        unitStart++;
    }

    Poco::UInt64 value = 0;

    if (!Poco::NumberParser::tryParseUnsigned64(trimmed.substr(0, valueEnd), value)) {
        return {{}, Error(ErrorEnum::eOutOfRange, "duration value is too big")};
    }

    if (value == 0) {
        return {{}, Error(ErrorEnum::eInvalidArgument, "duration can't be zero")};
    }

    const auto unit = Poco::toLower(trimmed.substr(unitStart));

    auto it = cUnits.find(unit);
    if (it == cUnits.end()) {
        return {{}, Error(ErrorEnum::eInvalidArgument, "invalid duration unit, must be one of s, sec, second, m, min, "
                                                      "minute, h, hour")};
    }

    if (value > static_cast<Poco::UInt64>(std::numeric_limits<int64_t>::max() / it->second.Nanoseconds())) {
        return {{}, Error(ErrorEnum::eOutOfRange, "duration value is too big")};
    }

    return {it->second * static_cast<int64_t>(value), ErrorEnum::eNone};
}

} // namespace bootkit::common::utils
