/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>
#include <syslog.h>

#include <Poco/String.h>
#include <systemd/sd-journal.h>

#include "logger.hpp"

namespace bootkit::common::logger {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::mutex Logger::sMutex;
LogLevel   Logger::sLogLevel = Logger::cDefaultLogLevel;

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Logger::Init()
{
    {
        std::lock_guard lock {sMutex};

        sLogLevel = mLogLevel.has_value() ? *mLogLevel : GetEnvLogLevel();
    }

    switch (mBackend) {
    case Backend::eStdIO:
        Log::SetCallback(StdIOCallback);
        break;

    case Backend::eJournald:
        Log::SetCallback(JournaldCallback);
        break;

    default:
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "unsupported log backend"));
    }

    return ErrorEnum::eNone;
}

void Logger::SetLogLevel(LogLevel level)
{
    std::lock_guard lock {sMutex};

    mLogLevel = level;
    sLogLevel = level;
}

RetWithError<LogLevel> Logger::ParseLogLevel(const std::string& value)
{
    auto normalized = Poco::toLower(Poco::trim(value));

    if (normalized == "warn") {
        normalized = "warning";
    }

    LogLevel level;

    if (auto err = level.FromString(String(normalized.c_str())); !err.IsNone()) {
        return {level, Error(ErrorEnum::eInvalidArgument, "unsupported log level")};
    }

    return {level, ErrorEnum::eNone};
}

LogLevel Logger::GetEnvLogLevel()
{
    const auto* env = std::getenv(cLogLevelEnv);
    if (env == nullptr) {
        return cDefaultLogLevel;
    }

    auto [level, err] = ParseLogLevel(env);
    if (!err.IsNone()) {
        return cDefaultLogLevel;
    }

    return level;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Logger::StdIOCallback(const String& module, LogLevel level, const String& message)
{
    if (!IsEnabled(level)) {
        return;
    }

    std::lock_guard lock {sMutex};

    std::cout << level.ToString().CStr() << " [" << module.CStr() << "] " << message.CStr() << std::endl;
}

void Logger::JournaldCallback(const String& module, LogLevel level, const String& message)
{
    if (!IsEnabled(level)) {
        return;
    }

    sd_journal_send("MESSAGE=%s", message.CStr(), "PRIORITY=%i", ToSyslogPriority(level), "MODULE=%s", module.CStr(),
        nullptr);
}

int Logger::ToSyslogPriority(LogLevel level)
{
    switch (level.GetValue()) {
    case LogLevelEnum::eDebug:
        return LOG_DEBUG;

    case LogLevelEnum::eInfo:
        return LOG_INFO;

    case LogLevelEnum::eWarning:
        return LOG_WARNING;

    case LogLevelEnum::eError:
        return LOG_ERR;

    default:
        return LOG_NOTICE;
    }
}

bool Logger::IsEnabled(LogLevel level)
{
    std::lock_guard lock {sMutex};

    return ToSyslogPriority(level) <= ToSyslogPriority(sLogLevel);
}

} // namespace bootkit::common::logger
