/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_LOGGER_LOGGER_HPP_
#define BOOTKIT_COMMON_LOGGER_LOGGER_HPP_

#include <mutex>
#include <optional>
#include <string>

#include <common/types.hpp>

namespace bootkit::common::logger {

/**
 * Environment variable which overrides default log level.
 */
constexpr auto cLogLevelEnv = "BOOTKIT_LOG_LEVEL";

/**
 * Logger instance.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eJournald,
    };

    /**
     * Initializes logger.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Sets log backend.
     *
     * @param backend log backend.
     */
    void SetBackend(Backend backend) { mBackend = backend; }

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    void SetLogLevel(LogLevel level);

    /**
     * Parses log level string.
     *
     * Accepts debug, info, warn, warning and error in any case.
     *
     * @param value log level string.
     * @return RetWithError<LogLevel>.
     */
    static RetWithError<LogLevel> ParseLogLevel(const std::string& value);

    /**
     * Returns log level from environment or the default one.
     *
     * Unknown environment value falls back to the default log level.
     *
     * @return LogLevel.
     */
    static LogLevel GetEnvLogLevel();

private:
    static constexpr auto cDefaultLogLevel = LogLevelEnum::eInfo;

    static void StdIOCallback(const String& module, LogLevel level, const String& message);
    static void JournaldCallback(const String& module, LogLevel level, const String& message);
    static int  ToSyslogPriority(LogLevel level);
    static bool IsEnabled(LogLevel level);

    static std::mutex sMutex;
    static LogLevel   sLogLevel;

    Backend                 mBackend {Backend::eStdIO};
    std::optional<LogLevel> mLogLevel;
};

} // namespace bootkit::common::logger

#endif
