/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_EXCEPTION_HPP_
#define BOOTKIT_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <core/common/tools/error.hpp>
#include <core/common/tools/string.hpp>

#include <common/types.hpp>

/**
 * Helper macros for argument counting
 */
#define _GET_NTH_ARG(_1, _2, NAME, ...) NAME
#define GET_MACRO(NAME)                 NAME

/**
 * Error throw with and without message
 */
#define BOOTKIT_ERROR_THROW_1(err) throw bootkit::common::utils::BootkitException(AOS_ERROR_WRAP(err))
#define BOOTKIT_ERROR_THROW_2(err, message)                                                                            \
    throw bootkit::common::utils::BootkitException(AOS_ERROR_WRAP(err), message)
#define BOOTKIT_ERROR_THROW(...)                                                                                       \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, BOOTKIT_ERROR_THROW_2, BOOTKIT_ERROR_THROW_1))(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define BOOTKIT_ERROR_CHECK_AND_THROW_1(err)                                                                           \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        BOOTKIT_ERROR_THROW_1(err);                                                                                    \
    }
#define BOOTKIT_ERROR_CHECK_AND_THROW_2(err, message)                                                                  \
    if (!aos::Error(err).IsNone()) {                                                                                   \
        BOOTKIT_ERROR_THROW_2(err, message);                                                                           \
    }
#define BOOTKIT_ERROR_CHECK_AND_THROW(...)                                                                             \
    GET_MACRO(_GET_NTH_ARG(__VA_ARGS__, BOOTKIT_ERROR_CHECK_AND_THROW_2, BOOTKIT_ERROR_CHECK_AND_THROW_1))(__VA_ARGS__)

namespace bootkit::common::utils {

/**
 * Bootkit exception.
 */
class BootkitException : public Poco::Exception {
public:
    /**
     * Creates bootkit exception instance.
     *
     * @param err error.
     * @param message message.
     */
    explicit BootkitException(const Error& err, const std::string& message = "");

    /**
     * Returns error.
     *
     * @return Error.
     */
    Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "Bootkit exception"; }

private:
    Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error.
 *
 * @return Error.
 */
Error ToAosError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed);

/**
 * Converts error to string.
 *
 * @param err error.
 * @return std::string.
 */
std::string ErrorToString(const Error& err);

} // namespace bootkit::common::utils

#endif
