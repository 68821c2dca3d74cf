/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_TYPES_HPP_
#define BOOTKIT_COMMON_TYPES_HPP_

#include <core/common/tools/error.hpp>
#include <core/common/tools/logger.hpp>
#include <core/common/tools/string.hpp>
#include <core/common/tools/time.hpp>

namespace bootkit {

/***********************************************************************************************************************
 * Aos core types used across bootkit
 **********************************************************************************************************************/

using aos::Duration;
using aos::Error;
using aos::ErrorEnum;
using aos::Log;
using aos::LogLevel;
using aos::LogLevelEnum;
using aos::RetWithError;
using aos::String;
using aos::Tie;
using aos::Time;

} // namespace bootkit

#endif
