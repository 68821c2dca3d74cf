/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_FILESYSTEM_HPP_
#define BOOTKIT_COMMON_UTILS_FILESYSTEM_HPP_

#include <filesystem>
#include <string>

#include <common/types.hpp>

namespace bootkit::common::utils {

/**
 * Creates a temporary directory using mkdtemp.
 *
 * @param dir directory path where the temporary directory will be created.
 *            If empty, the system's temp directory will be used.
 * @param pattern directory name pattern. ".XXXXXX" is appended if the pattern doesn't end with it.
 * @return RetWithError<std::string> containing the path of the created directory.
 */
RetWithError<std::string> MkTmpDir(const std::string& dir = "", const std::string& pattern = "");

/**
 * Reads whole file content.
 *
 * @param path file path.
 * @return RetWithError<std::string>.
 */
RetWithError<std::string> ReadFile(const std::string& path);

/**
 * Replaces file content.
 *
 * Content is written into a temporary file in the same directory which is renamed over the target, so
 * readers never observe a partially written file. Permissions of the existing file are preserved.
 *
 * @param path file path.
 * @param content file content.
 * @return Error.
 */
Error WriteFile(const std::string& path, const std::string& content);

/**
 * Joins base path and one or more entries into a single path.
 *
 * @param base base path.
 * @param entry first path entry.
 * @param entries additional path entries (variadic).
 * @return std::string.
 */
template <typename... Args>
std::string JoinPath(const std::string& base, const std::string& entry, Args&&... entries)
{
    auto path = std::filesystem::path(base) / entry;

    if constexpr (sizeof...(entries) > 0) {
        ((path /= std::forward<Args>(entries)), ...);
    }

    return path.string();
}

} // namespace bootkit::common::utils

#endif
