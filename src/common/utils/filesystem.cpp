/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include <core/common/tools/logger.hpp>

#include "exception.hpp"
#include "filesystem.hpp"

namespace fs = std::filesystem;

namespace bootkit::common::utils {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Error WriteAll(int fd, const std::string& content)
{
    size_t written = 0;

    while (written < content.size()) {
        auto ret = write(fd, content.data() + written, content.size() - written);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }

            return Error(ErrorEnum::eFailed, strerror(errno));
        }

        written += static_cast<size_t>(ret);
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<std::string> MkTmpDir(const std::string& dir, const std::string& pattern)
{
    std::string directory   = dir.empty() ? fs::temp_directory_path().string() : dir;
    std::string tempPattern = pattern.empty() ? "tmp.XXXXXX" : pattern;

    if (tempPattern.length() < 7 || tempPattern.substr(tempPattern.length() - 7) != ".XXXXXX") {
        tempPattern += ".XXXXXX";
    }

    std::string fullPath = (fs::path(directory) / tempPattern).string();

    std::vector<char> mutablePath(fullPath.begin(), fullPath.end());
    mutablePath.push_back('\0');

    char* result = mkdtemp(mutablePath.data());

    if (result == nullptr) {
        return {"", Error(ErrorEnum::eFailed, strerror(errno))};
    }

    return {std::string(result), ErrorEnum::eNone};
}

RetWithError<std::string> ReadFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        if (errno == ENOENT) {
            return {"", Error(ErrorEnum::eNotFound, "file not found")};
        }

        return {"", Error(ErrorEnum::eFailed, strerror(errno))};
    }

    std::ostringstream content;

    content << file.rdbuf();

    if (file.bad()) {
        return {"", Error(ErrorEnum::eFailed, "can't read file")};
    }

    return {content.str(), ErrorEnum::eNone};
}

Error WriteFile(const std::string& path, const std::string& content)
{
    const auto  target  = fs::path(path);
    std::string tmpPath = (target.parent_path() / ("." + target.filename().string() + ".XXXXXX")).string();

    std::vector<char> mutablePath(tmpPath.begin(), tmpPath.end());
    mutablePath.push_back('\0');

    int fd = mkstemp(mutablePath.data());
    if (fd < 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eFailed, strerror(errno)));
    }

    tmpPath = mutablePath.data();

    struct stat st { };

    if (stat(path.c_str(), &st) == 0) {
        if (fchmod(fd, st.st_mode & 07777) < 0) {
            LOG_WRN() << "Can't preserve file mode" << Log::Field("path", path.c_str()) << Log::Field(Error(errno));
        }
    }

    auto err = WriteAll(fd, content);

    if (err.IsNone() && fsync(fd) < 0) {
        err = Error(ErrorEnum::eFailed, strerror(errno));
    }

    if (close(fd) < 0 && err.IsNone()) {
        err = Error(ErrorEnum::eFailed, strerror(errno));
    }

    if (err.IsNone() && rename(tmpPath.c_str(), path.c_str()) < 0) {
        err = Error(ErrorEnum::eFailed, strerror(errno));
    }

    if (!err.IsNone()) {
        unlink(tmpPath.c_str());

        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

} // namespace bootkit::common::utils
