/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <Poco/JSON/Parser.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <common/utils/time.hpp>

#include "config.hpp"

namespace bootkit::config {

namespace {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cDefaultGrubFile     = "/etc/default/grub";
constexpr auto cDefaultGrubEnvFile  = "/boot/grub2/grubenv";
constexpr auto cDefaultGrubMenuFile = "/boot/grub2/grub.cfg";
constexpr auto cDefaultDatabasePath = "/var/lib/bootkit/bootkit.db";
constexpr auto cDefaultBusName      = "org.opensuse.bootloader";
constexpr auto cDefaultObjectPath   = "/org/opensuse/bootloader";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string ParentDir(const std::string& path)
{
    return std::filesystem::path(path).parent_path().string();
}

void ParseGrubConfig(const common::utils::CaseInsensitiveObjectWrapper& object, GrubConfig& config)
{
    config.mGrubFile     = object.GetValue<std::string>("grubFile", cDefaultGrubFile);
    config.mGrubEnvFile  = object.GetValue<std::string>("grubEnvFile", cDefaultGrubEnvFile);
    config.mGrubMenuFile = object.GetValue<std::string>("grubMenuFile", cDefaultGrubMenuFile);
    config.mConfigDir    = object.GetValue<std::string>("configDir", ParentDir(config.mGrubFile));
    config.mBootDir      = object.GetValue<std::string>("bootDir", ParentDir(config.mGrubMenuFile));
}

void ParseDBusConfig(const common::utils::CaseInsensitiveObjectWrapper& object, DBusConfig& config)
{
    config.mBusName    = object.GetValue<std::string>("busName", cDefaultBusName);
    config.mObjectPath = object.GetValue<std::string>("objectPath", cDefaultObjectPath);
    config.mSessionBus = object.GetValue<bool>("sessionBus", false);
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Config DefaultConfig()
{
    Config config;

    auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

    ParseGrubConfig(empty, config.mGrub);
    ParseDBusConfig(empty, config.mDBus);

    config.mDatabasePath = cDefaultDatabasePath;

    return config;
}

Error ParseConfig(const std::string& filename, Config& config)
{
    std::ifstream file(filename);

    if (!file.is_open()) {
        if (filename == cDefaultConfigFile) {
            LOG_WRN() << "Config file not found, use defaults" << Log::Field("file", filename.c_str());

            config = DefaultConfig();

            return ErrorEnum::eNone;
        }

        return Error(ErrorEnum::eNotFound, "config file not found");
    }

    try {
        Poco::JSON::Parser                          parser;
        auto                                        result = parser.parse(file);
        common::utils::CaseInsensitiveObjectWrapper object(result);

        auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

        ParseGrubConfig(object, config.mGrub);
        ParseDBusConfig(object.Has("dbus") ? object.GetObject("dbus") : empty, config.mDBus);

        config.mDatabasePath = object.GetValue<std::string>("databasePath", cDefaultDatabasePath);

        if (auto idleTimeout = object.GetOptionalValue<std::string>("idleTimeout"); idleTimeout.has_value()) {
            Error err = ErrorEnum::eNone;

            Tie(config.mIdleTimeout, err) = common::utils::ParseDuration(*idleTimeout);
            BOOTKIT_ERROR_CHECK_AND_THROW(err, "error parsing idleTimeout tag");
        }
    } catch (const std::exception& e) {
        return common::utils::ToAosError(e);
    }

    return ErrorEnum::eNone;
}

} // namespace bootkit::config
