/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_CONFIG_CONFIG_HPP_
#define BOOTKIT_CONFIG_CONFIG_HPP_

#include <string>

#include <common/types.hpp>

namespace bootkit::config {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

/**
 * Default config file.
 */
constexpr auto cDefaultConfigFile = "/etc/bootkit/bootkitd.cfg";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * D-Bus configuration.
 */
struct DBusConfig {
    std::string mBusName;
    std::string mObjectPath;
    bool        mSessionBus {};
};

/*
 * Grub files configuration.
 */
struct GrubConfig {
    std::string mGrubFile;
    std::string mGrubEnvFile;
    std::string mGrubMenuFile;
    std::string mConfigDir;
    std::string mBootDir;
};

/*
 * Config instance.
 */
struct Config {
    GrubConfig  mGrub;
    DBusConfig  mDBus;
    std::string mDatabasePath;
    Duration    mIdleTimeout {};
};

/*******************************************************************************
 * Functions
 ******************************************************************************/

/*
 * Returns config with all default values.
 *
 * @return Config.
 */
Config DefaultConfig();

/*
 * Parses config from file.
 *
 * Missing file is not an error when it is the default config file: all values are set to default in this case.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return Error.
 */
Error ParseConfig(const std::string& filename, Config& config);

} // namespace bootkit::config

#endif
