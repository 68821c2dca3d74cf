/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_HANDLER_HANDLER_HPP_
#define BOOTKIT_HANDLER_HANDLER_HPP_

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <Poco/JSON/Object.h>

#include <config/config.hpp>
#include <database/itf/snapshotstore.hpp>
#include <grub2/bootentries.hpp>
#include <grub2/configfile.hpp>

#include "itf/requesthandler.hpp"

namespace bootkit::handler {

/**
 * Bootloader requests handler.
 */
class Handler : public RequestHandlerItf {
public:
    /**
     * Initializes handler.
     *
     * @param config grub config.
     * @param snapshotStore snapshot store.
     * @return Error.
     */
    Error Init(const config::GrubConfig& config, database::SnapshotStoreItf& snapshotStore);

    /**
     * Returns grub config.
     *
     * @return std::string.
     */
    std::string GetConfig() override;

    /**
     * Updates grub config.
     *
     * @param payload JSON object with key value pairs to set.
     * @return std::string updated grub config.
     */
    std::string SetConfig(const std::string& payload) override;

    /**
     * Returns boot entries.
     *
     * @return std::string.
     */
    std::string GetBootEntries() override;

    /**
     * Saves snapshot of current grub config.
     *
     * @return Error.
     */
    Error SaveSnapshot();

private:
    using KeyValues = std::vector<std::pair<std::string, std::string>>;

    static RetWithError<KeyValues> ParsePayload(const std::string& payload);
    static Poco::JSON::Object::Ptr KeyValueToJSON(const grub2::KeyValue& keyValue);
    static Poco::JSON::Object::Ptr ConfigToJSON(const grub2::ConfigFile& configFile);
    static Poco::JSON::Object::Ptr CatalogToJSON(const grub2::BootEntryCatalog& catalog);
    static std::string             ErrorToJSON(const Error& err);

    std::optional<std::string> GetSelectedEntry() const;
    Error                      SaveSnapshot(const grub2::ConfigFile& configFile);

    config::GrubConfig          mConfig;
    database::SnapshotStoreItf* mSnapshotStore {};
    std::mutex                  mMutex;
};

} // namespace bootkit::handler

#endif
