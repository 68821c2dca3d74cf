/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/JSON/Array.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

#include "handler.hpp"

namespace bootkit::handler {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

// Keys and values must survive a save and reload of the grub file unchanged.
Error ValidateKeyValue(const std::string& key, const std::string& value)
{
    if (key.empty() || key.front() == '#') {
        return Error(ErrorEnum::eInvalidArgument, "invalid key");
    }

    if (key.find_first_of("=\'\" \t\r\n\v\f") != std::string::npos) {
        return Error(ErrorEnum::eInvalidArgument, "key contains forbidden characters");
    }

    if (value.find_first_of("'\"\r\n") != std::string::npos) {
        return Error(ErrorEnum::eInvalidArgument, "value contains forbidden characters");
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Handler::Init(const config::GrubConfig& config, database::SnapshotStoreItf& snapshotStore)
{
    LOG_DBG() << "Init handler" << Log::Field("grubFile", config.mGrubFile.c_str());

    mConfig        = config;
    mSnapshotStore = &snapshotStore;

    return ErrorEnum::eNone;
}

std::string Handler::GetConfig()
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Get config request";

    grub2::ConfigFile configFile;

    if (auto err = configFile.Load(mConfig.mGrubFile); !err.IsNone()) {
        LOG_ERR() << "Can't get config" << Log::Field(err);

        return ErrorToJSON(err);
    }

    return common::utils::Stringify(*ConfigToJSON(configFile));
}

std::string Handler::SetConfig(const std::string& payload)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Set config request";

    auto [keyValues, err] = ParsePayload(payload);
    if (!err.IsNone()) {
        LOG_ERR() << "Invalid set config payload" << Log::Field(err);

        return ErrorToJSON(err);
    }

    grub2::ConfigFile configFile;

    if (err = configFile.Load(mConfig.mGrubFile); !err.IsNone()) {
        LOG_ERR() << "Can't set config" << Log::Field(err);

        return ErrorToJSON(err);
    }

    for (const auto& [key, value] : keyValues) {
        configFile.SetKeyValue(key, value);
    }

    if (err = configFile.Save(mConfig.mGrubFile); !err.IsNone()) {
        LOG_ERR() << "Can't set config" << Log::Field(err);

        return ErrorToJSON(err);
    }

    LOG_INF() << "Grub config updated" << Log::Field("keys", keyValues.size());

    if (err = SaveSnapshot(configFile); !err.IsNone()) {
        LOG_ERR() << "Can't save snapshot" << Log::Field(err);

        return ErrorToJSON(err);
    }

    return common::utils::Stringify(*ConfigToJSON(configFile));
}

std::string Handler::GetBootEntries()
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Get boot entries request";

    grub2::BootEntryCatalog catalog;

    if (auto err = grub2::BuildCatalog(mConfig.mGrubMenuFile, mConfig.mGrubEnvFile, catalog); !err.IsNone()) {
        LOG_ERR() << "Can't get boot entries" << Log::Field(err);

        return ErrorToJSON(err);
    }

    return common::utils::Stringify(*CatalogToJSON(catalog));
}

Error Handler::SaveSnapshot()
{
    std::lock_guard lock {mMutex};

    grub2::ConfigFile configFile;

    if (auto err = configFile.Load(mConfig.mGrubFile); !err.IsNone()) {
        return err;
    }

    return SaveSnapshot(configFile);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<Handler::KeyValues> Handler::ParsePayload(const std::string& payload)
{
    auto [var, err] = common::utils::ParseJson(payload, true);
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(Error(err, "can't parse payload"))};
    }

    try {
        if (var.type() != typeid(Poco::JSON::Object::Ptr)) {
            return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "payload is not an object"))};
        }

        const auto object = var.extract<Poco::JSON::Object::Ptr>();
        KeyValues  keyValues;

        for (const auto& key : object->getNames()) {
            const auto value = object->get(key);

            if (value.isEmpty() || !(value.isString() || value.isNumeric() || value.isBoolean())) {
                auto message = "invalid value of " + key;

                return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, message.c_str()))};
            }

            auto str = value.convert<std::string>();

            if (auto err = ValidateKeyValue(key, str); !err.IsNone()) {
                return {{}, AOS_ERROR_WRAP(err)};
            }

            keyValues.emplace_back(key, std::move(str));
        }

        return {keyValues, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

Poco::JSON::Object::Ptr Handler::KeyValueToJSON(const grub2::KeyValue& keyValue)
{
    auto object = Poco::makeShared<Poco::JSON::Object>();

    object->set("key", keyValue.mKey);
    object->set("value", keyValue.mValue);
    object->set("line", keyValue.mLine);
    object->set("dirty", keyValue.mDirty);

    return object;
}

Poco::JSON::Object::Ptr Handler::ConfigToJSON(const grub2::ConfigFile& configFile)
{
    auto valueMap  = Poco::makeShared<Poco::JSON::Object>();
    auto valueList = Poco::makeShared<Poco::JSON::Array>();

    for (const auto& [key, keyValue] : configFile.GetKeyValues()) {
        valueMap->set(key, KeyValueToJSON(keyValue));
    }

    for (const auto& keyValue : configFile.GetValues()) {
        valueList->add(KeyValueToJSON(keyValue));
    }

    auto object = Poco::makeShared<Poco::JSON::Object>();

    object->set("value_map", valueMap);
    object->set("value_list", valueList);

    return object;
}

Poco::JSON::Object::Ptr Handler::CatalogToJSON(const grub2::BootEntryCatalog& catalog)
{
    auto entries = Poco::makeShared<Poco::JSON::Array>();

    for (const auto& entry : catalog.mEntries) {
        auto object   = Poco::makeShared<Poco::JSON::Object>();
        auto submenus = Poco::makeShared<Poco::JSON::Array>();

        for (const auto& submenu : entry.mSubmenus) {
            submenus->add(submenu);
        }

        object->set("name", entry.mName);
        object->set("submenus", submenus);
        object->set("path", entry.GetFullPath());

        entries->add(object);
    }

    auto object = Poco::makeShared<Poco::JSON::Object>();

    object->set("entries", entries);

    if (catalog.mSelected.has_value()) {
        object->set("selected", *catalog.mSelected);
    } else {
        object->set("selected", Poco::Dynamic::Var());
    }

    return object;
}

std::string Handler::ErrorToJSON(const Error& err)
{
    Poco::JSON::Object object;

    object.set("error", common::utils::ErrorToString(err));

    return common::utils::Stringify(object);
}

std::optional<std::string> Handler::GetSelectedEntry() const
{
    grub2::BootEntryCatalog catalog;

    if (auto err = grub2::BuildCatalog(mConfig.mGrubMenuFile, mConfig.mGrubEnvFile, catalog); !err.IsNone()) {
        LOG_WRN() << "Can't get selected boot entry" << Log::Field(err);

        return std::nullopt;
    }

    return catalog.mSelected;
}

Error Handler::SaveSnapshot(const grub2::ConfigFile& configFile)
{
    if (mSnapshotStore == nullptr) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "handler is not initialized"));
    }

    if (auto err = mSnapshotStore->SaveSnapshot(configFile.ToString(), GetSelectedEntry()); !err.IsNone()) {
        return AOS_ERROR_WRAP(Error(err, "can't save snapshot"));
    }

    return ErrorEnum::eNone;
}

} // namespace bootkit::handler
