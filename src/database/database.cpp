/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SQLite/SQLiteException.h>
#include <Poco/Data/Statement.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>

#include "database.hpp"

using namespace Poco::Data::Keywords;

namespace bootkit::database {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

template <typename E>
constexpr int ToInt(E e)
{
    return static_cast<int>(e);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Database::Database()
{
    Poco::Data::SQLite::Connector::registerConnector();
}

Database::~Database()
{
    if (mSession && mSession->isConnected()) {
        mSession->close();
    }

    Poco::Data::SQLite::Connector::unregisterConnector();
}

Error Database::Init(const std::string& path)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Init database" << Log::Field("path", path.c_str());

    if (mSession && mSession->isConnected()) {
        return ErrorEnum::eNone;
    }

    try {
        auto dirPath = std::filesystem::path(path).parent_path();
        if (!dirPath.empty() && !std::filesystem::exists(dirPath)) {
            std::filesystem::create_directories(dirPath);
        }

        mSession = std::make_unique<Poco::Data::Session>("SQLite", path);

        CreateTables();

        return ErrorEnum::eNone;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }
}

RetWithError<bool> Database::HasSnapshots()
{
    std::lock_guard lock {mMutex};

    try {
        size_t count = 0;

        *mSession << "SELECT COUNT(*) FROM grub2_snapshot;", into(count), now;

        return {count > 0, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {false, AOS_ERROR_WRAP(common::utils::ToAosError(e))};
    }
}

Error Database::SaveSnapshot(const std::string& grubConfig, const std::optional<std::string>& selectedKernel)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Save snapshot" << Log::Field("selectedKernel", selectedKernel.value_or("").c_str());

    try {
        Poco::Nullable<std::string> kernel;

        if (selectedKernel.has_value()) {
            kernel = *selectedKernel;
        }

        *mSession << "INSERT INTO grub2_snapshot (grub_config, selected_kernel) VALUES (?, ?);", bind(grubConfig),
            bind(kernel), now;

        return ErrorEnum::eNone;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }
}

Error Database::GetLatestSnapshot(Snapshot& snapshot)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Get latest snapshot";

    try {
        std::vector<SnapshotRow> rows;
        Poco::Data::Statement    statement {*mSession};

        statement << "SELECT id, grub_config, selected_kernel, created FROM grub2_snapshot ORDER BY id DESC LIMIT 1;",
            into(rows);

        if (statement.execute() == 0) {
            return ErrorEnum::eNotFound;
        }

        ToSnapshot(rows.front(), snapshot);

        return ErrorEnum::eNone;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }
}

Error Database::GetSnapshots(std::vector<Snapshot>& snapshots)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Get snapshots";

    try {
        std::vector<SnapshotRow> rows;

        *mSession << "SELECT id, grub_config, selected_kernel, created FROM grub2_snapshot ORDER BY id;", into(rows),
            now;

        snapshots.clear();

        for (const auto& row : rows) {
            Snapshot snapshot;

            ToSnapshot(row, snapshot);

            snapshots.push_back(std::move(snapshot));
        }

        return ErrorEnum::eNone;
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e));
    }
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Database::CreateTables()
{
    LOG_DBG() << "Create tables";

    *mSession << "CREATE TABLE IF NOT EXISTS grub2_snapshot ("
                 "id INTEGER PRIMARY KEY NOT NULL, "
                 "grub_config TEXT NOT NULL, "
                 "selected_kernel TEXT, "
                 "created DATETIME DEFAULT CURRENT_TIMESTAMP NOT NULL);",
        now;
}

void Database::ToSnapshot(const SnapshotRow& row, Snapshot& snapshot)
{
    snapshot.mID         = row.get<ToInt(SnapshotColumns::eID)>();
    snapshot.mGrubConfig = row.get<ToInt(SnapshotColumns::eGrubConfig)>();
    snapshot.mCreated    = row.get<ToInt(SnapshotColumns::eCreated)>();

    if (const auto& kernel = row.get<ToInt(SnapshotColumns::eSelectedKernel)>(); !kernel.isNull()) {
        snapshot.mSelectedKernel = kernel.value();
    } else {
        snapshot.mSelectedKernel.reset();
    }
}

} // namespace bootkit::database
