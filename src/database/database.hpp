/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_DATABASE_DATABASE_HPP_
#define BOOTKIT_DATABASE_DATABASE_HPP_

#include <memory>
#include <mutex>
#include <string>

#include <Poco/Data/Session.h>
#include <Poco/Nullable.h>
#include <Poco/Tuple.h>

#include "itf/snapshotstore.hpp"

namespace bootkit::database {

/**
 * SQLite snapshot database.
 */
class Database : public SnapshotStoreItf {
public:
    /**
     * Constructor.
     */
    Database();

    /**
     * Destructor.
     */
    ~Database();

    /**
     * Initializes database.
     *
     * @param path database file path.
     * @return Error.
     */
    Error Init(const std::string& path);

    // SnapshotStoreItf interface

    /**
     * Checks if any snapshot is stored.
     *
     * @return RetWithError<bool>.
     */
    RetWithError<bool> HasSnapshots() override;

    /**
     * Saves grub config snapshot.
     *
     * @param grubConfig serialized grub config.
     * @param selectedKernel selected boot entry if known.
     * @return Error.
     */
    Error SaveSnapshot(const std::string& grubConfig, const std::optional<std::string>& selectedKernel) override;

    /**
     * Returns latest snapshot.
     *
     * @param[out] snapshot latest snapshot.
     * @return Error.
     */
    Error GetLatestSnapshot(Snapshot& snapshot) override;

    /**
     * Returns all snapshots ordered by id.
     *
     * @param[out] snapshots snapshots.
     * @return Error.
     */
    Error GetSnapshots(std::vector<Snapshot>& snapshots) override;

private:
    using SnapshotRow = Poco::Tuple<uint64_t, std::string, Poco::Nullable<std::string>, std::string>;

    enum class SnapshotColumns : int { eID = 0, eGrubConfig, eSelectedKernel, eCreated };

    void CreateTables();

    static void ToSnapshot(const SnapshotRow& row, Snapshot& snapshot);

    std::unique_ptr<Poco::Data::Session> mSession;
    std::mutex                           mMutex;
};

} // namespace bootkit::database

#endif
