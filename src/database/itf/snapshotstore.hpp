/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_DATABASE_ITF_SNAPSHOTSTORE_HPP_
#define BOOTKIT_DATABASE_ITF_SNAPSHOTSTORE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <common/types.hpp>

namespace bootkit::database {

/**
 * Grub config snapshot.
 */
struct Snapshot {
    uint64_t                   mID {};
    std::string                mGrubConfig;
    std::optional<std::string> mSelectedKernel;
    std::string                mCreated;
};

/**
 * Grub config snapshot store interface.
 */
class SnapshotStoreItf {
public:
    /**
     * Destructor.
     */
    virtual ~SnapshotStoreItf() = default;

    /**
     * Checks if any snapshot is stored.
     *
     * @return RetWithError<bool>.
     */
    virtual RetWithError<bool> HasSnapshots() = 0;

    /**
     * Saves grub config snapshot.
     *
     * @param grubConfig serialized grub config.
     * @param selectedKernel selected boot entry if known.
     * @return Error.
     */
    virtual Error SaveSnapshot(const std::string& grubConfig, const std::optional<std::string>& selectedKernel) = 0;

    /**
     * Returns latest snapshot.
     *
     * @param[out] snapshot latest snapshot.
     * @return Error eNotFound if there are no snapshots.
     */
    virtual Error GetLatestSnapshot(Snapshot& snapshot) = 0;

    /**
     * Returns all snapshots ordered by id.
     *
     * @param[out] snapshots snapshots.
     * @return Error.
     */
    virtual Error GetSnapshots(std::vector<Snapshot>& snapshots) = 0;
};

} // namespace bootkit::database

#endif
