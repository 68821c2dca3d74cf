/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_DATABASE_TESTS_MOCKS_SNAPSHOTSTOREMOCK_HPP_
#define BOOTKIT_DATABASE_TESTS_MOCKS_SNAPSHOTSTOREMOCK_HPP_

#include <gmock/gmock.h>

#include <database/itf/snapshotstore.hpp>

namespace bootkit::database {

class MockSnapshotStore : public SnapshotStoreItf {
public:
    MOCK_METHOD(RetWithError<bool>, HasSnapshots, (), (override));
    MOCK_METHOD(
        Error, SaveSnapshot, (const std::string& grubConfig, const std::optional<std::string>& selectedKernel), (override));
    MOCK_METHOD(Error, GetLatestSnapshot, (Snapshot & snapshot), (override));
    MOCK_METHOD(Error, GetSnapshots, (std::vector<Snapshot> & snapshots), (override));
};

} // namespace bootkit::database

#endif
