/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/utils/cleanupmanager.hpp>

namespace bootkit::common::utils {

class CleanupManagerTest : public ::testing::Test {
protected:
    CleanupManager mCleanupManager;
};

TEST_F(CleanupManagerTest, CleanupsExecutedInReverseOrder)
{
    std::vector<int> executionOrder;

    for (auto i = 1; i <= 3; i++) {
        mCleanupManager.AddCleanup([&executionOrder, i]() { executionOrder.push_back(i); });
    }

    mCleanupManager.ExecuteCleanups();

    EXPECT_EQ(executionOrder, std::vector<int>({3, 2, 1}));
}

TEST_F(CleanupManagerTest, CleanupsExecutedOnce)
{
    auto count = 0;

    mCleanupManager.AddCleanup([&count]() { count++; });

    mCleanupManager.ExecuteCleanups();
    mCleanupManager.ExecuteCleanups();

    EXPECT_EQ(count, 1);
}

} // namespace bootkit::common::utils
