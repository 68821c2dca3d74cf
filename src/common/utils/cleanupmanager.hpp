/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_CLEANUPMANAGER_HPP_
#define BOOTKIT_COMMON_UTILS_CLEANUPMANAGER_HPP_

#include <functional>
#include <vector>

namespace bootkit::common::utils {
/**
 * Cleanup manager.
 *
 * Cleanups are executed in reverse order of registration.
 */
class CleanupManager {
public:
    /**
     * Adds cleanup.
     */
    void AddCleanup(std::function<void()>&& cleanup);

    /**
     * Executes cleanups. Each cleanup runs once.
     */
    void ExecuteCleanups();

private:
    std::vector<std::function<void()>> mCleanups;
};

} // namespace bootkit::common::utils

#endif
