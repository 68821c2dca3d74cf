/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_ITF_FSWATCHER_HPP_
#define BOOTKIT_COMMON_UTILS_ITF_FSWATCHER_HPP_

#include <string>
#include <vector>

#include <common/types.hpp>

namespace bootkit::common::utils {

/**
 * File system event type.
 */
enum class FSEventType {
    eModify,
    eClose,
    eCreate,
    eDelete,
};

/**
 * File system event.
 */
struct FSEvent {
    std::string              mPath;
    std::string              mName;
    std::vector<FSEventType> mTypes;

    /**
     * Checks if event contains given type.
     *
     * @param type event type.
     * @return bool.
     */
    bool Has(FSEventType type) const
    {
        for (const auto eventType : mTypes) {
            if (eventType == type) {
                return true;
            }
        }

        return false;
    }
};

/**
 * File system watcher interface.
 */
class FSWatcherItf {
public:
    /**
     * Destructor.
     */
    virtual ~FSWatcherItf() = default;

    /**
     * Starts watching paths.
     *
     * @param paths directories or files to watch.
     * @param types event types to watch.
     * @return Error.
     */
    virtual Error Watch(const std::vector<std::string>& paths, const std::vector<FSEventType>& types) = 0;

    /**
     * Waits for the next batch of events.
     *
     * Returns ErrorEnum::eTimeout if nothing has been received during timeout.
     *
     * @param timeout wait timeout.
     * @param[out] events events read together.
     * @return Error.
     */
    virtual Error ReadEvents(Duration timeout, std::vector<FSEvent>& events) = 0;

    /**
     * Stops watching and releases resources.
     */
    virtual void Close() = 0;
};

} // namespace bootkit::common::utils

#endif
