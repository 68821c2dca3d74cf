/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_FSWATCHER_HPP_
#define BOOTKIT_COMMON_UTILS_FSWATCHER_HPP_

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "itf/fswatcher.hpp"

namespace bootkit::common::utils {

/**
 * Inotify based file system watcher.
 */
class FSWatcher : public FSWatcherItf {
public:
    /**
     * Destructor.
     */
    ~FSWatcher();

    /**
     * Starts watching paths.
     *
     * @param paths directories or files to watch.
     * @param types event types to watch.
     * @return Error.
     */
    Error Watch(const std::vector<std::string>& paths, const std::vector<FSEventType>& types) override;

    /**
     * Waits for the next batch of events.
     *
     * @param timeout wait timeout.
     * @param[out] events events read together.
     * @return Error.
     */
    Error ReadEvents(Duration timeout, std::vector<FSEvent>& events) override;

    /**
     * Stops watching and releases resources.
     */
    void Close() override;

private:
    static constexpr size_t cMaxPollEvents = 16;
    static constexpr size_t cMaxNameLen    = 255;

    void                     CloseDescriptors();
    std::vector<FSEventType> ToFSEvent(uint32_t mask) const;
    uint32_t                 ToInotifyMask(const std::vector<FSEventType>& types) const;

    int                                  mInotifyFd {-1};
    int                                  mEpollFd {-1};
    std::unordered_map<int, std::string> mWatchDescriptors;
    std::mutex                           mMutex;
};

} // namespace bootkit::common::utils

#endif
