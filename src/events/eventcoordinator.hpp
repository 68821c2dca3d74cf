/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_EVENTS_EVENTCOORDINATOR_HPP_
#define BOOTKIT_EVENTS_EVENTCOORDINATOR_HPP_

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/utils/itf/fswatcher.hpp>
#include <config/config.hpp>
#include <dbus/itf/transport.hpp>

namespace bootkit::events {

/**
 * Event coordinator exit reason.
 */
enum class ExitReason {
    eShutdown,
    eIdle,
    eError,
};

/**
 * Watches grub files and client inactivity until the first of them finishes.
 */
class EventCoordinator {
public:
    /**
     * Initializes event coordinator.
     *
     * @param config config.
     * @param watcher file system watcher.
     * @param transport transport handle, released when listening finishes.
     * @return Error.
     */
    Error Init(const config::Config& config, common::utils::FSWatcherItf& watcher,
        std::shared_ptr<dbus::TransportItf> transport);

    /**
     * Runs file watch and idle detection until the first of them finishes.
     *
     * @return RetWithError<ExitReason>.
     */
    RetWithError<ExitReason> ListenEvents();

    /**
     * Requests listening to stop.
     */
    void SignalShutdown();

    /**
     * Returns true if shutdown was requested.
     *
     * @return bool.
     */
    bool IsShutdown() const;

private:
    Error WatchFiles();
    Error ProcessFileEvents();
    bool  WaitIdle();
    void  Complete(ExitReason reason, const Error& err = ErrorEnum::eNone);

    std::vector<std::string>            mWatchDirs;
    std::vector<std::string>            mWatchedFiles;
    Duration                            mIdleTimeout {};
    common::utils::FSWatcherItf*        mWatcher {};
    std::shared_ptr<dbus::TransportItf> mTransport;

    std::atomic_bool mShutdown {};

    std::mutex               mMutex;
    std::condition_variable  mCondVar;
    bool                     mCompleted {};
    RetWithError<ExitReason> mResult {ExitReason::eShutdown, ErrorEnum::eNone};
};

} // namespace bootkit::events

#endif
