/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <filesystem>
#include <thread>

#include <core/common/tools/logger.hpp>

#include "eventcoordinator.hpp"

namespace bootkit::events {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const auto cRetryInterval = Time::cMilliseconds * 100;

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error EventCoordinator::Init(const config::Config& config, common::utils::FSWatcherItf& watcher,
    std::shared_ptr<dbus::TransportItf> transport)
{
    LOG_DBG() << "Init event coordinator" << Log::Field("idleTimeout", config.mIdleTimeout.Milliseconds());

    if (!transport) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "transport is not set"));
    }

    mWatchDirs    = {config.mGrub.mConfigDir, config.mGrub.mBootDir};
    mWatchedFiles = {std::filesystem::path(config.mGrub.mGrubFile).filename().string(),
        std::filesystem::path(config.mGrub.mGrubEnvFile).filename().string()};
    mIdleTimeout  = config.mIdleTimeout;
    mWatcher      = &watcher;
    mTransport    = std::move(transport);

    return ErrorEnum::eNone;
}

RetWithError<ExitReason> EventCoordinator::ListenEvents()
{
    LOG_DBG() << "Listen events";

    if (!mTransport) {
        return {ExitReason::eError, AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "transport is not set"))};
    }

    std::thread watchThread([this]() {
        if (auto err = WatchFiles(); !err.IsNone()) {
            Complete(ExitReason::eError, err);

            return;
        }

        Complete(ExitReason::eShutdown);
    });

    std::thread idleThread;

    if (mIdleTimeout > Duration()) {
        idleThread = std::thread([this]() {
            if (WaitIdle()) {
                Complete(ExitReason::eIdle);
            }
        });
    }

    {
        std::unique_lock lock {mMutex};

        mCondVar.wait(lock, [this]() { return mCompleted; });
    }

    LOG_DBG() << "Event listener exited, stop all events";

    mShutdown.store(true, std::memory_order_relaxed);

    watchThread.join();

    if (idleThread.joinable()) {
        idleThread.join();
    }

    mTransport.reset();

    std::lock_guard lock {mMutex};

    return mResult;
}

void EventCoordinator::SignalShutdown()
{
    LOG_DBG() << "Signal shutdown";

    mShutdown.store(true, std::memory_order_relaxed);
}

bool EventCoordinator::IsShutdown() const
{
    return mShutdown.load(std::memory_order_relaxed);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error EventCoordinator::WatchFiles()
{
    auto err = mWatcher->Watch(mWatchDirs, {common::utils::FSEventType::eModify, common::utils::FSEventType::eCreate});
    if (err.IsNone()) {
        LOG_INF() << "Listening to config changes";

        err = ProcessFileEvents();
    } else {
        err = AOS_ERROR_WRAP(Error(err, "can't watch grub files"));
    }

    mWatcher->Close();

    return err;
}

Error EventCoordinator::ProcessFileEvents()
{
    while (!mShutdown.load(std::memory_order_relaxed)) {
        std::vector<common::utils::FSEvent> events;

        auto err = mWatcher->ReadEvents(cRetryInterval, events);
        if (err.Is(ErrorEnum::eTimeout)) {
            continue;
        }

        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(Error(err, "can't read file events"));
        }

        bool signaled = false;

        for (const auto& event : events) {
            // Atomic replacement by rename is reported as creation
            if (signaled
                || !(event.Has(common::utils::FSEventType::eModify)
                    || event.Has(common::utils::FSEventType::eCreate))) {
                continue;
            }

            if (std::find(mWatchedFiles.begin(), mWatchedFiles.end(), event.mName) == mWatchedFiles.end()) {
                continue;
            }

            LOG_DBG() << "Grub file modified" << Log::Field("path", event.mPath.c_str())
                      << Log::Field("name", event.mName.c_str());

            if (err = mTransport->EmitFileChanged(); !err.IsNone()) {
                return AOS_ERROR_WRAP(Error(err, "can't signal file change"));
            }

            signaled = true;
        }
    }

    return ErrorEnum::eNone;
}

bool EventCoordinator::WaitIdle()
{
    Duration elapsed {};

    while (elapsed < mIdleTimeout) {
        if (mShutdown.load(std::memory_order_relaxed)) {
            return false;
        }

        if (mTransport->WaitActivity(cRetryInterval)) {
            elapsed = Duration();
        } else {
            elapsed = elapsed + cRetryInterval;
        }
    }

    LOG_DBG() << "Idle timeout exceeded" << Log::Field("idleTimeout", mIdleTimeout.Milliseconds());

    return true;
}

void EventCoordinator::Complete(ExitReason reason, const Error& err)
{
    std::lock_guard lock {mMutex};

    if (mCompleted) {
        return;
    }

    mCompleted = true;
    mResult    = {reason, err};

    mCondVar.notify_all();
}

} // namespace bootkit::events
