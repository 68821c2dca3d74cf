/*
 * Copyright (C) 2024 Renesas Electronics Corporation.
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <core/common/tools/logger.hpp>

#include "fswatcher.hpp"

namespace bootkit::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

FSWatcher::~FSWatcher()
{
    Close();
}

Error FSWatcher::Watch(const std::vector<std::string>& paths, const std::vector<FSEventType>& types)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Init file system watcher" << Log::Field("pathCount", paths.size());

    if (mInotifyFd >= 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "file system watcher already started"));
    }

    const auto mask = ToInotifyMask(types);
    if (mask == 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "no valid fs event specified"));
    }

    mInotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (mInotifyFd < 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eFailed, strerror(errno)));
    }

    mEpollFd = epoll_create1(EPOLL_CLOEXEC);
    if (mEpollFd < 0) {
        auto err = Error(ErrorEnum::eFailed, strerror(errno));

        CloseDescriptors();

        return AOS_ERROR_WRAP(err);
    }

    epoll_event ev {};

    ev.events  = EPOLLIN;
    ev.data.fd = mInotifyFd;

    if (epoll_ctl(mEpollFd, EPOLL_CTL_ADD, mInotifyFd, &ev) < 0) {
        auto err = Error(ErrorEnum::eFailed, strerror(errno));

        CloseDescriptors();

        return AOS_ERROR_WRAP(err);
    }

    for (const auto& path : paths) {
        LOG_DBG() << "Start watching" << Log::Field("path", path.c_str());

        int wd = inotify_add_watch(mInotifyFd, path.c_str(), mask);
        if (wd < 0) {
            auto err = Error(ErrorEnum::eFailed, strerror(errno));

            LOG_ERR() << "Can't watch path" << Log::Field("path", path.c_str()) << Log::Field(err);

            CloseDescriptors();

            return AOS_ERROR_WRAP(err);
        }

        mWatchDescriptors[wd] = path;
    }

    return ErrorEnum::eNone;
}

Error FSWatcher::ReadEvents(Duration timeout, std::vector<FSEvent>& events)
{
    constexpr auto cItemSize = sizeof(struct inotify_event) + cMaxNameLen + 1;

    std::lock_guard lock {mMutex};

    if (mInotifyFd < 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "file system watcher is not started"));
    }

    epoll_event epollEvent {};

    const auto waitResult = epoll_wait(mEpollFd, &epollEvent, 1, static_cast<int>(timeout.Milliseconds()));
    if (waitResult < 0) {
        if (errno == EINTR) {
            return ErrorEnum::eTimeout;
        }

        return AOS_ERROR_WRAP(Error(ErrorEnum::eFailed, strerror(errno)));
    }

    if (waitResult == 0) {
        return ErrorEnum::eTimeout;
    }

    std::vector<char> buffer(cItemSize * cMaxPollEvents);

    const auto length = read(mInotifyFd, buffer.data(), buffer.size());
    if (length < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ErrorEnum::eTimeout;
        }

        return AOS_ERROR_WRAP(Error(ErrorEnum::eFailed, strerror(errno)));
    }

    ssize_t i = 0;

    while (i < length) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(&buffer[i]);

        i += sizeof(struct inotify_event) + event->len;

        auto it = mWatchDescriptors.find(event->wd);
        if (it == mWatchDescriptors.end()) {
            continue;
        }

        FSEvent fsEvent {it->second, event->len > 0 ? event->name : "", ToFSEvent(event->mask)};

        events.push_back(std::move(fsEvent));
    }

    return ErrorEnum::eNone;
}

void FSWatcher::Close()
{
    std::lock_guard lock {mMutex};

    CloseDescriptors();
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void FSWatcher::CloseDescriptors()
{
    for (const auto& [wd, path] : mWatchDescriptors) {
        if (inotify_rm_watch(mInotifyFd, wd) < 0) {
            LOG_WRN() << "Failed to remove inotify watch" << Log::Field("path", path.c_str())
                      << Log::Field(Error(errno));
        }
    }

    mWatchDescriptors.clear();

    if (mEpollFd >= 0) {
        close(mEpollFd);
        mEpollFd = -1;
    }

    if (mInotifyFd >= 0) {
        close(mInotifyFd);
        mInotifyFd = -1;
    }
}

std::vector<FSEventType> FSWatcher::ToFSEvent(uint32_t mask) const
{
    std::vector<FSEventType> types;

    if (mask & IN_MODIFY) {
        types.push_back(FSEventType::eModify);
    }

    if (mask & (IN_CLOSE_WRITE | IN_CLOSE_NOWRITE)) {
        types.push_back(FSEventType::eClose);
    }

    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        types.push_back(FSEventType::eCreate);
    }

    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        types.push_back(FSEventType::eDelete);
    }

    return types;
}

uint32_t FSWatcher::ToInotifyMask(const std::vector<FSEventType>& types) const
{
    uint32_t mask = 0;

    for (const auto type : types) {
        switch (type) {
        case FSEventType::eModify:
            mask |= IN_MODIFY;
            break;
        case FSEventType::eClose:
            mask |= IN_CLOSE_WRITE | IN_CLOSE_NOWRITE;
            break;
        case FSEventType::eCreate:
            mask |= IN_CREATE | IN_MOVED_TO;
            break;
        case FSEventType::eDelete:
            mask |= IN_DELETE | IN_MOVED_FROM;
            break;
        default:
            LOG_WRN() << "Unsupported fs event type" << Log::Field("type", static_cast<int>(type));
            break;
        }
    }

    return mask;
}

} // namespace bootkit::common::utils
