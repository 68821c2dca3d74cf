/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cerrno>
#include <poll.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/exception.hpp>
#include <common/utils/time.hpp>

#include "server.hpp"

namespace bootkit::dbus {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const auto cPollTimeout = Time::cMilliseconds * 100;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

Error SDBusError(int ret, const char* message)
{
    return Error(Error(-ret), message);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<pollfd> MakeBusPollFD(int fd, int events)
{
    if (fd < 0) {
        return {{}, AOS_ERROR_WRAP(SDBusError(fd, "can't get bus descriptor"))};
    }

    if (events < 0) {
        return {{}, AOS_ERROR_WRAP(SDBusError(events, "can't get bus events"))};
    }

    pollfd pollFD {};

    pollFD.fd     = fd;
    pollFD.events = static_cast<short>(events);

    return {pollFD, ErrorEnum::eNone};
}

/***********************************************************************************************************************
 * VTables
 **********************************************************************************************************************/

const sd_bus_vtable Server::sConfigVTable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("GetConfig", "", "s", &Server::HandleGetConfig, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("SetConfig", "s", "s", &Server::HandleSetConfig, 0),
    SD_BUS_SIGNAL("FileChanged", "", 0),
    SD_BUS_VTABLE_END,
};

const sd_bus_vtable Server::sBootEntryVTable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("GetEntries", "", "s", &Server::HandleGetEntries, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END,
};

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Server::~Server()
{
    Close();
}

Error Server::Init(const config::DBusConfig& config, handler::RequestHandlerItf& handler)
{
    LOG_DBG() << "Init D-Bus server" << Log::Field("busName", config.mBusName.c_str())
              << Log::Field("objectPath", config.mObjectPath.c_str());

    mConfig  = config;
    mHandler = &handler;

    return ErrorEnum::eNone;
}

Error Server::Start()
{
    std::lock_guard lock {mBusMutex};

    LOG_DBG() << "Start D-Bus server";

    if (mBus != nullptr) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "server already started"));
    }

    auto ret = mConfig.mSessionBus ? sd_bus_open_user(&mBus) : sd_bus_open_system(&mBus);
    if (ret < 0) {
        return AOS_ERROR_WRAP(SDBusError(ret, "can't connect to bus"));
    }

    ret = sd_bus_add_object_vtable(
        mBus, &mConfigSlot, mConfig.mObjectPath.c_str(), cConfigInterface, sConfigVTable, this);
    if (ret < 0) {
        return AOS_ERROR_WRAP(SDBusError(ret, "can't add config object"));
    }

    ret = sd_bus_add_object_vtable(
        mBus, &mBootEntrySlot, mConfig.mObjectPath.c_str(), cBootEntryInterface, sBootEntryVTable, this);
    if (ret < 0) {
        return AOS_ERROR_WRAP(SDBusError(ret, "can't add boot entry object"));
    }

    if (ret = sd_bus_request_name(mBus, mConfig.mBusName.c_str(), 0); ret < 0) {
        return AOS_ERROR_WRAP(SDBusError(ret, "can't acquire bus name"));
    }

    LOG_INF() << "Bus name acquired" << Log::Field("busName", mConfig.mBusName.c_str());

    mStop          = false;
    mProcessThread = std::thread(&Server::ProcessMessages, this);

    return ErrorEnum::eNone;
}

std::shared_ptr<TransportItf> Server::GetHandle()
{
    std::lock_guard lock {mHandlesMutex};

    mHandles++;

    return std::shared_ptr<TransportItf>(this, [this](TransportItf*) { ReleaseHandle(); });
}

Error Server::GracefulShutdown()
{
    LOG_DBG() << "Graceful shutdown";

    {
        std::unique_lock lock {mHandlesMutex};

        if (mHandles != 0) {
            LOG_DBG() << "Wait transport handles released" << Log::Field("handles", mHandles);
        }

        mHandlesCondVar.wait(lock, [this]() { return mHandles == 0; });
    }

    Close();

    LOG_INF() << "D-Bus server stopped";

    return ErrorEnum::eNone;
}

Error Server::EmitFileChanged()
{
    std::lock_guard lock {mBusMutex};

    LOG_DBG() << "Emit file changed signal";

    if (mBus == nullptr) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eWrongState, "server is not started"));
    }

    if (auto ret = sd_bus_emit_signal(mBus, mConfig.mObjectPath.c_str(), cConfigInterface, cFileChangedSignal, nullptr);
        ret < 0) {
        return AOS_ERROR_WRAP(SDBusError(ret, "can't emit signal"));
    }

    return ErrorEnum::eNone;
}

bool Server::WaitActivity(const Duration& timeout)
{
    std::unique_lock lock {mActivityMutex};

    mActivityCondVar.wait_for(lock, common::utils::ToChrono(timeout), [this]() { return mActivity; });

    auto activity = mActivity;

    mActivity = false;

    return activity;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

int Server::HandleGetConfig(sd_bus_message* message, void* userdata, sd_bus_error* retError)
{
    (void)retError;

    auto server = static_cast<Server*>(userdata);

    return server->Reply(message, [server]() { return server->mHandler->GetConfig(); });
}

int Server::HandleSetConfig(sd_bus_message* message, void* userdata, sd_bus_error* retError)
{
    (void)retError;

    auto        server  = static_cast<Server*>(userdata);
    const char* payload = nullptr;

    if (auto ret = sd_bus_message_read(message, "s", &payload); ret < 0) {
        LOG_ERR() << "Can't read set config payload" << Log::Field(SDBusError(ret, "can't read message"));

        return ret;
    }

    std::string request = payload;

    return server->Reply(message, [server, &request]() { return server->mHandler->SetConfig(request); });
}

int Server::HandleGetEntries(sd_bus_message* message, void* userdata, sd_bus_error* retError)
{
    (void)retError;

    auto server = static_cast<Server*>(userdata);

    return server->Reply(message, [server]() { return server->mHandler->GetBootEntries(); });
}

int Server::Reply(sd_bus_message* message, const std::function<std::string()>& request)
{
    RecordActivity();

    LOG_DBG() << "Method called" << Log::Field("member", sd_bus_message_get_member(message));

    auto response = request();

    if (auto ret = sd_bus_reply_method_return(message, "s", response.c_str()); ret < 0) {
        LOG_ERR() << "Can't send reply" << Log::Field(SDBusError(ret, "can't reply"));

        return ret;
    }

    return 1;
}

void Server::ProcessMessages()
{
    LOG_DBG() << "Start processing messages";

    while (!mStop) {
        pollfd pollFD {};

        {
            std::lock_guard lock {mBusMutex};

            int ret = 0;

            while ((ret = sd_bus_process(mBus, nullptr)) > 0) { }

            if (ret < 0) {
                LOG_ERR() << "Process messages failed" << Log::Field(SDBusError(ret, "can't process bus"));

                break;
            }

            Error err;

            Tie(pollFD, err) = MakeBusPollFD(sd_bus_get_fd(mBus), sd_bus_get_events(mBus));
            if (!err.IsNone()) {
                LOG_ERR() << "Process messages failed" << Log::Field(err);

                break;
            }
        }

        if (auto ret = poll(&pollFD, 1, static_cast<int>(cPollTimeout.Milliseconds())); ret < 0 && errno != EINTR) {
            LOG_ERR() << "Poll bus failed" << Log::Field(AOS_ERROR_WRAP(Error(errno)));

            break;
        }
    }

    LOG_DBG() << "Stop processing messages";
}

void Server::ReleaseHandle()
{
    std::lock_guard lock {mHandlesMutex};

    mHandles--;

    if (mHandles == 0) {
        mHandlesCondVar.notify_all();
    }
}

void Server::RecordActivity()
{
    std::lock_guard lock {mActivityMutex};

    mActivity = true;

    mActivityCondVar.notify_all();
}

void Server::Close()
{
    mStop = true;

    if (mProcessThread.joinable()) {
        mProcessThread.join();
    }

    std::lock_guard lock {mBusMutex};

    mConfigSlot    = sd_bus_slot_unref(mConfigSlot);
    mBootEntrySlot = sd_bus_slot_unref(mBootEntrySlot);

    if (mBus != nullptr) {
        mBus = sd_bus_flush_close_unref(mBus);
    }
}

} // namespace bootkit::dbus
