/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_DBUS_SERVER_HPP_
#define BOOTKIT_DBUS_SERVER_HPP_

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <poll.h>
#include <systemd/sd-bus.h>

#include <config/config.hpp>
#include <handler/itf/requesthandler.hpp>

#include "itf/transport.hpp"

namespace bootkit::dbus {

/**
 * Makes poll descriptor from bus descriptor and events.
 *
 * @param fd result of sd_bus_get_fd.
 * @param events result of sd_bus_get_events.
 * @return RetWithError<pollfd>.
 */
RetWithError<pollfd> MakeBusPollFD(int fd, int events);

/**
 * D-Bus server exposing bootloader config and boot entries.
 */
class Server : public TransportItf {
public:
    /**
     * Destructor.
     */
    ~Server();

    /**
     * Initializes server.
     *
     * @param config D-Bus config.
     * @param handler requests handler.
     * @return Error.
     */
    Error Init(const config::DBusConfig& config, handler::RequestHandlerItf& handler);

    /**
     * Connects to the bus, registers objects, acquires bus name and starts processing.
     *
     * @return Error.
     */
    Error Start();

    /**
     * Returns counted handle to the transport.
     *
     * @return std::shared_ptr<TransportItf>.
     */
    std::shared_ptr<TransportItf> GetHandle();

    /**
     * Waits until all handles are released, stops processing and closes the bus.
     *
     * @return Error.
     */
    Error GracefulShutdown();

    /**
     * Emits grub config file changed signal.
     *
     * @return Error.
     */
    Error EmitFileChanged() override;

    /**
     * Waits for client activity.
     *
     * @param timeout wait timeout.
     * @return bool.
     */
    bool WaitActivity(const Duration& timeout) override;

private:
    static constexpr auto cConfigInterface    = "org.opensuse.bootloader.Config";
    static constexpr auto cBootEntryInterface = "org.opensuse.bootloader.BootEntry";
    static constexpr auto cFileChangedSignal  = "FileChanged";

    static int HandleGetConfig(sd_bus_message* message, void* userdata, sd_bus_error* retError);
    static int HandleSetConfig(sd_bus_message* message, void* userdata, sd_bus_error* retError);
    static int HandleGetEntries(sd_bus_message* message, void* userdata, sd_bus_error* retError);

    static const sd_bus_vtable sConfigVTable[];
    static const sd_bus_vtable sBootEntryVTable[];

    int  Reply(sd_bus_message* message, const std::function<std::string()>& request);
    void ProcessMessages();
    void ReleaseHandle();
    void RecordActivity();
    void Close();

    config::DBusConfig          mConfig;
    handler::RequestHandlerItf* mHandler {};

    sd_bus*      mBus {};
    sd_bus_slot* mConfigSlot {};
    sd_bus_slot* mBootEntrySlot {};
    std::mutex   mBusMutex;

    std::thread      mProcessThread;
    std::atomic_bool mStop {};

    std::mutex              mActivityMutex;
    std::condition_variable mActivityCondVar;
    bool                    mActivity {};

    std::mutex              mHandlesMutex;
    std::condition_variable mHandlesCondVar;
    size_t                  mHandles {};
};

} // namespace bootkit::dbus

#endif
