/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_DBUS_ITF_TRANSPORT_HPP_
#define BOOTKIT_DBUS_ITF_TRANSPORT_HPP_

#include <common/types.hpp>

namespace bootkit::dbus {

/**
 * Transport interface used by event coordinator.
 */
class TransportItf {
public:
    /**
     * Destructor.
     */
    virtual ~TransportItf() = default;

    /**
     * Emits grub config file changed signal.
     *
     * @return Error.
     */
    virtual Error EmitFileChanged() = 0;

    /**
     * Waits for client activity.
     *
     * Activity observed since the previous call is reported immediately.
     *
     * @param timeout wait timeout.
     * @return bool true if there was activity.
     */
    virtual bool WaitActivity(const Duration& timeout) = 0;
};

} // namespace bootkit::dbus

#endif
