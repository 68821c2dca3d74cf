/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_HANDLER_ITF_REQUESTHANDLER_HPP_
#define BOOTKIT_HANDLER_ITF_REQUESTHANDLER_HPP_

#include <string>

namespace bootkit::handler {

/**
 * Bootloader requests handler interface.
 *
 * Every request returns JSON document. Failures are returned as {"error": "message"}.
 */
class RequestHandlerItf {
public:
    /**
     * Destructor.
     */
    virtual ~RequestHandlerItf() = default;

    /**
     * Returns grub config.
     *
     * @return std::string.
     */
    virtual std::string GetConfig() = 0;

    /**
     * Updates grub config.
     *
     * @param payload JSON object with key value pairs to set.
     * @return std::string updated grub config.
     */
    virtual std::string SetConfig(const std::string& payload) = 0;

    /**
     * Returns boot entries.
     *
     * @return std::string.
     */
    virtual std::string GetBootEntries() = 0;
};

} // namespace bootkit::handler

#endif
