/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exception.hpp"

namespace bootkit::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

BootkitException::BootkitException(const Error& err, const std::string& message)
    : Poco::Exception(message, err.Message(), err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
    std::string finalMessage;

    if (!message.empty()) {
        finalMessage = message;

        if (auto errStr = ErrorToString(err); !errStr.empty()) {
            finalMessage += ": " + errStr;
        }
    } else {
        finalMessage = ErrorToString(err);
    }

    Poco::Exception::message(finalMessage);
}

Error ToAosError(const std::exception& e, ErrorEnum err)
{
    if (const auto* bootkitExc = dynamic_cast<const BootkitException*>(&e)) {
        return bootkitExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return Error {err, pocoExc->displayText().c_str()};
    }

    return Error {err, e.what()};
}

std::string ErrorToString(const Error& err)
{
    aos::StaticString<aos::cMaxErrorStrLen> errStr;

    if (!errStr.Convert(err).IsNone()) {
        return err.Message();
    }

    return errStr.CStr();
}

} // namespace bootkit::common::utils
