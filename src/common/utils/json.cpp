/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/JSONException.h>
#include <Poco/JSON/ParseHandler.h>
#include <Poco/JSON/Parser.h>
#include <Poco/String.h>

#include "exception.hpp"
#include "json.hpp"

namespace bootkit::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json, bool preserveKeyOrder) noexcept
{
    try {
        Poco::JSON::Parser parser {new Poco::JSON::ParseHandler(preserveKeyOrder)};

        return {parser.parse(json), ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, ToAosError(e, ErrorEnum::eInvalidArgument)};
    }
}

std::string Stringify(const Poco::JSON::Object& json)
{
    std::ostringstream oss;

    json.stringify(oss);

    return oss.str();
}

std::string Stringify(const Poco::JSON::Array& json)
{
    std::ostringstream oss;

    json.stringify(oss);

    return oss.str();
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var)
{
    if (var.type() != typeid(Poco::JSON::Object::Ptr)) {
        throw Poco::JSON::JSONException("object expected");
    }

    mObject = var.extract<Poco::JSON::Object::Ptr>();
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object)
    : mObject(object)
{
    if (mObject.isNull()) {
        throw Poco::JSON::JSONException("object expected");
    }
}

bool CaseInsensitiveObjectWrapper::Has(const std::string& key) const
{
    for (const auto& [name, value] : *mObject) {
        (void)value;

        if (Poco::icompare(name, key) == 0) {
            return true;
        }
    }

    return false;
}

CaseInsensitiveObjectWrapper CaseInsensitiveObjectWrapper::GetObject(const std::string& key) const
{
    return CaseInsensitiveObjectWrapper(GetRaw(key));
}

std::vector<std::string> CaseInsensitiveObjectWrapper::GetNames() const
{
    std::vector<std::string> names;

    mObject->getNames(names);

    return names;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Poco::Dynamic::Var CaseInsensitiveObjectWrapper::GetRaw(const std::string& key) const
{
    for (const auto& [name, value] : *mObject) {
        if (Poco::icompare(name, key) == 0) {
            return value;
        }
    }

    throw Poco::NotFoundException("key not found", key);
}

} // namespace bootkit::common::utils
