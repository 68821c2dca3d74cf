/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_COMMON_UTILS_JSON_HPP_
#define BOOTKIT_COMMON_UTILS_JSON_HPP_

#include <optional>
#include <string>
#include <vector>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <common/types.hpp>

namespace bootkit::common::utils {

/**
 * Parses json string.
 *
 * @param json json string.
 * @param preserveKeyOrder keep object keys in document order.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json, bool preserveKeyOrder = false) noexcept;

/**
 * Converts json object to string.
 *
 * @param json json object.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Object& json);

/**
 * Converts json array to string.
 *
 * @param json json array.
 * @return std::string.
 */
std::string Stringify(const Poco::JSON::Array& json);

/**
 * Wraps a JSON object and provides case insensitive access to its keys.
 */
class CaseInsensitiveObjectWrapper {
public:
    /**
     * Constructor.
     *
     * @param var dynamic var holding a JSON object pointer.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var);

    /**
     * Constructor.
     *
     * @param object JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::JSON::Object::Ptr& object);

    /**
     * Checks if key exists.
     *
     * @param key key.
     * @return bool.
     */
    bool Has(const std::string& key) const;

    /**
     * Returns value by key.
     *
     * @param key key.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key) const
    {
        return GetRaw(key).convert<T>();
    }

    /**
     * Returns value by key or default value if key does not exist.
     *
     * @param key key.
     * @param defaultValue default value.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key, const T& defaultValue) const
    {
        return GetOptionalValue<T>(key).value_or(defaultValue);
    }

    /**
     * Returns value by key or default value if key does not exist.
     *
     * @param key key.
     * @param defaultValue default value.
     * @return std::string.
     */
    std::string GetValue(const std::string& key, const char* defaultValue) const
    {
        return GetOptionalValue<std::string>(key).value_or(defaultValue);
    }

    /**
     * Returns optional value by key.
     *
     * @param key key.
     * @return std::optional<T>.
     */
    template <typename T>
    std::optional<T> GetOptionalValue(const std::string& key) const
    {
        if (!Has(key)) {
            return std::nullopt;
        }

        auto value = GetRaw(key);
        if (value.isEmpty()) {
            return std::nullopt;
        }

        return value.convert<T>();
    }

    /**
     * Returns nested object by key.
     *
     * @param key key.
     * @return CaseInsensitiveObjectWrapper.
     */
    CaseInsensitiveObjectWrapper GetObject(const std::string& key) const;

    /**
     * Returns object member names in their original case.
     *
     * @return std::vector<std::string>.
     */
    std::vector<std::string> GetNames() const;

private:
    Poco::Dynamic::Var GetRaw(const std::string& key) const;

    Poco::JSON::Object::Ptr mObject;
};

} // namespace bootkit::common::utils

#endif
