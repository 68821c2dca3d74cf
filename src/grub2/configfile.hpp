/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_GRUB2_CONFIGFILE_HPP_
#define BOOTKIT_GRUB2_CONFIGFILE_HPP_

#include <map>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <common/types.hpp>

namespace bootkit::grub2 {

/**
 * Key value line of grub config file.
 */
struct KeyValue {
    std::string mKey;
    std::string mValue;
    size_t      mLine {};
    bool        mDirty {};
    std::string mOriginal;

    /**
     * Returns line text: the original one if value was not changed, key="value" otherwise.
     *
     * @return std::string.
     */
    std::string ToString() const;

    /**
     * Compares key values.
     *
     * @param other key value to compare with.
     * @return bool.
     */
    bool operator==(const KeyValue& other) const
    {
        return mKey == other.mKey && mValue == other.mValue && mLine == other.mLine && mDirty == other.mDirty
            && mOriginal == other.mOriginal;
    }
};

/**
 * Grub config file (/etc/default/grub) model.
 *
 * Keeps every line of the source so that untouched lines are serialized byte-identical.
 */
class ConfigFile {
public:
    /**
     * Parses config text.
     *
     * @param text config text.
     * @return Error.
     */
    Error Parse(const std::string& text);

    /**
     * Parses config lines.
     *
     * @param lines config lines without line terminators.
     * @return Error.
     */
    Error Parse(const std::vector<std::string>& lines);

    /**
     * Loads and parses config file.
     *
     * @param path file path.
     * @return Error.
     */
    Error Load(const std::string& path);

    /**
     * Writes config to file.
     *
     * @param path file path.
     * @return Error.
     */
    Error Save(const std::string& path) const;

    /**
     * Sets value of the key. Appends new key value line if the key doesn't exist.
     *
     * @param key key.
     * @param value value.
     */
    void SetKeyValue(const std::string& key, const std::string& value);

    /**
     * Returns serialized config.
     *
     * @return std::string.
     */
    std::string ToString() const;

    /**
     * Finds key value by key.
     *
     * @param key key.
     * @return const KeyValue* or nullptr if not found.
     */
    const KeyValue* Find(const std::string& key) const;

    /**
     * Returns key to key value mapping.
     *
     * @return std::map<std::string, KeyValue>.
     */
    std::map<std::string, KeyValue> GetKeyValues() const;

    /**
     * Returns key values in file order.
     *
     * @return std::vector<KeyValue>.
     */
    std::vector<KeyValue> GetValues() const;

private:
    static constexpr auto cCommentMarker = '#';
    static constexpr auto cSeparator     = '=';

    using Line = std::variant<KeyValue, std::string>;

    static RetWithError<KeyValue> ParseKeyValue(size_t index, const std::string& line);

    std::vector<Line>                       mLines;
    std::unordered_map<std::string, size_t> mIndex;
};

} // namespace bootkit::grub2

#endif
