/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <sstream>

#include <Poco/String.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/filesystem.hpp>

#include "configfile.hpp"

namespace bootkit::grub2 {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::vector<std::string> SplitLines(const std::string& text)
{
    std::vector<std::string> lines;
    size_t                   start = 0;

    while (true) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));

            break;
        }

        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}

std::string RemoveQuotes(const std::string& value)
{
    std::string result;

    std::copy_if(value.begin(), value.end(), std::back_inserter(result), [](char ch) { return ch != '\'' && ch != '"'; });

    return result;
}

} // namespace

/***********************************************************************************************************************
 * KeyValue
 **********************************************************************************************************************/

std::string KeyValue::ToString() const
{
    if (!mDirty) {
        return mOriginal;
    }

    return mKey + "=\"" + mValue + "\"";
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ConfigFile::Parse(const std::string& text)
{
    return Parse(SplitLines(text));
}

Error ConfigFile::Parse(const std::vector<std::string>& lines)
{
    std::vector<Line>                       parsedLines;
    std::unordered_map<std::string, size_t> index;

    parsedLines.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); i++) {
        const auto trimmed = Poco::trim(lines[i]);

        if (trimmed.empty() || trimmed.front() == cCommentMarker) {
            parsedLines.emplace_back(lines[i]);

            continue;
        }

        auto [keyValue, err] = ParseKeyValue(i, lines[i]);
        if (!err.IsNone()) {
            return err;
        }

        // Last occurrence wins as when the file is sourced by shell
        index[keyValue.mKey] = parsedLines.size();

        parsedLines.emplace_back(std::move(keyValue));
    }

    mLines = std::move(parsedLines);
    mIndex = std::move(index);

    return ErrorEnum::eNone;
}

Error ConfigFile::Load(const std::string& path)
{
    LOG_DBG() << "Load grub config" << Log::Field("path", path.c_str());

    auto [text, err] = common::utils::ReadFile(path);
    if (!err.IsNone()) {
        return Error(err, "can't read grub config");
    }

    if (err = Parse(text); !err.IsNone()) {
        return err;
    }

    return ErrorEnum::eNone;
}

Error ConfigFile::Save(const std::string& path) const
{
    LOG_DBG() << "Save grub config" << Log::Field("path", path.c_str());

    if (auto err = common::utils::WriteFile(path, ToString()); !err.IsNone()) {
        return Error(err, "can't write grub config");
    }

    return ErrorEnum::eNone;
}

void ConfigFile::SetKeyValue(const std::string& key, const std::string& value)
{
    if (auto it = mIndex.find(key); it != mIndex.end()) {
        auto& keyValue = std::get<KeyValue>(mLines[it->second]);

        if (keyValue.mValue == value) {
            return;
        }

        LOG_DBG() << "Change grub value" << Log::Field("key", key.c_str()) << Log::Field("value", value.c_str());

        keyValue.mValue = value;
        keyValue.mDirty = true;

        return;
    }

    LOG_DBG() << "Add grub value" << Log::Field("key", key.c_str()) << Log::Field("value", value.c_str());

    mIndex[key] = mLines.size();

    mLines.emplace_back(KeyValue {key, value, mLines.size(), true, ""});
}

std::string ConfigFile::ToString() const
{
    std::ostringstream out;

    for (size_t i = 0; i < mLines.size(); i++) {
        if (i != 0) {
            out << '\n';
        }

        if (const auto* keyValue = std::get_if<KeyValue>(&mLines[i])) {
            out << keyValue->ToString();
        } else {
            out << std::get<std::string>(mLines[i]);
        }
    }

    return out.str();
}

const KeyValue* ConfigFile::Find(const std::string& key) const
{
    auto it = mIndex.find(key);
    if (it == mIndex.end()) {
        return nullptr;
    }

    return &std::get<KeyValue>(mLines[it->second]);
}

std::map<std::string, KeyValue> ConfigFile::GetKeyValues() const
{
    std::map<std::string, KeyValue> keyValues;

    for (const auto& [key, position] : mIndex) {
        keyValues.emplace(key, std::get<KeyValue>(mLines[position]));
    }

    return keyValues;
}

std::vector<KeyValue> ConfigFile::GetValues() const
{
    std::vector<KeyValue> values;

    for (const auto& line : mLines) {
        if (const auto* keyValue = std::get_if<KeyValue>(&line)) {
            values.push_back(*keyValue);
        }
    }

    return values;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<KeyValue> ConfigFile::ParseKeyValue(size_t index, const std::string& line)
{
    const auto trimmed   = Poco::trim(line);
    const auto separator = trimmed.find(cSeparator);

    if (separator == std::string::npos) {
        auto message = "missing '=' at line " + std::to_string(index + 1);

        return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, message.c_str()))};
    }

    if (separator == 0) {
        auto message = "missing key at line " + std::to_string(index + 1);

        return {{}, AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, message.c_str()))};
    }

    return {KeyValue {trimmed.substr(0, separator), RemoveQuotes(trimmed.substr(separator + 1)), index, false, line},
        ErrorEnum::eNone};
}

} // namespace bootkit::grub2
