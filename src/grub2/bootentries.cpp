/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

#include <Poco/NumberParser.h>
#include <Poco/String.h>

#include <core/common/tools/logger.hpp>

#include <common/utils/filesystem.hpp>

#include "bootentries.hpp"

namespace bootkit::grub2 {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

const std::regex cMenuItemRegex {R"(^(menuentry|submenu)\s+(?:'([^']*)'|"([^"]*)"))"};
constexpr auto   cSubmenuKeyword   = "submenu";
constexpr auto   cBlockEnd         = "}";
constexpr auto   cSavedEntryKey    = "saved_entry";
constexpr auto   cEnvCommentMarker = '#';

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

bool IsIndex(const std::string& value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

Error ParseError(const std::string& reason, size_t line)
{
    auto message = reason + " at line " + std::to_string(line + 1);

    return Error(ErrorEnum::eInvalidArgument, message.c_str());
}

} // namespace

/***********************************************************************************************************************
 * BootEntry
 **********************************************************************************************************************/

std::string BootEntry::GetFullPath() const
{
    std::string path;

    for (const auto& submenu : mSubmenus) {
        path += submenu;
        path += cPathSeparator;
    }

    return path + mName;
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::vector<BootEntry> ParseMenu(const std::string& text)
{
    std::vector<BootEntry>   entries;
    std::vector<std::string> submenus;
    bool                     entryOpened = false;
    std::istringstream       stream(text);
    std::string              line;

    while (std::getline(stream, line)) {
        const auto trimmed = Poco::trim(line);

        if (trimmed == cBlockEnd) {
            if (entryOpened) {
                entryOpened = false;
            } else if (!submenus.empty()) {
                submenus.pop_back();
            }

            continue;
        }

        std::smatch match;

        if (!std::regex_search(trimmed, match, cMenuItemRegex)) {
            continue;
        }

        auto name = match[2].matched ? match[2].str() : match[3].str();

        if (match[1] == cSubmenuKeyword) {
            submenus.push_back(std::move(name));

            continue;
        }

        entries.push_back(BootEntry {std::move(name), submenus});
        entryOpened = true;
    }

    return entries;
}

RetWithError<std::optional<std::string>> ResolveSelection(
    const std::string& text, const std::vector<BootEntry>& entries)
{
    std::istringstream stream(text);
    std::string        line;

    for (size_t i = 0; std::getline(stream, line); i++) {
        const auto trimmed = Poco::trim(line);

        if (trimmed.empty() || trimmed.front() == cEnvCommentMarker) {
            continue;
        }

        const auto separator = trimmed.find('=');

        if (Poco::trim(trimmed.substr(0, separator)) != cSavedEntryKey) {
            continue;
        }

        if (separator == std::string::npos) {
            return {std::nullopt, AOS_ERROR_WRAP(ParseError("missing '=' in saved_entry", i))};
        }

        const auto value = Poco::trim(trimmed.substr(separator + 1));

        if (value.empty()) {
            return {std::nullopt, AOS_ERROR_WRAP(ParseError("empty saved_entry", i))};
        }

        if (IsIndex(value)) {
            Poco::UInt64 index = 0;

            if (!Poco::NumberParser::tryParseUnsigned64(value, index) || index >= entries.size()) {
                LOG_WRN() << "Saved entry index out of range" << Log::Field("index", value.c_str())
                          << Log::Field("entries", entries.size());

                return {std::nullopt, ErrorEnum::eNone};
            }

            return {entries[index].mName, ErrorEnum::eNone};
        }

        auto it = std::find_if(
            entries.begin(), entries.end(), [&value](const BootEntry& entry) { return entry.mName == value; });
        if (it == entries.end()) {
            LOG_WRN() << "Saved entry not found" << Log::Field("name", value.c_str());

            return {std::nullopt, ErrorEnum::eNone};
        }

        return {it->mName, ErrorEnum::eNone};
    }

    return {std::nullopt, ErrorEnum::eNone};
}

Error BuildCatalog(const std::string& menuFile, const std::string& envFile, BootEntryCatalog& catalog)
{
    LOG_DBG() << "Build boot entry catalog" << Log::Field("menuFile", menuFile.c_str())
              << Log::Field("envFile", envFile.c_str());

    auto [menu, err] = common::utils::ReadFile(menuFile);
    if (!err.IsNone()) {
        return Error(err, "can't read grub menu");
    }

    BootEntryCatalog result;

    result.mEntries = ParseMenu(menu);

    std::string env;

    Tie(env, err) = common::utils::ReadFile(envFile);
    if (err.Is(ErrorEnum::eNotFound)) {
        LOG_WRN() << "Grub environment not found" << Log::Field("envFile", envFile.c_str());

        catalog = std::move(result);

        return ErrorEnum::eNone;
    }

    if (!err.IsNone()) {
        return Error(err, "can't read grub environment");
    }

    Tie(result.mSelected, err) = ResolveSelection(env, result.mEntries);
    if (!err.IsNone()) {
        return err;
    }

    catalog = std::move(result);

    return ErrorEnum::eNone;
}

} // namespace bootkit::grub2
