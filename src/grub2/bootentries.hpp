/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef BOOTKIT_GRUB2_BOOTENTRIES_HPP_
#define BOOTKIT_GRUB2_BOOTENTRIES_HPP_

#include <optional>
#include <string>
#include <vector>

#include <common/types.hpp>

namespace bootkit::grub2 {

/**
 * Separator of boot entry path components.
 */
constexpr auto cPathSeparator = '>';

/**
 * Bootable menu entry of generated grub menu.
 */
struct BootEntry {
    std::string              mName;
    std::vector<std::string> mSubmenus;

    /**
     * Returns entry path: enclosing submenus and entry name joined by '>'.
     *
     * @return std::string.
     */
    std::string GetFullPath() const;

    /**
     * Compares boot entries.
     *
     * @param other boot entry to compare with.
     * @return bool.
     */
    bool operator==(const BootEntry& other) const { return mName == other.mName && mSubmenus == other.mSubmenus; }
};

/**
 * Boot entries with the currently selected one.
 */
struct BootEntryCatalog {
    std::vector<BootEntry>     mEntries;
    std::optional<std::string> mSelected;
};

/**
 * Parses generated grub menu text.
 *
 * @param text grub.cfg content.
 * @return std::vector<BootEntry> entries in file order.
 */
std::vector<BootEntry> ParseMenu(const std::string& text);

/**
 * Resolves saved_entry of grub environment against boot entries.
 *
 * Numeric value is treated as zero based entry index, any other value as exact entry name.
 *
 * @param text grubenv content.
 * @param entries boot entries.
 * @return RetWithError<std::optional<std::string>> selected entry name if resolved.
 */
RetWithError<std::optional<std::string>> ResolveSelection(
    const std::string& text, const std::vector<BootEntry>& entries);

/**
 * Builds boot entry catalog from grub menu and grub environment files.
 *
 * Missing grub environment file means no selection.
 *
 * @param menuFile grub.cfg path.
 * @param envFile grubenv path.
 * @param[out] catalog boot entry catalog.
 * @return Error.
 */
Error BuildCatalog(const std::string& menuFile, const std::string& envFile, BootEntryCatalog& catalog);

} // namespace bootkit::grub2

#endif
