/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_CATALOG_HPP
#define __TLECORE_CATALOG_HPP

#include <string>
#include <string_view>

namespace tlecore {

// Catalog number occupies columns 3-7 of both lines
constexpr std::size_t CATALOG_FIELD_OFFSET = 2;
constexpr std::size_t CATALOG_FIELD_LENGTH = 5;

/**
 * Extract the trimmed catalog number field from a TLE line.
 * Lines shorter than 7 characters yield an empty field.
 */
std::string catalogField(std::string_view line);

/**
 * Cross-check the catalog numbers of both lines and resolve the object ID.
 *
 * The numeric comparison against requestedID only happens when both the
 * requested ID and the catalog field are purely numeric. Alphanumeric
 * identifiers (Alpha-5 catalog numbers, designators) pass unchecked.
 *
 * @param line1 TLE line 1
 * @param line2 TLE line 2
 * @param requestedID Identifier the caller asked for, empty if none
 * @return requestedID verbatim when given, otherwise the catalog field of line 1
 * @throws ParseException with CatalogMismatch or RequestedIdMismatch
 */
std::string resolveObjectID(std::string_view line1, std::string_view line2, std::string_view requestedID = "");

}

#endif
