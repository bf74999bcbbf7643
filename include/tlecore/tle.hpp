/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_TLE_HPP
#define __TLECORE_TLE_HPP

#include <tlecore/epoch.hpp>
#include <tlecore/errors.hpp>
#include <tlecore/extractor.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tlecore {

// Source tag used when the caller does not name a provider
constexpr std::string_view UNKNOWN_SOURCE = "unknown";

/**
 * A validated two-line element set.
 *
 * Both lines start with their line number marker, pass the checksum and
 * carry the same catalog number. Records are plain values.
 */
struct TLE {
    std::string objectID;               ///< Requested ID, or the catalog number from line 1
    std::optional<std::string> name;    ///< Common name, if the payload carried one
    std::string line1;                  ///< TLE line 1, trimmed
    std::string line2;                  ///< TLE line 2, trimmed
    std::string source;                 ///< Data provider tag

    /**
     * Render as "name\nline1\nline2\n", or the two lines alone when there
     * is no name or includeName is false.
     */
    std::string asText(bool includeName = true) const;

    /**
     * Decode the epoch from line 1.
     * @throws EpochException if the epoch fields are malformed
     */
    time_point getEpoch() const;

    bool operator==(const TLE &other) const = default;
};

/**
 * Parse a payload into a TLE record.
 *
 * Accepts free text (optional name line followed by the two element lines)
 * or a JSON object with "line1", "line2" and an optional "name".
 *
 * @param text Raw payload
 * @param requestedID Catalog number the caller asked for, empty if none
 * @param source Provider tag, empty for "unknown"
 * @throws ParseException describing the first check that failed
 */
TLE parse(std::string_view text, std::string_view requestedID = "", std::string_view source = "");

/**
 * Validate extracted lines and build the record.
 * @throws ParseException on EmptyLine, BadLinePrefix, ChecksumFailed,
 *         CatalogMismatch or RequestedIdMismatch
 */
TLE assemble(ExtractedLines lines, std::string_view requestedID, std::string_view source);

}

#endif
