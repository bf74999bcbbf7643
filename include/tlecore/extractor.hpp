/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_EXTRACTOR_HPP
#define __TLECORE_EXTRACTOR_HPP

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace tlecore {

/**
 * Which branch of the extractor located the lines.
 */
enum class PayloadShape {
    Text,
    Json
};

std::ostream& operator<<(std::ostream &os, const PayloadShape &shape);

/**
 * Unvalidated line pair located in a payload.
 */
struct ExtractedLines {
    std::string line1;
    std::string line2;
    std::optional<std::string> name;
    PayloadShape shape = PayloadShape::Text;
};

/**
 * Scan free text for the first "1 " / "2 " line pair.
 *
 * The line directly before the pair becomes the name unless it is itself
 * a TLE line.
 */
std::optional<ExtractedLines> scanText(std::string_view text);

/**
 * Decode a JSON object carrying "line1", "line2" and an optional "name".
 * Returns nothing if the text is not such an object.
 */
std::optional<ExtractedLines> decodeJson(std::string_view text);

/**
 * Locate a TLE line pair, trying the text scan first and JSON second.
 * @throws ParseException with LinePairNotFound if neither branch succeeds
 */
ExtractedLines extractLines(std::string_view text);

}

#endif
