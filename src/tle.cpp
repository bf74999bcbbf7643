/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/tle.hpp>
#include <tlecore/catalog.hpp>
#include <tlecore/checksum.hpp>

#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlecore {

std::string TLE::asText(bool includeName) const {
    std::ostringstream s;
    if (includeName && name && !name->empty()) {
        s << *name << '\n';
    }
    s << line1 << '\n' << line2 << '\n';
    return s.str();
}

time_point TLE::getEpoch() const {
    return epoch(line1);
}

TLE assemble(ExtractedLines lines, std::string_view requestedID, std::string_view source) {
    if (lines.line1.empty() || lines.line2.empty()) {
        throw ParseException(ErrorKind::EmptyLine);
    }
    if (!lines.line1.starts_with("1 ") || !lines.line2.starts_with("2 ")) {
        throw ParseException(ErrorKind::BadLinePrefix);
    }
    if (!checksum(lines.line1) || !checksum(lines.line2)) {
        throw ParseException(ErrorKind::ChecksumFailed);
    }

    std::string objectID = resolveObjectID(lines.line1, lines.line2, requestedID);

    return TLE{
        .objectID = std::move(objectID),
        .name = std::move(lines.name),
        .line1 = std::move(lines.line1),
        .line2 = std::move(lines.line2),
        .source = std::string(source.empty() ? UNKNOWN_SOURCE : source)
    };
}

TLE parse(std::string_view text, std::string_view requestedID, std::string_view source) {
    ExtractedLines lines = extractLines(text);
    PayloadShape shape = lines.shape;

    TLE tle = assemble(std::move(lines), requestedID, source);
    debug("Parsed TLE {} from {} payload (source: {})", tle.objectID,
        shape == PayloadShape::Json ? "JSON" : "text", tle.source);
    return tle;
}

}
