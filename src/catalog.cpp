/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/catalog.hpp>
#include <tlecore/errors.hpp>
#include <tlecore/strings.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlecore {

// Helper function to convert a digit string to an integer, empty on overflow
static std::optional<std::int64_t> toCatalogNumber(std::string_view str) {
    std::int64_t value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

std::string catalogField(std::string_view line) {
    if (line.size() < CATALOG_FIELD_OFFSET + CATALOG_FIELD_LENGTH) {
        return "";
    }
    return std::string(trim(line.substr(CATALOG_FIELD_OFFSET, CATALOG_FIELD_LENGTH)));
}

std::string resolveObjectID(std::string_view line1, std::string_view line2, std::string_view requestedID) {
    std::string cat1 = catalogField(line1);
    std::string cat2 = catalogField(line2);
    if (cat1 != cat2) {
        throw ParseException(ErrorKind::CatalogMismatch);
    }

    // Numeric cross-check only; non-numeric identifiers pass unchecked
    if (isDigits(requestedID)) {
        std::string catDigits = cat1;
        std::erase_if(catDigits, [](char c) {
            return WHITESPACE.find(c) != std::string_view::npos;
        });
        if (isDigits(catDigits)) {
            auto requested = toCatalogNumber(requestedID);
            auto actual = toCatalogNumber(catDigits);
            if (requested && actual && *requested != *actual) {
                throw ParseException(ErrorKind::RequestedIdMismatch);
            }
        } else {
            debug("Skipping numeric check of requested ID {} against catalog field '{}'", requestedID, cat1);
        }
    }

    if (requestedID.empty()) {
        return cat1;
    }
    return std::string(requestedID);
}

}
