/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/extractor.hpp>
#include <tlecore/errors.hpp>
#include <tlecore/strings.hpp>

#include <vector>

#include <rapidjson/document.h>
#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlecore {

std::ostream& operator<<(std::ostream &os, const PayloadShape &shape) {
    switch (shape) {
        case PayloadShape::Text:
            os << "Text";
            break;
        case PayloadShape::Json:
            os << "Json";
            break;
    }
    return os;
}

static bool isTLELine(const std::string &line) {
    return line.starts_with("1 ") || line.starts_with("2 ");
}

std::optional<ExtractedLines> scanText(std::string_view text) {
    std::vector<std::string> lines = splitLines(text);

    for (std::size_t i = 0; i + 1 < lines.size(); i++) {
        if (!lines[i].starts_with("1 ") || !lines[i + 1].starts_with("2 ")) {
            continue;
        }

        ExtractedLines result{
            .line1 = lines[i],
            .line2 = lines[i + 1],
            .name = std::nullopt,
            .shape = PayloadShape::Text
        };
        if (i > 0 && !isTLELine(lines[i - 1])) {
            result.name = lines[i - 1];
        }
        debug("Located TLE line pair at line {} of {}", i + 1, lines.size());
        return result;
    }

    return std::nullopt;
}

// Non-string line values decode as empty and are rejected later
static std::string lineValue(const rapidjson::Value &value) {
    if (!value.IsString()) {
        return "";
    }
    return std::string(trim(std::string_view(value.GetString(), value.GetStringLength())));
}

std::optional<ExtractedLines> decodeJson(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());

    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    if (!doc.HasMember("line1") || !doc.HasMember("line2")) {
        return std::nullopt;
    }

    ExtractedLines result{
        .line1 = lineValue(doc["line1"]),
        .line2 = lineValue(doc["line2"]),
        .name = std::nullopt,
        .shape = PayloadShape::Json
    };

    auto name = doc.FindMember("name");
    if (name != doc.MemberEnd() && name->value.IsString()) {
        result.name = std::string(name->value.GetString(), name->value.GetStringLength());
    }

    debug("Decoded TLE line pair from JSON payload");
    return result;
}

ExtractedLines extractLines(std::string_view text) {
    if (auto lines = scanText(text)) {
        return std::move(*lines);
    }
    if (auto lines = decodeJson(text)) {
        return std::move(*lines);
    }
    throw ParseException(ErrorKind::LinePairNotFound);
}

}
