/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/strings.hpp>

#include <algorithm>

namespace tlecore {

std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

std::string_view trim(std::string_view str) {
    return trimRight(trimLeft(str));
}

bool isDigits(std::string_view str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    while (!text.empty()) {
        auto pos = text.find_first_of("\r\n");
        auto line = trim(text.substr(0, pos));
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(pos + 1);
    }
    return lines;
}

}
