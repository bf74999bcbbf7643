/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_STRINGS_HPP
#define __TLECORE_STRINGS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace tlecore {

// Characters treated as whitespace when trimming lines and fields
constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

std::string_view trimLeft(std::string_view str);
std::string_view trimRight(std::string_view str);
std::string_view trim(std::string_view str);

/**
 * True if the string is non-empty and holds only ASCII digits.
 */
bool isDigits(std::string_view str);

/**
 * Split text on CR or LF, trim each line and drop the empty ones.
 */
std::vector<std::string> splitLines(std::string_view text);

}

#endif
