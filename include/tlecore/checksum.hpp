/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_CHECKSUM_HPP
#define __TLECORE_CHECKSUM_HPP

#include <string_view>

namespace tlecore {

/**
 * Calculate the TLE checksum of a line body (mod 10 sum of digits, with '-' counting as 1).
 * Every other character contributes nothing.
 */
int calculateChecksum(std::string_view body);

/**
 * Validate a TLE line against its trailing check digit.
 *
 * Trailing whitespace is ignored. The last remaining character must be a
 * digit equal to the checksum of everything before it.
 *
 * @param line A single TLE line
 * @return false for empty lines, a non-digit last character or a mismatch
 */
bool checksum(std::string_view line);

}

#endif
