/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_EPOCH_HPP
#define __TLECORE_EPOCH_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace tlecore {

/**
 * UTC instant with microsecond resolution.
 */
using time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Epoch field layout in line 1 (0-indexed): YY at [18,20), DDD.DDDDDDDD at [20,32)
constexpr std::size_t EPOCH_YEAR_OFFSET = 18;
constexpr std::size_t EPOCH_YEAR_LENGTH = 2;
constexpr std::size_t EPOCH_DAY_OFFSET = 20;
constexpr std::size_t EPOCH_DAY_LENGTH = 12;
constexpr std::size_t EPOCH_MIN_LINE_LENGTH = EPOCH_DAY_OFFSET + EPOCH_DAY_LENGTH;

// Two-digit years at or above the pivot belong to the 1900s
constexpr int EPOCH_PIVOT_YEAR = 57;

// Largest day magnitude accepted; keeps the microsecond time point in range
constexpr double EPOCH_MAX_DAY = 1e6;

constexpr double SECONDS_PER_DAY = 86400.0;
constexpr long long MICROSECONDS_PER_SECOND = 1000000;

/**
 * Convert a two-digit TLE year to a four-digit year.
 * 57-99 map to 1957-1999, 00-56 map to 2000-2056.
 */
int resolveEpochYear(int twoDigitYear);

/**
 * Decode the epoch encoded in TLE line 1.
 *
 * The fractional day is converted to whole seconds plus a rounded
 * microsecond remainder; a remainder that rounds to a full second is
 * carried into the seconds.
 *
 * @param line1 TLE line 1
 * @return The epoch as a UTC time point
 * @throws EpochException with EpochTooShort, InvalidEpochYear,
 *         InvalidEpochDay or NegativeEpochSeconds
 */
time_point epoch(std::string_view line1);

/**
 * Format an epoch as ISO-8601 UTC (e.g. "2020-12-09T22:00:45.999648Z").
 */
std::string formatEpoch(time_point tp);

}

#endif
