/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/epoch.hpp>
#include <tlecore/errors.hpp>
#include <tlecore/strings.hpp>

#include <charconv>
#include <cmath>

#include <date/date.h>

namespace tlecore {

// Helper function to convert a whole field to a number, false on any leftover characters
template <typename T>
static bool toNumber(std::string_view str, T &value) {
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    return ec == std::errc() && ptr == str.data() + str.size();
}

int resolveEpochYear(int twoDigitYear) {
    if (twoDigitYear >= EPOCH_PIVOT_YEAR) {
        return 1900 + twoDigitYear;
    }
    return 2000 + twoDigitYear;
}

time_point epoch(std::string_view line1) {
    using namespace std::chrono;

    if (line1.size() < EPOCH_MIN_LINE_LENGTH) {
        throw EpochException(ErrorKind::EpochTooShort);
    }

    int twoDigitYear;
    if (!toNumber(line1.substr(EPOCH_YEAR_OFFSET, EPOCH_YEAR_LENGTH), twoDigitYear)) {
        throw EpochException(ErrorKind::InvalidEpochYear);
    }

    double dayOfYear;
    auto dayField = trim(line1.substr(EPOCH_DAY_OFFSET, EPOCH_DAY_LENGTH));
    if (dayField.empty() || !toNumber(dayField, dayOfYear) || !std::isfinite(dayOfYear)) {
        throw EpochException(ErrorKind::InvalidEpochDay);
    }
    if (std::abs(dayOfYear) >= EPOCH_MAX_DAY) {
        throw EpochException(ErrorKind::InvalidEpochDay);
    }

    int y = resolveEpochYear(twoDigitYear);

    // Truncate toward zero so a negative day field leaves a negative fraction
    double wholeDays = std::trunc(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    double totalSeconds = fracDays * SECONDS_PER_DAY;
    if (totalSeconds < 0.0) {
        throw EpochException(ErrorKind::NegativeEpochSeconds);
    }

    // Round the sub-second remainder first, then carry a full second
    double wholeSeconds = std::floor(totalSeconds);
    long long micros = std::llround((totalSeconds - wholeSeconds) * MICROSECONDS_PER_SECOND);
    long long secs = static_cast<long long>(wholeSeconds);
    if (micros >= MICROSECONDS_PER_SECOND) {
        secs += 1;
        micros -= MICROSECONDS_PER_SECOND;
    }

    auto midnight = sys_days{year{y}/January/1} + days{static_cast<long long>(wholeDays) - 1};
    return time_point{midnight} + seconds{secs} + microseconds{micros};
}

std::string formatEpoch(time_point tp) {
    return date::format("%FT%TZ", tp);
}

}
