/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/sgp4.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace tlecore::sgp4 {

Result propagate(const TLE &tle, double minutesSinceEpoch) {
    debug("SGP4 propagation requested for {} at {} minutes", tle.objectID, minutesSinceEpoch);
    throw NotImplementedException();
}

}
