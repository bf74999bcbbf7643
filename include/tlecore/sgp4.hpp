/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 propagation entry point. Propagation is not part of this
 * library; the function exists so callers can probe for it.
 */

#ifndef __TLECORE_SGP4_HPP
#define __TLECORE_SGP4_HPP

#include <tlecore/tle.hpp>

namespace tlecore::sgp4 {

/**
 * Position and velocity in the TEME frame.
 */
struct Result {
    double r[3];    // Position (km)
    double v[3];    // Velocity (km/s)
};

/**
 * Propagate a TLE to a time offset from its epoch.
 *
 * @param tle Parsed element set
 * @param minutesSinceEpoch Time since the TLE epoch in minutes
 * @throws NotImplementedException always
 */
Result propagate(const TLE &tle, double minutesSinceEpoch);

}

#endif
