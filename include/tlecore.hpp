/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_HPP
#define __TLECORE_HPP

#include <tlecore/config.hpp>
#include <tlecore/errors.hpp>
#include <tlecore/checksum.hpp>
#include <tlecore/catalog.hpp>
#include <tlecore/epoch.hpp>
#include <tlecore/tle.hpp>
#include <tlecore/catalog_file.hpp>
#include <tlecore/sgp4.hpp>

#endif
