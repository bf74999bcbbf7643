/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_CATALOG_FILE_HPP
#define __TLECORE_CATALOG_FILE_HPP

#include <tlecore/tle.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace tlecore {

/**
 * Load every valid record from multi-entry TLE text (name line optional).
 * Entries that fail validation are logged and skipped.
 */
std::vector<TLE> loadCatalog(std::istream &s, std::string_view source = "");

/**
 * Load a catalog file.
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<TLE> loadCatalog(const std::string &filepath, std::string_view source = "");

void saveCatalog(std::ostream &s, const std::vector<TLE> &records, bool includeName = true);
void saveCatalog(const std::string &filepath, const std::vector<TLE> &records, bool includeName = true);

}

#endif
