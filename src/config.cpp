/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/config.hpp>

#include <algorithm>
#include <cctype>

namespace tlecore {

std::string Config::getSource() {
    return source;
}

void Config::setSource(const std::string &s) {
    source = s;
}

bool Config::hasRequestedID() {
    return requestedID.has_value();
}

void Config::clearRequestedID() {
    requestedID.reset();
}

std::string Config::getRequestedID() {
    return requestedID.value_or("");
}

void Config::setRequestedID(const std::string &id) {
    if (id.empty()) {
        requestedID.reset();
    } else {
        requestedID = id;
    }
}

bool Config::getIncludeName() {
    return includeName;
}

void Config::setIncludeName(bool include) {
    includeName = include;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

spdlog::level::level_enum Config::getLogLevel() {
    if (verbose) {
        return spdlog::level::debug;
    }
    // from_str maps unknown names to off, so only trust it for "off" itself
    auto level = spdlog::level::from_str(logLevel);
    if (level == spdlog::level::off && logLevel != "off") {
        return spdlog::level::info;
    }
    return level;
}

void Config::setLogLevel(const std::string &level) {
    logLevel = level;
    std::transform(logLevel.begin(), logLevel.end(), logLevel.begin(),
        [](unsigned char c) { return std::tolower(c); });
}

}
