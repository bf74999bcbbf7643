/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_CONFIG_HPP
#define __TLECORE_CONFIG_HPP

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace tlecore {

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    std::string getSource();
    void setSource(const std::string &s);

    bool hasRequestedID();
    void clearRequestedID();
    std::string getRequestedID();
    void setRequestedID(const std::string &id);

    bool getIncludeName();
    void setIncludeName(bool include);

    bool getVerbose();
    void setVerbose(bool);

    /**
     * Effective log level: debug when verbose, otherwise the configured
     * level name. Unknown names fall back to info.
     */
    spdlog::level::level_enum getLogLevel();
    void setLogLevel(const std::string &level);

private:
    std::string source;
    std::optional<std::string> requestedID;
    bool includeName = true;
    bool verbose = false;
    std::string logLevel = "info";
};

}

#endif
