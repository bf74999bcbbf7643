/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Read a whole file, or stdin when the path is empty or "-" */
std::string readInput(const std::string &path) {
    std::ostringstream buffer;
    if (path.empty() || path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    buffer << file.rdbuf();
    return buffer.str();
}

void printRecord(const tlecore::TLE &tle, bool includeName) {
    std::cout << "Object ID: " << tle.objectID << std::endl;
    if (includeName) {
        std::cout << "Name:      " << tle.name.value_or("(none)") << std::endl;
    }
    std::cout << "Source:    " << tle.source << std::endl;
    std::cout << "Line 1:    " << tle.line1 << std::endl;
    std::cout << "Line 2:    " << tle.line2 << std::endl;
    try {
        std::cout << "Epoch:     " << tlecore::formatEpoch(tle.getEpoch()) << std::endl;
    } catch (const tlecore::EpochException &err) {
        std::cout << "Epoch:     " << err.what() << std::endl;
    }
}

/** Program entry point */
int main(int argc, char* argv[]) {

    tlecore::Config config;
    config.setIncludeName(true);
    config.setVerbose(false);
    config.setLogLevel("info");

    auto configFile = expandTilde("~/.tlecore.toml");

    CLI::App app{"TLE Core"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");
    app.add_option_function<std::string>("--log-level",
        [&config](const std::string &level) { config.setLogLevel(level); },
        "Log level (trace, debug, info, warn, error, critical, off)");

    app.require_subcommand(1);

    // parse command - validate a payload and print the record
    auto parseCommand = app.add_subcommand("parse", "Parse a TLE payload (text or JSON) and print the record");
    std::string parseInput;
    parseCommand->add_option("file", parseInput, "File to read (default: stdin)");
    parseCommand->add_option_function<std::string>("--id",
        [&config](const std::string &id) { config.setRequestedID(id); },
        "Catalog number the payload is expected to carry (ie. 25544)");
    parseCommand->add_option_function<std::string>("--source",
        [&config](const std::string &source) { config.setSource(source); },
        "Tag identifying the data provider (default: unknown)");
    parseCommand->add_flag_function("--no-name",
        [&config](const int64_t n) { config.setIncludeName(n == 0); },
        "Omit the name line from the output");

    // checksum command
    auto checksumCommand = app.add_subcommand("checksum", "Verify the check digit of one or more TLE lines");
    std::vector<std::string> checksumLines;
    checksumCommand->add_option("line", checksumLines, "TLE line(s)")->required();

    // epoch command
    auto epochCommand = app.add_subcommand("epoch", "Decode the epoch from TLE line 1");
    std::string epochLine;
    epochCommand->add_option("line1", epochLine, "TLE line 1")->required();

    // catalog command
    auto catalogCommand = app.add_subcommand("catalog", "Load a multi-entry TLE file and list the valid records");
    std::string catalogFile;
    catalogCommand->add_option("file", catalogFile, "TLE catalog file")->required();
    catalogCommand->add_option_function<std::string>("--source",
        [&config](const std::string &source) { config.setSource(source); },
        "Tag identifying the data provider (default: unknown)");

    app.parse_complete_callback([&config]() {
        spdlog::set_level(config.getLogLevel());
    });

    // Command callbacks

    parseCommand->final_callback([&config, &parseInput](void) {
        try {
            auto text = readInput(parseInput);
            auto tle = tlecore::parse(text, config.getRequestedID(), config.getSource());
            printRecord(tle, config.getIncludeName());
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    checksumCommand->final_callback([&checksumLines](void) {
        bool allValid = true;
        for (const auto &line : checksumLines) {
            bool valid = tlecore::checksum(line);
            allValid = allValid && valid;
            std::cout << (valid ? "OK   " : "FAIL ") << line << std::endl;
        }
        if (!allValid) {
            std::exit(1);
        }
    });

    epochCommand->final_callback([&epochLine](void) {
        try {
            std::cout << tlecore::formatEpoch(tlecore::epoch(epochLine)) << std::endl;
        } catch (const tlecore::TLEException &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    catalogCommand->final_callback([&config, &catalogFile](void) {
        try {
            auto records = tlecore::loadCatalog(expandTilde(catalogFile), config.getSource());
            for (const auto &tle : records) {
                std::string epochStr;
                try {
                    epochStr = tlecore::formatEpoch(tle.getEpoch());
                } catch (const tlecore::EpochException &err) {
                    epochStr = err.what();
                }
                std::cout << std::left << std::setw(8) << tle.objectID << ' '
                          << std::setw(26) << tle.name.value_or("") << ' '
                          << epochStr << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    return 0;
}
