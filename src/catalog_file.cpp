/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/catalog_file.hpp>
#include <tlecore/strings.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace tlecore {

// Load catalog from a stream of back-to-back 2-line or 3-line entries
std::vector<TLE> loadCatalog(std::istream &s, std::string_view source) {
    std::vector<TLE> records;
    std::string line, nameLine, line1;
    int lineNumber = 0;
    int line1Number = 0;
    int rejected = 0;

    while (std::getline(s, line)) {
        lineNumber++;
        std::string_view trimmed = trim(line);
        if (trimmed.empty()) continue;

        if (trimmed.starts_with("1 ")) {
            if (!line1.empty()) {
                warn("Line {}: discarding unpaired element line 1", line1Number);
                rejected++;
            }
            line1 = trimmed;
            line1Number = lineNumber;
            continue;
        }

        if (trimmed.starts_with("2 ")) {
            if (line1.empty()) {
                warn("Line {}: element line 2 without line 1", lineNumber);
                rejected++;
                nameLine.clear();
                continue;
            }

            std::ostringstream tleStream;
            if (!nameLine.empty()) {
                tleStream << nameLine << '\n';
            }
            tleStream << line1 << '\n' << trimmed << '\n';

            try {
                records.push_back(parse(tleStream.str(), "", source));
            } catch (const ParseException &e) {
                warn("Line {}: skipping TLE entry: {}", lineNumber, e.what());
                rejected++;
            }

            line1.clear();
            nameLine.clear();
            continue;
        }

        if (!line1.empty()) {
            warn("Line {}: discarding unpaired element line 1", line1Number);
            rejected++;
            line1.clear();
        }
        nameLine = trimmed;
    }

    if (!line1.empty()) {
        warn("Line {}: discarding unpaired element line 1 at end of catalog", line1Number);
        rejected++;
    }

    info("Loaded {} TLE entries ({} rejected).", records.size(), rejected);
    return records;
}

std::vector<TLE> loadCatalog(const std::string &filepath, std::string_view source) {
    debug("Loading TLE catalog from file: {}", filepath);
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE catalog file: " + filepath);
    }
    return loadCatalog(file, source);
}

void saveCatalog(std::ostream &s, const std::vector<TLE> &records, bool includeName) {
    for (const auto &record : records) {
        s << record.asText(includeName);
    }
    debug("Saved {} TLE entries.", records.size());
}

void saveCatalog(const std::string &filepath, const std::vector<TLE> &records, bool includeName) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    saveCatalog(file, records, includeName);
}

}
