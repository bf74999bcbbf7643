/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/checksum.hpp>
#include <tlecore/strings.hpp>

namespace tlecore {

int calculateChecksum(std::string_view body) {
    int sum = 0;
    for (char c : body) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool checksum(std::string_view line) {
    line = trimRight(line);
    if (line.empty()) {
        return false;
    }

    char last = line.back();
    if (last < '0' || last > '9') {
        return false;
    }

    return calculateChecksum(line.substr(0, line.size() - 1)) == (last - '0');
}

}
