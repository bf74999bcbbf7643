/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlecore/errors.hpp>

namespace tlecore {

std::ostream& operator<<(std::ostream &os, const ErrorKind &kind) {
    switch (kind) {
        case ErrorKind::LinePairNotFound:
            os << "LinePairNotFound";
            break;
        case ErrorKind::EmptyLine:
            os << "EmptyLine";
            break;
        case ErrorKind::BadLinePrefix:
            os << "BadLinePrefix";
            break;
        case ErrorKind::ChecksumFailed:
            os << "ChecksumFailed";
            break;
        case ErrorKind::CatalogMismatch:
            os << "CatalogMismatch";
            break;
        case ErrorKind::RequestedIdMismatch:
            os << "RequestedIdMismatch";
            break;
        case ErrorKind::EpochTooShort:
            os << "EpochTooShort";
            break;
        case ErrorKind::InvalidEpochYear:
            os << "InvalidEpochYear";
            break;
        case ErrorKind::InvalidEpochDay:
            os << "InvalidEpochDay";
            break;
        case ErrorKind::NegativeEpochSeconds:
            os << "NegativeEpochSeconds";
            break;
        case ErrorKind::NotImplemented:
            os << "NotImplemented";
            break;
    }
    return os;
}

std::string errorMessage(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LinePairNotFound:     return "Could not locate TLE line pair in response";
        case ErrorKind::EmptyLine:            return "Empty TLE line detected";
        case ErrorKind::BadLinePrefix:        return "Bad TLE line prefixes";
        case ErrorKind::ChecksumFailed:       return "Checksum failed";
        case ErrorKind::CatalogMismatch:      return "Catalog numbers differ between L1 and L2";
        case ErrorKind::RequestedIdMismatch:  return "Catalog number does not match requested NORAD ID";
        case ErrorKind::EpochTooShort:        return "Line 1 too short to contain epoch";
        case ErrorKind::InvalidEpochYear:     return "Invalid epoch year";
        case ErrorKind::InvalidEpochDay:      return "Invalid epoch day";
        case ErrorKind::NegativeEpochSeconds: return "Epoch fraction produced negative seconds";
        case ErrorKind::NotImplemented:       return "SGP4 propagation not implemented";
    }
    return "Unknown error";
}

ParseException::ParseException(ErrorKind kind) : TLEException(kind, errorMessage(kind)) {}

EpochException::EpochException(ErrorKind kind) : TLEException(kind, errorMessage(kind)) {}

}
