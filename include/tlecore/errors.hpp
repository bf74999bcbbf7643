/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLECORE_ERRORS_HPP
#define __TLECORE_ERRORS_HPP

#include <iostream>
#include <stdexcept>
#include <string>

namespace tlecore {

/**
 * Cause of a failed parse, epoch decode or propagation request.
 */
enum class ErrorKind {
    LinePairNotFound,
    EmptyLine,
    BadLinePrefix,
    ChecksumFailed,
    CatalogMismatch,
    RequestedIdMismatch,
    EpochTooShort,
    InvalidEpochYear,
    InvalidEpochDay,
    NegativeEpochSeconds,
    NotImplemented
};

std::ostream& operator<<(std::ostream &os, const ErrorKind &kind);

/**
 * Base exception class for all TLE core errors.
 */
class TLEException : public std::runtime_error {
public:
    TLEException(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * Exception thrown when a payload does not yield a valid TLE record.
 */
class ParseException : public TLEException {
public:
    explicit ParseException(ErrorKind kind);
};

/**
 * Exception thrown when the epoch fields of line 1 cannot be decoded.
 */
class EpochException : public TLEException {
public:
    explicit EpochException(ErrorKind kind);
};

/**
 * Exception thrown by entry points that exist but are not supported.
 */
class NotImplementedException : public TLEException {
public:
    NotImplementedException() : TLEException(ErrorKind::NotImplemented, "SGP4 propagation not implemented") {}
};

/**
 * Returns the fixed message used for an error kind.
 */
std::string errorMessage(ErrorKind kind);

}

#endif
