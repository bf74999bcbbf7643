/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <tlecore/tle.hpp>
#include <tlecore/sgp4.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace tlecore {
namespace {

const std::string ISS_NAME = "ISS (ZARYA)";
const std::string ISS_LINE1 = "1 25544U 98067A   20344.91719907  .00001264  00000-0  29621-4 0  9993";
const std::string ISS_LINE2 = "2 25544  51.6466 223.8666 0002416  90.3778  30.6140 15.48970462256430";

const std::string ISS_TLE = ISS_NAME + "\n" + ISS_LINE1 + "\n" + ISS_LINE2 + "\n";

std::string jsonPayload(const std::string &line1, const std::string &line2, const std::string &name = "null") {
    return R"({"line1": ")" + line1 + R"(", "line2": ")" + line2 + R"(", "name": )" + name + "}";
}

ErrorKind parseError(const std::string &text, const std::string &requestedID = "") {
    try {
        parse(text, requestedID, "test");
    } catch (const ParseException &e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected ParseException";
    return ErrorKind::NotImplemented;
}

// ============================================================================
// parse Tests
// ============================================================================

TEST(ParseTest, ThreeLineCelestrakPayload) {
    TLE tle = parse(ISS_TLE, "25544", "celestrak");
    EXPECT_EQ(tle.objectID, "25544");
    ASSERT_TRUE(tle.name.has_value());
    EXPECT_EQ(*tle.name, ISS_NAME);
    EXPECT_EQ(tle.line1, ISS_LINE1);
    EXPECT_EQ(tle.line2, ISS_LINE2);
    EXPECT_EQ(tle.source, "celestrak");
}

TEST(ParseTest, TwoLinePayloadWithoutRequestedID) {
    TLE tle = parse(ISS_LINE1 + "\n" + ISS_LINE2);
    EXPECT_EQ(tle.objectID, "25544");
    EXPECT_FALSE(tle.name.has_value());
    EXPECT_EQ(tle.source, "unknown");
}

TEST(ParseTest, EmptySourceDefaultsToUnknown) {
    EXPECT_EQ(parse(ISS_TLE, "25544", "").source, UNKNOWN_SOURCE);
}

TEST(ParseTest, JsonPayloadWithNullName) {
    TLE tle = parse(jsonPayload(ISS_LINE1, ISS_LINE2), "", "ivan");
    EXPECT_EQ(tle.objectID, "25544");
    EXPECT_FALSE(tle.name.has_value());
    EXPECT_EQ(tle.line1, ISS_LINE1);
    EXPECT_EQ(tle.line2, ISS_LINE2);
    EXPECT_EQ(tle.source, "ivan");
}

TEST(ParseTest, JsonPayloadWithName) {
    TLE tle = parse(jsonPayload(ISS_LINE1, ISS_LINE2, "\"ISS (ZARYA)\""), "25544");
    EXPECT_EQ(tle.name.value_or(""), ISS_NAME);
}

TEST(ParseTest, NoisyPayload) {
    TLE tle = parse("\n\n" + ISS_NAME + " \r\n" + ISS_LINE1 + " \r\n" + ISS_LINE2 + " \r\n\n", "25544", "test");
    EXPECT_EQ(tle.line1, ISS_LINE1);
    EXPECT_EQ(tle.line2, ISS_LINE2);
    EXPECT_EQ(tle.name.value_or(""), ISS_NAME);
}

TEST(ParseTest, ReparsingStructuredFormIsIdempotent) {
    TLE text = parse(ISS_TLE, "25544", "celestrak");
    TLE json = parse(jsonPayload(text.line1, text.line2, "\"" + *text.name + "\""), "25544", "celestrak");
    EXPECT_EQ(json, text);

    TLE unnamed = parse(ISS_LINE1 + "\n" + ISS_LINE2, "", "cache");
    EXPECT_EQ(parse(jsonPayload(unnamed.line1, unnamed.line2), "", "cache"), unnamed);
}

TEST(ParseTest, ReparsingTextFormIsIdempotent) {
    TLE tle = parse(ISS_TLE, "25544", "celestrak");
    TLE roundTrip = parse(tle.asText(), "25544", "cache");
    EXPECT_EQ(roundTrip.line1, tle.line1);
    EXPECT_EQ(roundTrip.line2, tle.line2);
    EXPECT_EQ(roundTrip.name, tle.name);
    EXPECT_EQ(roundTrip.source, "cache");
}

TEST(ParseTest, AlphanumericRequestedIDReturnedVerbatim) {
    EXPECT_EQ(parse(ISS_TLE, "ISS").objectID, "ISS");
}

// ============================================================================
// parse Error Tests
// ============================================================================

TEST(ParseErrorTest, RequestedIDMismatch) {
    EXPECT_EQ(parseError(ISS_TLE, "99999"), ErrorKind::RequestedIdMismatch);
}

TEST(ParseErrorTest, LinePairNotFound) {
    EXPECT_EQ(parseError(""), ErrorKind::LinePairNotFound);
    EXPECT_EQ(parseError(ISS_NAME + "\n" + ISS_LINE1), ErrorKind::LinePairNotFound);
    EXPECT_EQ(parseError(R"({"line1": ")" + ISS_LINE1 + R"("})"), ErrorKind::LinePairNotFound);
}

TEST(ParseErrorTest, EmptyLine) {
    EXPECT_EQ(parseError(jsonPayload("", ISS_LINE2)), ErrorKind::EmptyLine);
    EXPECT_EQ(parseError(jsonPayload(ISS_LINE1, "   ")), ErrorKind::EmptyLine);
}

TEST(ParseErrorTest, BadLinePrefix) {
    EXPECT_EQ(parseError(jsonPayload(ISS_LINE2, ISS_LINE1)), ErrorKind::BadLinePrefix);
    EXPECT_EQ(parseError(jsonPayload("1" + ISS_LINE1.substr(2), ISS_LINE2)), ErrorKind::BadLinePrefix);
}

TEST(ParseErrorTest, ChecksumFailedOnLine1) {
    std::string line1 = ISS_LINE1;
    line1.back() = '4';
    EXPECT_EQ(parseError(line1 + "\n" + ISS_LINE2), ErrorKind::ChecksumFailed);
}

TEST(ParseErrorTest, ChecksumFailedOnLine2) {
    std::string line2 = ISS_LINE2;
    line2[10] = '7';
    EXPECT_EQ(parseError(ISS_LINE1 + "\n" + line2), ErrorKind::ChecksumFailed);
}

TEST(ParseErrorTest, ChecksumMessageDoesNotNameTheLine) {
    std::string line2 = ISS_LINE2;
    line2.back() = '9';
    try {
        parse(ISS_LINE1 + "\n" + line2);
        FAIL() << "Expected ParseException";
    } catch (const ParseException &e) {
        EXPECT_STREQ(e.what(), "Checksum failed");
    }
}

TEST(ParseErrorTest, CatalogMismatch) {
    std::string otherLine2 = "2 25545  51.6466 223.8666 0002416  90.3778  30.6140 15.48970462256431";
    EXPECT_EQ(parseError(ISS_LINE1 + "\n" + otherLine2), ErrorKind::CatalogMismatch);
    EXPECT_EQ(parseError(ISS_LINE1 + "\n" + otherLine2, "25545"), ErrorKind::CatalogMismatch);
}

TEST(ParseErrorTest, ExceptionHierarchy) {
    EXPECT_THROW(parse("garbage"), TLEException);
    EXPECT_THROW(parse("garbage"), std::runtime_error);
}

// ============================================================================
// TLE Record Tests
// ============================================================================

TEST(TLERecordTest, AsTextWithName) {
    TLE tle = parse(ISS_TLE);
    EXPECT_EQ(tle.asText(), ISS_TLE);
}

TEST(TLERecordTest, AsTextWithoutName) {
    TLE tle = parse(ISS_TLE);
    EXPECT_EQ(tle.asText(false), ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
}

TEST(TLERecordTest, AsTextWhenNameAbsent) {
    TLE tle = parse(ISS_LINE1 + "\n" + ISS_LINE2);
    EXPECT_EQ(tle.asText(true), ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
}

TEST(TLERecordTest, GetEpoch) {
    TLE tle = parse(ISS_TLE);
    EXPECT_EQ(tle.getEpoch(), epoch(ISS_LINE1));
}

TEST(TLERecordTest, Equality) {
    EXPECT_EQ(parse(ISS_TLE, "", "a"), parse(ISS_TLE, "", "a"));
    EXPECT_NE(parse(ISS_TLE, "", "a"), parse(ISS_TLE, "", "b"));
}

// ============================================================================
// SGP4 Stub Tests
// ============================================================================

TEST(SGP4StubTest, AlwaysNotImplemented) {
    TLE tle = parse(ISS_TLE);
    try {
        sgp4::propagate(tle, 0.0);
        FAIL() << "Expected NotImplementedException";
    } catch (const NotImplementedException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotImplemented);
    }
    EXPECT_THROW(sgp4::propagate(tle, 1440.0), TLEException);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(ConcurrencyTest, ParallelParseAndEpoch) {
    const TLE expected = parse(ISS_TLE, "25544", "celestrak");
    const auto expectedEpoch = epoch(ISS_LINE1);

    constexpr int THREADS = 8;
    constexpr int ITERATIONS = 200;
    std::vector<int> failures(THREADS, 0);
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ITERATIONS; i++) {
                TLE tle = parse(ISS_TLE, "25544", "celestrak");
                if (tle != expected || tle.getEpoch() != expectedEpoch) {
                    failures[t]++;
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    for (int t = 0; t < THREADS; t++) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
}

}
}
