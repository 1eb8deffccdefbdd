/**
 * @file test_timestamp.cpp
 * @brief Unit tests for status snapshot timestamp parsing
 */

#include "playctl/core/error_codes.h"
#include "playctl/playback/timestamp.h"

#include <gtest/gtest.h>

using namespace playctl;
using namespace std::chrono;

namespace {

int64_t nanosSinceEpoch(Timestamp ts) {
    return ts.time_since_epoch().count();
}

void expectInvalid(const char* text) {
    try {
        parseTimestamp(text);
        ADD_FAILURE() << "Expected PARSE_TIMESTAMP_INVALID for '" << text << "'";
    } catch (const PlaybackError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PARSE_TIMESTAMP_INVALID) << text;
    }
}

}  // namespace

TEST(Timestamp, ParsesEpoch) {
    EXPECT_EQ(nanosSinceEpoch(parseTimestamp("1970-01-01T00:00:00.000000000Z")), 0);
}

TEST(Timestamp, ParsesNanosecondPrecision) {
    // 2024-03-15T12:34:56 UTC = 1710506096
    Timestamp ts = parseTimestamp("2024-03-15T12:34:56.123456789Z");
    EXPECT_EQ(nanosSinceEpoch(ts), 1710506096LL * 1000000000LL + 123456789LL);
}

TEST(Timestamp, ShortFractionIsScaled) {
    Timestamp ts = parseTimestamp("2024-03-15T12:34:56.5Z");
    EXPECT_EQ(nanosSinceEpoch(ts), 1710506096LL * 1000000000LL + 500000000LL);

    ts = parseTimestamp("2024-03-15T12:34:56.123Z");
    EXPECT_EQ(nanosSinceEpoch(ts) % 1000000000LL, 123000000LL);
}

TEST(Timestamp, FractionIsOptional) {
    Timestamp ts = parseTimestamp("2024-03-15T12:34:56Z");
    EXPECT_EQ(nanosSinceEpoch(ts), 1710506096LL * 1000000000LL);
}

TEST(Timestamp, LeapDay) {
    // 2024-02-29T00:00:00 UTC = 1709164800
    Timestamp ts = parseTimestamp("2024-02-29T00:00:00Z");
    EXPECT_EQ(duration_cast<seconds>(ts.time_since_epoch()).count(), 1709164800LL);
}

TEST(Timestamp, EndTimeFollowsStartTimeByDuration) {
    Timestamp start = parseTimestamp("2024-12-31T23:59:59.000000000Z");
    Timestamp end = parseTimestamp("2025-01-01T00:00:01.000000000Z");
    EXPECT_EQ(duration_cast<milliseconds>(end - start).count(), 2000);
}

TEST(Timestamp, RejectsMalformedInput) {
    expectInvalid("");
    expectInvalid("not a timestamp");
    expectInvalid("2024-03-15 12:34:56.000Z");
    expectInvalid("2024-03-15T12:34:56.000");
    expectInvalid("2024-03-15T12:34:56.000+09:00");
    expectInvalid("2024-03-15T12:34:56.Z");
    expectInvalid("2024-03-15T12:34:56.1234567890Z");
    expectInvalid("2024-03-15T12:34:56.000Zjunk");
    expectInvalid("24-03-15T12:34:56Z");
}

TEST(Timestamp, RejectsOutOfRangeFields) {
    expectInvalid("2024-13-01T00:00:00Z");
    expectInvalid("2024-00-01T00:00:00Z");
    expectInvalid("2023-02-29T00:00:00Z");
    expectInvalid("2024-04-31T00:00:00Z");
    expectInvalid("2024-01-01T24:00:00Z");
    expectInvalid("2024-01-01T00:60:00Z");
    expectInvalid("2024-01-01T00:00:60Z");
}

TEST(Timestamp, FormatEmitsNineFractionalDigits) {
    Timestamp ts{seconds(1710506096) + nanoseconds(5)};
    EXPECT_EQ(formatTimestamp(ts), "2024-03-15T12:34:56.000000005Z");
}

TEST(Timestamp, FormatThenParseIsIdentity) {
    Timestamp ts = time_point_cast<nanoseconds>(system_clock::now());
    EXPECT_EQ(parseTimestamp(formatTimestamp(ts)), ts);
}

TEST(Timestamp, FormatBeforeEpochBorrowsFromSeconds) {
    Timestamp ts{seconds(-1) + nanoseconds(500000000)};
    EXPECT_EQ(formatTimestamp(ts), "1969-12-31T23:59:59.500000000Z");
    EXPECT_EQ(formatTimestamp(Timestamp{nanoseconds(-1)}), "1969-12-31T23:59:59.999999999Z");
}

TEST(Timestamp, FormatLeapDayAndEpoch) {
    EXPECT_EQ(formatTimestamp(Timestamp{}), "1970-01-01T00:00:00.000000000Z");
    EXPECT_EQ(formatTimestamp(parseTimestamp("2024-02-29T23:59:59.25Z")),
              "2024-02-29T23:59:59.250000000Z");
}
