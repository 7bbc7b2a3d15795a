#include "Errors.h"
#include "TimeUtils.h"

#include <gtest/gtest.h>

using namespace mtfcast;

TEST(TimeUtilsTest, ParsesCommonTimeframes) {
    EXPECT_EQ(ParseTimeframe("1m"), kMinuteMs);
    EXPECT_EQ(ParseTimeframe("5m"), 5 * kMinuteMs);
    EXPECT_EQ(ParseTimeframe("15min"), 15 * kMinuteMs);
    EXPECT_EQ(ParseTimeframe("1h"), kHourMs);
    EXPECT_EQ(ParseTimeframe("4H"), 4 * kHourMs);
    EXPECT_EQ(ParseTimeframe("1d"), kDayMs);
    EXPECT_EQ(ParseTimeframe("30"), 30 * kMinuteMs);
    EXPECT_EQ(ParseTimeframe(" 2h "), 2 * kHourMs);
}

TEST(TimeUtilsTest, RejectsInvalidTimeframes) {
    EXPECT_THROW(ParseTimeframe(""), InvalidTimeframeError);
    EXPECT_THROW(ParseTimeframe("0m"), InvalidTimeframeError);
    EXPECT_THROW(ParseTimeframe("m"), InvalidTimeframeError);
    EXPECT_THROW(ParseTimeframe("5s"), InvalidTimeframeError);
    EXPECT_THROW(ParseTimeframe("-5m"), InvalidTimeframeError);
    EXPECT_THROW(ValidateTimeframe(90 * 1000), InvalidTimeframeError);
    EXPECT_THROW(ValidateTimeframe(-kMinuteMs), InvalidTimeframeError);
    EXPECT_NO_THROW(ValidateTimeframe(3 * kMinuteMs));
}

TEST(TimeUtilsTest, InvalidTimeframeCarriesCode) {
    try {
        ParseTimeframe("7w");
        FAIL() << "expected an exception";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidTimeframe);
    }
}

TEST(TimeUtilsTest, FormatsWithLargestUnit) {
    EXPECT_EQ(FormatTimeframe(kMinuteMs), "1m");
    EXPECT_EQ(FormatTimeframe(60 * kMinuteMs), "1h");
    EXPECT_EQ(FormatTimeframe(90 * kMinuteMs), "90m");
    EXPECT_EQ(FormatTimeframe(48 * kHourMs), "2d");
    EXPECT_EQ(FormatTimeframe(1500), "1500ms");
}

TEST(TimeUtilsTest, FloorAlignmentHandlesNegativeTimes) {
    EXPECT_EQ(AlignToTimeframe(0, kHourMs), 0);
    EXPECT_EQ(AlignToTimeframe(kHourMs - 1, kHourMs), 0);
    EXPECT_EQ(AlignToTimeframe(-1, kHourMs), -kHourMs);
    EXPECT_EQ(AlignToTimeframe(-kHourMs, kHourMs), -kHourMs);
    EXPECT_EQ(FloorDiv(-7, 2), -4);
    EXPECT_EQ(FloorDiv(7, 2), 3);
}

TEST(TimeUtilsTest, IsoRoundTrip) {
    auto parsed = ParseIsoToMillis("2024-01-01T00:00:00.000Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, 1704067200000LL);

    auto spaced = ParseIsoToMillis("2024-01-01 01:30:15.5");
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(*spaced, 1704067200000LL + 90 * kMinuteMs + 15500);

    EXPECT_EQ(FormatIsoMillis(1704067200000LL + 1234), "2024-01-01T00:00:01.234Z");
    EXPECT_FALSE(ParseIsoToMillis("2024/01/01 00:00:00").has_value());
    EXPECT_FALSE(ParseIsoToMillis("garbage").has_value());
}
