#include "core/compat/clock.hpp"
#include <gtest/gtest.h>

using namespace ledgerseal::core::compat;

TEST(ClockTest, FormatsMicrosecondPrecisionUtc) {
    auto tp = parseIso8601("2024-03-01T12:00:00.000250Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(toIso8601(*tp), "2024-03-01T12:00:00.000250Z");
}

TEST(ClockTest, ParseAcceptsOffsetsAndMissingFraction) {
    auto utc = parseIso8601("2024-03-01T12:00:00Z");
    auto plusZero = parseIso8601("2024-03-01T12:00:00+00:00");
    auto shifted = parseIso8601("2024-03-01T14:30:00+02:30");
    ASSERT_TRUE(utc && plusZero && shifted);
    EXPECT_EQ(*utc, *plusZero);
    EXPECT_EQ(*utc, *shifted);
    EXPECT_EQ(toIso8601(*utc), "2024-03-01T12:00:00.000000Z");
}

TEST(ClockTest, ParseTruncatesNanoseconds) {
    auto tp = parseIso8601("2024-03-01T12:00:00.123456789Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(toIso8601(*tp), "2024-03-01T12:00:00.123456Z");
}

TEST(ClockTest, ParseRejectsMalformedInput) {
    EXPECT_FALSE(parseIso8601("").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-01").has_value());
    EXPECT_FALSE(parseIso8601("2024-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-01T25:00:00Z").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-01T12:00:00").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-01T12:00:00.Z").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-01T12:00:00Zjunk").has_value());
}

TEST(ClockTest, NowIsTruncatedToMicros) {
    auto tp = now();
    EXPECT_EQ(tp, truncateToMicros(tp));
}

TEST(CivilDateTest, FromTimestampAndBack) {
    auto tp = *parseIso8601("2024-02-29T23:59:59.999999Z");
    auto date = CivilDate::fromTimestamp(tp);
    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 2u);
    EXPECT_EQ(date.day, 29u);
    EXPECT_EQ(date.toString(), "2024-02-29");
    EXPECT_EQ(date.startOfDay(), *parseIso8601("2024-02-29T00:00:00Z"));
}

TEST(CivilDateTest, PreEpochDates) {
    auto tp = *parseIso8601("1969-12-31T23:00:00Z");
    EXPECT_EQ(CivilDate::fromTimestamp(tp).toString(), "1969-12-31");
}

TEST(CivilDateTest, NextAndPreviousCrossBoundaries) {
    auto date = *CivilDate::parse("2023-12-31");
    EXPECT_EQ(date.next().toString(), "2024-01-01");
    EXPECT_EQ(date.next().previous(), date);
    EXPECT_EQ(CivilDate::parse("2024-03-01")->previous().toString(), "2024-02-29");
    EXPECT_EQ(CivilDate::parse("2023-03-01")->previous().toString(), "2023-02-28");
}

TEST(CivilDateTest, Ordering) {
    auto a = *CivilDate::parse("2024-01-31");
    auto b = *CivilDate::parse("2024-02-01");
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(a <= a);
    EXPECT_TRUE(a != b);
}

TEST(CivilDateTest, ParseRejectsInvalid) {
    EXPECT_FALSE(CivilDate::parse("2024-13-01").has_value());
    EXPECT_FALSE(CivilDate::parse("2023-02-29").has_value());
    EXPECT_FALSE(CivilDate::parse("20240101").has_value());
}
