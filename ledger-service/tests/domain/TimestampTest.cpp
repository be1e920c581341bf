/**
 * @file TimestampTest.cpp
 * @brief Unit tests for Timestamp
 */

#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"
#include <stdexcept>

using namespace pharmacy::domain;

TEST(TimestampTest, FromString_DateOnly_IsMidnightUtc) {
    auto ts = Timestamp::fromString("2024-01-15");

    EXPECT_EQ(ts.toString(), "2024-01-15T00:00:00Z");
    EXPECT_EQ(ts.toDateString(), "2024-01-15");
}

TEST(TimestampTest, FromString_KeepsMilliseconds) {
    auto ts = Timestamp::fromString("2024-01-15T10:30:00.250Z");

    EXPECT_EQ(ts.toUnixMillis() % 1000, 250);
    EXPECT_EQ(ts.toString(), "2024-01-15T10:30:00.250Z");
}

TEST(TimestampTest, FromString_Malformed_Throws) {
    EXPECT_THROW(Timestamp::fromString("yesterday"), std::invalid_argument);
}

TEST(TimestampTest, FromString_ZoneOffset_ConvertedToUtc) {
    EXPECT_EQ(Timestamp::fromString("2024-01-15T10:30:00+05:30").toString(), "2024-01-15T05:00:00Z");
    EXPECT_EQ(Timestamp::fromString("2024-01-15T22:15:00-03:00").toString(), "2024-01-16T01:15:00Z");
    EXPECT_EQ(Timestamp::fromString("2024-01-15T10:30:00.500+0530").toString(), "2024-01-15T05:00:00.500Z");
}

TEST(TimestampTest, FromString_NoZone_IsUtc) {
    EXPECT_EQ(Timestamp::fromString("2024-01-15T10:30:00"), Timestamp::fromString("2024-01-15T10:30:00Z"));
}

TEST(TimestampTest, FromString_TrailingText_Throws) {
    EXPECT_THROW(Timestamp::fromString("2024-01-15T10:30:00Zjunk"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-01-15T10:30:00+05:30x"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-01-15T10:30:00 UTC"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-01-15T10:30:00+5"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-01-15T10:30:00+25:00"), std::invalid_argument);
}

TEST(TimestampTest, UnixMillis_RoundTrip) {
    auto ts = Timestamp::fromUnixMillis(1705314600123);

    EXPECT_EQ(Timestamp::fromUnixMillis(ts.toUnixMillis()), ts);
}

TEST(TimestampTest, PlusDays_CrossesMonth) {
    auto ts = Timestamp::fromString("2024-01-30").plusDays(3);

    EXPECT_EQ(ts.toDateString(), "2024-02-02");
}

TEST(TimestampTest, Ordering) {
    auto earlier = Timestamp::fromString("2024-01-15T09:00:00Z");
    auto later = Timestamp::fromString("2024-01-15T09:00:01Z");

    EXPECT_LT(earlier, later);
    EXPECT_NE(earlier, later);
}
