#include "domain/value_objects/Timestamp.hpp"

#include <gtest/gtest.h>

using vbe::domain::Timestamp;

TEST(Timestamp, ConstructsFromMilliseconds) {
    Timestamp t(1718035200000);
    EXPECT_EQ(t.milliseconds(), 1718035200000);
}

TEST(Timestamp, ThrowsOnNegative) {
    EXPECT_THROW(Timestamp(-1), std::out_of_range);
}

TEST(Timestamp, FromStringAcceptsEpochMillis) {
    EXPECT_EQ(Timestamp::from_string("1718035200000").milliseconds(), 1718035200000);
}

TEST(Timestamp, FromStringAcceptsIso8601) {
    EXPECT_EQ(Timestamp::from_string("2024-06-10T16:00:00.000Z").milliseconds(), 1718035200000);
}

TEST(Timestamp, Iso8601WithOffset) {
    auto utc = Timestamp::from_iso8601("2024-06-10T16:00:00Z");
    auto offset = Timestamp::from_iso8601("2024-06-10T18:00:00+02:00");
    EXPECT_EQ(utc, offset);
}

TEST(Timestamp, Iso8601DateOnly) {
    EXPECT_EQ(Timestamp::from_iso8601("1970-01-02").milliseconds(), 86400000);
}

TEST(Timestamp, Iso8601KeepsMilliseconds) {
    EXPECT_EQ(Timestamp::from_iso8601("1970-01-01T00:00:01.250Z").milliseconds(), 1250);
}

TEST(Timestamp, ThrowsOnGarbage) {
    EXPECT_THROW(Timestamp::from_string("next tuesday"), std::invalid_argument);
    EXPECT_THROW(Timestamp::from_iso8601("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(Timestamp::from_iso8601("2024-06-10T16:00:00Zjunk"), std::invalid_argument);
}

TEST(Timestamp, FormatsIso8601) {
    EXPECT_EQ(Timestamp(1718035200123).to_iso8601(), "2024-06-10T16:00:00.123Z");
}

TEST(Timestamp, OrdersChronologically) {
    EXPECT_LT(Timestamp(1000), Timestamp(2000));
}

TEST(Timestamp, RejectsDaysPastMonthEnd) {
    EXPECT_THROW(Timestamp::from_iso8601("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(Timestamp::from_iso8601("2024-04-31T10:00:00Z"), std::invalid_argument);
}

TEST(Timestamp, LeapDayRoundTripsThroughIso8601) {
    auto leap = Timestamp::from_iso8601("2024-02-29T12:34:56.789Z");
    EXPECT_EQ(leap.milliseconds(), 1709210096789);
    EXPECT_EQ(leap.to_iso8601(), "2024-02-29T12:34:56.789Z");
    EXPECT_EQ(Timestamp::from_iso8601("2000-03-01").milliseconds(), 951868800000);
}
