#include "CalendarDate.h"
#include "FeedMixExceptions.h"

#include <gtest/gtest.h>

TEST(CalendarDateTest, ParsesIsoWithAndWithoutTime) {
    CalendarDate d;
    ASSERT_TRUE(CalendarDate::parse("2024-02-29", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 2);
    EXPECT_EQ(d.day, 29);

    ASSERT_TRUE(CalendarDate::parse("2024-03-05T14:30:00", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 3, 5));
    ASSERT_TRUE(CalendarDate::parse("2024-03-05 06:00", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 3, 5));
}

TEST(CalendarDateTest, SlashDatesFollowOrderHint) {
    CalendarDate d;
    ASSERT_TRUE(CalendarDate::parse("04/03/2024", CalendarDate::OrderHint::DMY, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 3, 4));
    ASSERT_TRUE(CalendarDate::parse("04/03/2024", CalendarDate::OrderHint::MDY, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 4, 3));
}

TEST(CalendarDateTest, AutoOrderPrefersDayFirstUnlessImpossible) {
    CalendarDate d;
    ASSERT_TRUE(CalendarDate::parse("04/03/2024", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 3, 4));
    ASSERT_TRUE(CalendarDate::parse("03/25/2024", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2024, 3, 25));
}

TEST(CalendarDateTest, RejectsImpossibleDatesAndLeavesOutputUntouched) {
    CalendarDate d = CalendarDate::fromYmd(2020, 1, 1);
    EXPECT_FALSE(CalendarDate::parse("2023-02-29", CalendarDate::OrderHint::AUTO, d));
    EXPECT_FALSE(CalendarDate::parse("31/04/2024", CalendarDate::OrderHint::DMY, d));
    EXPECT_FALSE(CalendarDate::parse("yesterday", CalendarDate::OrderHint::AUTO, d));
    EXPECT_FALSE(CalendarDate::parse("", CalendarDate::OrderHint::AUTO, d));
    EXPECT_EQ(d, CalendarDate::fromYmd(2020, 1, 1));
    EXPECT_THROW(CalendarDate::fromYmd(2024, 13, 1), FeedMix::DatasetException);
}

TEST(CalendarDateTest, OrderingUsesDayCount) {
    const CalendarDate a = CalendarDate::fromYmd(2023, 12, 31);
    const CalendarDate b = CalendarDate::fromYmd(2024, 1, 1);
    EXPECT_LT(a, b);
    EXPECT_EQ(b.daysSinceEpoch() - a.daysSinceEpoch(), 1);
    EXPECT_EQ(CalendarDate::fromYmd(1970, 1, 1).daysSinceEpoch(), 0);
}

TEST(CalendarDateTest, FormatsIsoAndDisplay) {
    const CalendarDate d = CalendarDate::fromYmd(2024, 3, 7);
    EXPECT_EQ(d.toIsoString(), "2024-03-07");
    EXPECT_EQ(d.toDisplayString(), "07/03/2024");
}
