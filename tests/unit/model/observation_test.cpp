/// @file observation_test.cpp
/// @brief Tests for observation records and calendar dates

#include <gtest/gtest.h>

#include "model/observation.h"

namespace flaresignal {
namespace {

TEST(ObservationTest, ParseDate) {
    auto date = ParseDate("2024-02-29");
    ASSERT_TRUE(date.ok()) << date.status().message();
    EXPECT_EQ(*date, Date(2024, 2, 29));
    EXPECT_EQ(FormatDate(*date), "2024-02-29");
}

TEST(ObservationTest, ParseDateRejectsMalformed) {
    EXPECT_FALSE(ParseDate("").ok());
    EXPECT_FALSE(ParseDate("2024/02/01").ok());
    EXPECT_FALSE(ParseDate("2024-2-1").ok());
    EXPECT_FALSE(ParseDate("yesterday").ok());
}

TEST(ObservationTest, ParseTimestampVariants) {
    auto full = ParseTimestamp("2024-03-10T08:15:30");
    ASSERT_TRUE(full.ok());
    EXPECT_EQ(*full, Timestamp(2024, 3, 10, 8, 15, 30));

    auto minutes = ParseTimestamp("2024-03-10T08:15");
    ASSERT_TRUE(minutes.ok());
    EXPECT_EQ(*minutes, Timestamp(2024, 3, 10, 8, 15, 0));

    auto date_only = ParseTimestamp("2024-03-10");
    ASSERT_TRUE(date_only.ok());
    EXPECT_EQ(*date_only, Timestamp(2024, 3, 10, 0, 0, 0));
}

TEST(ObservationTest, ParseTimestampKeepsWallClock) {
    // Zone designators are ignored, not converted: the local date must not move
    auto late_utc = ParseTimestamp("2024-03-10T23:30:00.000Z");
    ASSERT_TRUE(late_utc.ok());
    EXPECT_EQ(Date(*late_utc), Date(2024, 3, 10));

    auto offset = ParseTimestamp("2024-03-10T00:30:00-05:00");
    ASSERT_TRUE(offset.ok());
    EXPECT_EQ(Date(*offset), Date(2024, 3, 10));
    EXPECT_EQ(FormatTimestamp(*offset), "2024-03-10T00:30:00");
}

TEST(ObservationTest, ParseTimestampRejectsGarbage) {
    EXPECT_FALSE(ParseTimestamp("10/03/2024 08:15").ok());
    EXPECT_FALSE(ParseTimestamp("2024-03-10T").ok());
}

TEST(ObservationTest, DayArithmeticCrossesMonthAndLeapDay) {
    EXPECT_EQ(Date(2024, 2, 28) + 1, Date(2024, 2, 29));
    EXPECT_EQ(Date(2024, 2, 29) + 1, Date(2024, 3, 1));
    EXPECT_EQ(Date(2024, 3, 31) - Date(2024, 3, 1), 30);
}

TEST(ObservationTest, SkinIntensityPrefersExplicitValue) {
    Observation observation;
    observation.skin_feeling = 4.0;
    EXPECT_DOUBLE_EQ(SkinIntensity(observation), 1.0);

    observation.skin_intensity = 3.0;
    EXPECT_DOUBLE_EQ(SkinIntensity(observation), 3.0);
}

TEST(ObservationTest, ObservationDateTruncatesTime) {
    Observation observation;
    observation.timestamp = Timestamp(2024, 5, 1, 23, 59, 59);
    EXPECT_EQ(ObservationDate(observation), Date(2024, 5, 1));
}

TEST(ObservationTest, SelectObservationSource) {
    Observation real_obs;
    real_obs.id = "real";
    Observation demo_obs;
    demo_obs.id = "demo";
    const std::vector<Observation> real = {real_obs};
    const std::vector<Observation> demo = {demo_obs, demo_obs};

    EXPECT_EQ(&SelectObservationSource(real, demo, false), &real);
    EXPECT_EQ(&SelectObservationSource(real, demo, true), &demo);
}

}  // namespace
}  // namespace flaresignal
