/// @file baseline_test.cpp
/// @brief Tests for baseline estimation and confidence gating

#include <gtest/gtest.h>

#include "analysis/baseline.h"

namespace flaresignal::analysis {
namespace {

std::vector<DailyBurden> Series(Date start, const std::vector<double>& scores) {
    std::vector<DailyBurden> burdens;
    for (size_t i = 0; i < scores.size(); ++i) {
        DailyBurden burden;
        burden.date = start + static_cast<int>(i);
        burden.score = scores[i];
        burden.observation_count = 1;
        burdens.push_back(burden);
    }
    return burdens;
}

TEST(BaselineTest, ConfidenceTiers) {
    EXPECT_EQ(ConfidenceForDayCount(0), BaselineConfidence::kEarly);
    EXPECT_EQ(ConfidenceForDayCount(6), BaselineConfidence::kEarly);
    EXPECT_EQ(ConfidenceForDayCount(7), BaselineConfidence::kProvisional);
    EXPECT_EQ(ConfidenceForDayCount(13), BaselineConfidence::kProvisional);
    EXPECT_EQ(ConfidenceForDayCount(14), BaselineConfidence::kMature);
    EXPECT_EQ(ConfidenceForDayCount(400), BaselineConfidence::kMature);
}

TEST(BaselineTest, ConfidenceTiersFollowConfig) {
    FlareDetectorConfig config;
    config.provisional_min_days = 3;
    config.mature_min_days = 5;
    EXPECT_EQ(ConfidenceForDayCount(2, config), BaselineConfidence::kEarly);
    EXPECT_EQ(ConfidenceForDayCount(3, config), BaselineConfidence::kProvisional);
    EXPECT_EQ(ConfidenceForDayCount(5, config), BaselineConfidence::kMature);
}

TEST(BaselineTest, ConfidenceNames) {
    EXPECT_EQ(BaselineConfidenceToString(BaselineConfidence::kEarly), "early");
    EXPECT_EQ(BaselineConfidenceToString(BaselineConfidence::kProvisional), "provisional");
    EXPECT_EQ(BaselineConfidenceToString(BaselineConfidence::kMature), "mature");
}

TEST(BaselineTest, TrailingBaselineUndefinedForFirstDay) {
    auto burdens = Series(Date(2024, 1, 1), {1.0, 2.0});
    EXPECT_FALSE(TrailingBaseline(burdens, 0, 14).has_value());
    EXPECT_DOUBLE_EQ(*TrailingBaseline(burdens, 1, 14), 1.0);
}

TEST(BaselineTest, TrailingBaselineExcludesCurrentAndLaterDays) {
    auto burdens = Series(Date(2024, 1, 1), {1.0, 1.0, 1.0, 100.0, 1000.0});
    auto baseline = TrailingBaseline(burdens, 3, 14);
    ASSERT_TRUE(baseline.has_value());
    EXPECT_DOUBLE_EQ(*baseline, 1.0);
}

TEST(BaselineTest, TrailingBaselineRespectsWindow) {
    // 20 days: first 10 at 0.0, last 10 at 2.0
    std::vector<double> scores(20, 0.0);
    for (size_t i = 10; i < 20; ++i) scores[i] = 2.0;
    auto burdens = Series(Date(2024, 1, 1), scores);

    // Day 19 with a 5-day window sees days 14..18 only
    EXPECT_DOUBLE_EQ(*TrailingBaseline(burdens, 19, 5), 2.0);
    // Day 12 with a 4-day window sees days 8..11 -> 0, 0, 2, 2
    EXPECT_DOUBLE_EQ(*TrailingBaseline(burdens, 12, 4), 1.0);
}

TEST(BaselineTest, TrailingBaselineSkipsMissingDates) {
    std::vector<DailyBurden> burdens = Series(Date(2024, 1, 1), {3.0});
    auto later = Series(Date(2024, 1, 10), {1.0, 5.0});
    burdens.insert(burdens.end(), later.begin(), later.end());

    // Jan 11, window 14: Jan 1 and Jan 10 are in range, missing days don't count as zero
    EXPECT_DOUBLE_EQ(*TrailingBaseline(burdens, 2, 14), 2.0);
    // Window 5 reaches back to Jan 6 only
    EXPECT_DOUBLE_EQ(*TrailingBaseline(burdens, 2, 5), 1.0);
    // Jan 10 with window 5 has no prior day in range
    EXPECT_FALSE(TrailingBaseline(burdens, 1, 5).has_value());
}

TEST(BaselineTest, LocalBaselineExcludesCenterAndFlaggedDays) {
    DailySeries series;
    const Date center(2024, 6, 15);
    for (int offset = -10; offset <= 10; ++offset) {
        series[center + offset] = 1.0;
    }
    series[center] = 50.0;
    series[center + 2] = 50.0;

    auto excluded = [&](Date date) { return date == center + 2; };
    auto baseline = LocalBaseline(series, center, 7, excluded);
    ASSERT_TRUE(baseline.has_value());
    EXPECT_DOUBLE_EQ(*baseline, 1.0);
}

TEST(BaselineTest, LocalBaselineEmptyWindow) {
    DailySeries series;
    series[Date(2024, 1, 1)] = 2.0;
    EXPECT_FALSE(LocalBaseline(series, Date(2024, 1, 1), 7, nullptr).has_value());
    EXPECT_FALSE(LocalBaseline(series, Date(2024, 3, 1), 7, nullptr).has_value());
}

TEST(BaselineTest, MeanOverDays) {
    DailySeries series;
    series[Date(2024, 1, 2)] = 1.0;
    series[Date(2024, 1, 4)] = 3.0;
    series[Date(2024, 1, 9)] = 9.0;

    EXPECT_DOUBLE_EQ(*MeanOverDays(series, Date(2024, 1, 2), Date(2024, 1, 4)), 2.0);
    EXPECT_DOUBLE_EQ(*MeanOverDays(series, Date(2024, 1, 3), Date(2024, 1, 5)), 3.0);
    EXPECT_FALSE(MeanOverDays(series, Date(2024, 1, 5), Date(2024, 1, 8)).has_value());
    EXPECT_FALSE(MeanOverDays(series, Date(2024, 1, 9), Date(2024, 1, 2)).has_value());
}

}  // namespace
}  // namespace flaresignal::analysis
