/// @file test_time_series.cpp
/// @brief Unit tests for RollingHistory retention and series merging modes.

#include "metrics/time_series.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace statmon;

class RollingHistoryTest : public ::testing::Test {
protected:
  std::int64_t now_ms_ = 1'700'000'000'000;
  RollingHistory history_{60, [this] { return now_ms_; }};
};

TEST_F(RollingHistoryTest, LatestDefaultsToZero) {
  EXPECT_DOUBLE_EQ(history_.latest("cpu"), 0.0);
  EXPECT_TRUE(history_.series("cpu").empty());
}

TEST_F(RollingHistoryTest, AppendStampsWithClock) {
  history_.append("cpu", 12.5);

  auto s = history_.series("cpu");
  ASSERT_EQ(s.size(), 1u);
  EXPECT_EQ(s.front().timestamp, now_ms_);
  EXPECT_DOUBLE_EQ(s.front().value, 12.5);
  EXPECT_DOUBLE_EQ(history_.latest("cpu"), 12.5);
}

TEST_F(RollingHistoryTest, LatestIsMostRecent) {
  history_.append("rps", 1.0);
  now_ms_ += 1000;
  history_.append("rps", 7.0);
  EXPECT_DOUBLE_EQ(history_.latest("rps"), 7.0);
}

TEST_F(RollingHistoryTest, SeventyTicksKeepAboutOneMinute) {
  for (int i = 0; i < 70; ++i) {
    history_.append("cpu", static_cast<double>(i));
    now_ms_ += 1000;
  }
  now_ms_ -= 1000; // Back to the time of the last append.

  auto s = history_.series("cpu");
  EXPECT_GE(s.size(), 59u);
  EXPECT_LE(s.size(), 61u);
  for (const auto &p : s) {
    EXPECT_LE(now_ms_ - p.timestamp, 60'000);
  }
  EXPECT_DOUBLE_EQ(s.back().value, 69.0);
}

TEST_F(RollingHistoryTest, TimestampsNonDecreasing) {
  for (int i = 0; i < 10; ++i) {
    history_.append("memory", 1.0);
    now_ms_ += (i % 2) * 500;
  }
  auto s = history_.series("memory");
  for (std::size_t i = 1; i < s.size(); ++i) {
    EXPECT_LE(s[i - 1].timestamp, s[i].timestamp);
  }
}

TEST_F(RollingHistoryTest, RetentionIsPerSeriesAndLazy) {
  history_.append("cpu", 1.0);
  history_.append("rps", 1.0);
  now_ms_ += 120'000;
  history_.append("rps", 2.0);

  // rps was trimmed by its append; cpu was not touched.
  EXPECT_EQ(history_.series("rps").size(), 1u);
  EXPECT_EQ(history_.series("cpu").size(), 1u);
}

TEST_F(RollingHistoryTest, BundleIncludesMissingSeries) {
  history_.append("cpu", 3.0);
  auto bundle = history_.bundle(series::kAll);

  EXPECT_EQ(bundle.size(), std::size(series::kAll));
  EXPECT_EQ(bundle.at("cpu").size(), 1u);
  EXPECT_TRUE(bundle.at("eventLoopLag").empty());
}

TEST(MergeMode, RpsSumsEverythingElseAverages) {
  EXPECT_EQ(merge_mode_for(series::kRps), MergeMode::Sum);
  EXPECT_EQ(merge_mode_for(series::kCpu), MergeMode::Average);
  EXPECT_EQ(merge_mode_for(series::kResponseTime), MergeMode::Average);
  EXPECT_EQ(merge_mode_for("somethingElse"), MergeMode::Average);
}
