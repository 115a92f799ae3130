/// @file test_alerts.cpp
/// @brief Unit tests for evaluate_alerts.

#include "metrics/alerts.hpp"

#include <gtest/gtest.h>

using namespace statmon;

TEST(Alerts, QuietBelowThresholds) {
  AlertInputs in{.cpu = 10, .memory_percent = 20, .response_time = 50,
                 .error_rate = 1, .event_loop_lag = 5};
  auto flags = evaluate_alerts(in, AlertThresholds{}, Capabilities{});
  EXPECT_FALSE(flags.any());
}

TEST(Alerts, EachThresholdTrips) {
  AlertInputs in{.cpu = 81, .memory_percent = 91, .response_time = 501,
                 .error_rate = 5.5, .event_loop_lag = 101};
  auto flags = evaluate_alerts(in, AlertThresholds{}, Capabilities{});
  EXPECT_TRUE(flags.cpu);
  EXPECT_TRUE(flags.memory);
  EXPECT_TRUE(flags.response_time);
  EXPECT_TRUE(flags.error_rate);
  EXPECT_TRUE(flags.event_loop_lag);
}

TEST(Alerts, ComparisonIsStrict) {
  AlertInputs in{.cpu = 80, .memory_percent = 90, .response_time = 500,
                 .error_rate = 5, .event_loop_lag = 100};
  auto flags = evaluate_alerts(in, AlertThresholds{}, Capabilities{});
  EXPECT_FALSE(flags.any());
}

TEST(Alerts, CustomThresholds) {
  AlertThresholds t{.response_time = 100};
  AlertInputs in{.response_time = 150};
  EXPECT_TRUE(evaluate_alerts(in, t, Capabilities{}).response_time);
}

TEST(Alerts, ReducedModeNeverFlagsHostGauges) {
  AlertInputs in{.cpu = 99, .memory_percent = 99, .response_time = 900,
                 .error_rate = 50, .event_loop_lag = 900};
  auto flags = evaluate_alerts(in, AlertThresholds{}, Capabilities::reduced());
  EXPECT_FALSE(flags.cpu);
  EXPECT_FALSE(flags.memory);
  EXPECT_FALSE(flags.event_loop_lag);
  // Request-level metrics still alert.
  EXPECT_TRUE(flags.response_time);
  EXPECT_TRUE(flags.error_rate);
}
