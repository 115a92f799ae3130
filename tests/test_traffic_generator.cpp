/// @file test_traffic_generator.cpp
/// @brief Tests for the demo's synthetic traffic source.

#include "demo/traffic_generator.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace statmon;

TEST(TrafficGenerator, FeedsMonitor) {
  MonitorConfig cfg;
  cfg.capabilities = Capabilities::reduced();
  cfg.cluster_mode = false;
  StatusMonitor monitor{cfg};

  net::io_context ioc;
  demo::TrafficGenerator traffic{
      ioc, monitor,
      demo::TrafficConfig{.requests_per_second = 200,
                          .batch_interval_ms = 10,
                          .min_latency_ms = 1.0,
                          .max_latency_ms = 2.0,
                          .rate_limit_ratio = 0.0}};
  traffic.start();
  ioc.run_for(std::chrono::milliseconds(300));
  traffic.stop();
  ioc.run(); // Only in-flight completions remain.

  const auto &stats = traffic.stats();
  EXPECT_GT(stats.started, 0u);
  EXPECT_EQ(stats.blocked, 0u);
  EXPECT_EQ(monitor.routes().total_requests(), stats.started);
  EXPECT_EQ(stats.completed, stats.started);

  auto s = monitor.local_snapshot();
  EXPECT_FALSE(s.top_routes.empty());
  EXPECT_EQ(s.active_connections, 0u);
  EXPECT_EQ(s.rate_limit.total, stats.started);
}

TEST(TrafficGenerator, IdsAreNormalizedAway) {
  MonitorConfig cfg;
  cfg.capabilities = Capabilities::reduced();
  cfg.cluster_mode = false;
  StatusMonitor monitor{cfg};

  net::io_context ioc;
  demo::TrafficGenerator traffic{
      ioc, monitor,
      demo::TrafficConfig{.requests_per_second = 1000,
                          .batch_interval_ms = 10,
                          .min_latency_ms = 0.5,
                          .max_latency_ms = 1.0}};
  traffic.start();
  ioc.run_for(std::chrono::milliseconds(200));
  traffic.stop();
  ioc.run();

  for (const auto &r : monitor.routes().routes()) {
    EXPECT_EQ(r.path.find_first_of("0123456789"), std::string::npos)
        << r.path;
  }
}
