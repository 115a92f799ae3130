/// @file test_status_monitor.cpp
/// @brief Tests for the StatusMonitor façade: request tracking, rollover,
///        snapshots and the worker/coordinator message path.

#include "monitor/status_monitor.hpp"
#include "serialization/json_serializer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <vector>

using namespace statmon;

namespace {

/// Records every message sent; on_message handlers can be fired by hand.
class FakeChannel : public Channel {
public:
  void send(const nlohmann::json &message) override {
    sent.push_back(message);
  }
  void on_message(MessageHandler h) override { handler = std::move(h); }

  std::vector<nlohmann::json> sent;
  MessageHandler handler;
};

} // namespace

class StatusMonitorTest : public ::testing::Test {
protected:
  auto make_config(bool cluster = false) -> MonitorConfig {
    MonitorConfig cfg;
    cfg.now = [this] { return now_ms_; };
    cfg.cluster_mode = cluster;
    cfg.capabilities = Capabilities::reduced();
    return cfg;
  }

  void request(StatusMonitor &m, std::string_view path, double ms,
               int status) {
    m.on_request_start(path, "GET");
    m.on_request_complete(path, "GET", ms, status);
  }

  std::int64_t now_ms_ = 1'700'000'000'000;
};

TEST_F(StatusMonitorTest, EmptySnapshot) {
  StatusMonitor m{make_config()};
  auto s = m.snapshot();
  EXPECT_EQ(s.total_requests, 0u);
  EXPECT_DOUBLE_EQ(s.error_rate, 0.0);
  EXPECT_TRUE(s.top_routes.empty());
  EXPECT_DOUBLE_EQ(s.percentiles.p99, 0.0);
  EXPECT_EQ(s.timestamp, now_ms_);
  EXPECT_TRUE(s.database.connected);
  EXPECT_FALSE(s.worker_count.has_value());
}

TEST_F(StatusMonitorTest, SingleServerError) {
  StatusMonitor m{make_config()};
  request(m, "/api/boom", 12.0, 500);

  auto s = m.snapshot();
  EXPECT_DOUBLE_EQ(s.error_rate, 100.0);
  EXPECT_EQ(s.status_codes.at("500"), 1u);
  ASSERT_EQ(s.recent_errors.size(), 1u);
  EXPECT_EQ(s.recent_errors.front().status, 500);
  ASSERT_EQ(s.error_routes.size(), 1u);
}

TEST_F(StatusMonitorTest, StatusCodeHistogram) {
  StatusMonitor m{make_config()};
  request(m, "/a", 1.0, 200);
  request(m, "/a", 1.0, 200);
  request(m, "/b", 1.0, 201);

  const StatusCodeCounts expected{{"200", 2}, {"201", 1}};
  EXPECT_EQ(m.snapshot().status_codes, expected);
}

TEST_F(StatusMonitorTest, RepeatedSnapshotsAgree) {
  StatusMonitor m{make_config()};
  request(m, "/a", 5.0, 200);
  request(m, "/a", 5.0, 404);

  auto first = m.snapshot();
  auto second = m.snapshot();
  EXPECT_EQ(first.total_requests, second.total_requests);
  EXPECT_EQ(first.status_codes, second.status_codes);
  EXPECT_DOUBLE_EQ(first.error_rate, second.error_rate);
}

TEST_F(StatusMonitorTest, PercentilesFromCompletions) {
  StatusMonitor m{make_config()};
  for (int i = 1; i <= 100; ++i) {
    request(m, "/p", static_cast<double>(i), 200);
  }
  auto p = m.snapshot().percentiles;
  EXPECT_LE(p.p50, p.p95);
  EXPECT_LE(p.p95, p.p99);
  EXPECT_DOUBLE_EQ(p.avg, 50.5);
}

TEST_F(StatusMonitorTest, RouteListsCappedAtMaxRoutes) {
  auto cfg = make_config();
  cfg.max_routes = 3;
  StatusMonitor m{std::move(cfg)};
  for (int i = 0; i < 8; ++i) {
    request(m, "/r" + std::string(1, static_cast<char>('a' + i)), 1.0, 500);
  }
  auto s = m.snapshot();
  EXPECT_EQ(s.top_routes.size(), 3u);
  EXPECT_EQ(s.slowest_routes.size(), 3u);
  EXPECT_EQ(s.error_routes.size(), 3u);
}

TEST_F(StatusMonitorTest, TickRollsIntervalIntoHistory) {
  StatusMonitor m{make_config()};
  m.on_request_start("/a", "GET");
  m.on_request_start("/a", "GET");
  m.on_request_complete("/a", "GET", 10.0, 200);
  m.on_request_complete("/a", "GET", 20.0, 200);

  now_ms_ += 1000;
  m.tick();

  auto s = m.snapshot();
  EXPECT_DOUBLE_EQ(s.rps, 2.0);
  EXPECT_DOUBLE_EQ(s.response_time, 15.0);

  now_ms_ += 1000;
  m.tick();
  s = m.snapshot();
  EXPECT_DOUBLE_EQ(s.rps, 0.0);
  EXPECT_DOUBLE_EQ(s.response_time, 0.0);
  EXPECT_EQ(s.total_requests, 2u);
}

TEST_F(StatusMonitorTest, SeventyTicksStayWithinRetention) {
  StatusMonitor m{make_config()};
  for (int i = 0; i < 70; ++i) {
    now_ms_ += 1000;
    m.tick();
  }
  for (const auto &[name, points] : m.charts()) {
    if (points.empty()) {
      continue; // Unavailable in reduced mode.
    }
    EXPECT_GE(points.size(), 59u) << name;
    EXPECT_LE(points.size(), 61u) << name;
    for (const auto &p : points) {
      EXPECT_LE(now_ms_ - p.timestamp, 60'000) << name;
    }
  }
}

TEST_F(StatusMonitorTest, ReducedModeRecordsRequestSeriesOnly) {
  StatusMonitor m{make_config()};
  now_ms_ += 1000;
  m.tick();

  auto charts = m.charts();
  EXPECT_TRUE(charts.at("cpu").empty());
  EXPECT_TRUE(charts.at("memory").empty());
  EXPECT_TRUE(charts.at("heap").empty());
  EXPECT_TRUE(charts.at("eventLoopLag").empty());
  EXPECT_EQ(charts.at("rps").size(), 1u);
  EXPECT_EQ(charts.at("errorRate").size(), 1u);
  EXPECT_EQ(charts.at("responseTime").size(), 1u);

  auto s = m.snapshot();
  EXPECT_TRUE(s.reduced_mode);
  EXPECT_DOUBLE_EQ(s.heap_growth_rate, 0.0);
  EXPECT_DOUBLE_EQ(s.event_loop_lag, 0.0);
  EXPECT_FALSE(s.alerts.cpu);
  EXPECT_FALSE(s.alerts.memory);
}

TEST_F(StatusMonitorTest, EventLoopLagMeasuredFromTickDrift) {
  auto cfg = make_config();
  cfg.capabilities = Capabilities{.host_metrics = false,
                                  .process_metrics = false,
                                  .event_loop_lag = true};
  StatusMonitor m{std::move(cfg)};

  now_ms_ += 1250; // 250 ms late.
  m.tick();
  EXPECT_DOUBLE_EQ(m.snapshot().event_loop_lag, 250.0);

  now_ms_ += 900; // Early ticks never go negative.
  m.tick();
  EXPECT_DOUBLE_EQ(m.snapshot().event_loop_lag, 0.0);
}

TEST_F(StatusMonitorTest, ResponseTimeAlert) {
  StatusMonitor m{make_config()};
  request(m, "/slow", 900.0, 200);
  now_ms_ += 1000;
  m.tick();
  EXPECT_TRUE(m.snapshot().alerts.response_time);
}

// ─── Health probe ───────────────────────────────────────────────────────

TEST_F(StatusMonitorTest, HealthProbeReportedLatencyWins) {
  auto cfg = make_config();
  cfg.health_probe = [] {
    std::promise<HealthResult> p;
    p.set_value(
        HealthResult{.connected = true, .latency_ms = 7.5, .name = "postgres"});
    return p.get_future();
  };
  StatusMonitor m{std::move(cfg)};

  auto db = m.snapshot().database;
  EXPECT_TRUE(db.connected);
  EXPECT_DOUBLE_EQ(db.latency_ms, 7.5);
  EXPECT_EQ(db.name, std::optional<std::string>{"postgres"});
}

TEST_F(StatusMonitorTest, HealthProbeFailureIsDisconnected) {
  auto cfg = make_config();
  cfg.health_probe = []() -> std::future<HealthResult> {
    std::promise<HealthResult> p;
    p.set_exception(std::make_exception_ptr(std::runtime_error{"refused"}));
    return p.get_future();
  };
  StatusMonitor m{std::move(cfg)};

  auto db = m.snapshot().database;
  EXPECT_FALSE(db.connected);
  EXPECT_DOUBLE_EQ(db.latency_ms, 0.0);
}

TEST_F(StatusMonitorTest, HealthProbeNonStandardExceptionIsDisconnected) {
  auto cfg = make_config();
  cfg.health_probe = []() -> std::future<HealthResult> {
    std::promise<HealthResult> p;
    p.set_exception(std::make_exception_ptr(42));
    return p.get_future();
  };
  StatusMonitor m{std::move(cfg)};

  HealthStatus db;
  EXPECT_NO_THROW(db = m.snapshot().database);
  EXPECT_FALSE(db.connected);
  EXPECT_DOUBLE_EQ(db.latency_ms, 0.0);
}

TEST_F(StatusMonitorTest, HealthProbeThrowingDirectlyIsDisconnected) {
  auto cfg = make_config();
  cfg.health_probe = []() -> std::future<HealthResult> {
    throw std::runtime_error{"no pool"};
  };
  StatusMonitor m{std::move(cfg)};
  EXPECT_FALSE(m.snapshot().database.connected);
}

TEST_F(StatusMonitorTest, NoHealthProbeIsConnected) {
  auto cfg = make_config();
  cfg.health_probe = nullptr;
  StatusMonitor m{std::move(cfg)};
  EXPECT_TRUE(m.snapshot().database.connected);
}

// ─── Timer ──────────────────────────────────────────────────────────────

TEST_F(StatusMonitorTest, StartRunsTicksOnIoContext) {
  auto cfg = make_config();
  cfg.update_interval_ms = 10;
  StatusMonitor m{std::move(cfg)};

  boost::asio::io_context ioc;
  m.start(ioc);
  m.start(ioc); // Idempotent.
  EXPECT_TRUE(m.running());

  ioc.run_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(m.charts().at("rps").empty());

  m.stop();
  EXPECT_FALSE(m.running());
  m.stop();
}

// ─── Cluster ────────────────────────────────────────────────────────────

TEST_F(StatusMonitorTest, StandaloneHasNoAggregator) {
  StatusMonitor m{make_config(false)};
  EXPECT_FALSE(m.cluster_mode());
  EXPECT_EQ(m.aggregator(), nullptr);
  EXPECT_FALSE(m.ingest_worker_message(
      nlohmann::json{{"type", "worker-metrics"}, {"workerId", 1}, {"pid", 1}}));
}

TEST_F(StatusMonitorTest, WorkerSendsMessageEveryTick) {
  auto cfg = make_config(true);
  cfg.worker_id = 5;
  StatusMonitor worker{std::move(cfg)};
  auto channel = std::make_shared<FakeChannel>();
  worker.report_to(channel);

  request(worker, "/api/users/1", 4.0, 200);
  now_ms_ += 1000;
  worker.tick();
  worker.tick();

  ASSERT_EQ(channel->sent.size(), 2u);
  const auto &msg = channel->sent.front();
  EXPECT_EQ(msg["type"], "worker-metrics");
  EXPECT_EQ(msg["workerId"], 5);
  EXPECT_EQ(msg["partialSnapshot"]["totalRequests"], 1);
  EXPECT_EQ(msg["partialSnapshot"]["topRoutes"][0]["path"], "/api/users/:id");
  EXPECT_EQ(msg["charts"]["rps"].size(), 1u);
}

TEST_F(StatusMonitorTest, StandaloneDoesNotReport) {
  StatusMonitor m{make_config(false)};
  auto channel = std::make_shared<FakeChannel>();
  m.report_to(channel);
  m.tick();
  EXPECT_TRUE(channel->sent.empty());
}

TEST_F(StatusMonitorTest, CoordinatorAggregatesWorkers) {
  StatusMonitor coordinator{make_config(true)};
  auto channel = std::make_shared<FakeChannel>();
  coordinator.accept_reports_from(channel);
  ASSERT_TRUE(channel->handler);

  auto report = [](int id, double rps, double cpu, int total) {
    return nlohmann::json{
        {"type", "worker-metrics"},
        {"workerId", id},
        {"pid", 1000 + id},
        {"partialSnapshot",
         {{"rps", rps}, {"cpu", cpu}, {"totalRequests", total}}},
        {"charts", nlohmann::json::object()},
    };
  };
  channel->handler(report(1, 10, 20, 100));
  channel->handler(report(2, 20, 10, 200));

  auto s = coordinator.snapshot();
  EXPECT_DOUBLE_EQ(s.rps, 30.0);
  EXPECT_DOUBLE_EQ(s.cpu, 15.0);
  EXPECT_EQ(s.total_requests, 300u);
  EXPECT_EQ(s.worker_count, std::optional<std::size_t>{2});

  now_ms_ += 10'001;
  EXPECT_FALSE(coordinator.snapshot().worker_count.has_value());
}

TEST_F(StatusMonitorTest, IgnoresForeignAndMalformedMessages) {
  StatusMonitor m{make_config(true)};
  EXPECT_FALSE(m.ingest_worker_message(nlohmann::json::array()));
  EXPECT_FALSE(m.ingest_worker_message({{"type", "something-else"}}));
  EXPECT_FALSE(m.ingest_worker_message({{"type", "worker-metrics"}}));
  EXPECT_FALSE(m.ingest_worker_message(
      {{"type", "worker-metrics"}, {"workerId", "one"}, {"pid", 1}}));
  EXPECT_EQ(m.aggregator()->worker_count(), 0u);

  EXPECT_TRUE(m.ingest_worker_message(
      {{"type", "worker-metrics"}, {"workerId", 1}, {"pid", 1}}));
  EXPECT_EQ(m.aggregator()->worker_count(), 1u);
}

TEST_F(StatusMonitorTest, WorkerMessageRoundTripsThroughCoordinator) {
  auto worker_cfg = make_config(true);
  worker_cfg.worker_id = 9;
  StatusMonitor worker{std::move(worker_cfg)};
  StatusMonitor coordinator{make_config(true)};

  request(worker, "/api/x", 3.0, 503);
  EXPECT_TRUE(coordinator.ingest_worker_message(worker.worker_message()));

  auto s = coordinator.snapshot();
  EXPECT_EQ(s.total_requests, 1u);
  EXPECT_EQ(s.status_codes.at("503"), 1u);
  ASSERT_EQ(s.error_routes.size(), 1u);
  EXPECT_EQ(s.error_routes.front().path, "/api/x");
}

// ─── format_uptime ──────────────────────────────────────────────────────

TEST(FormatUptime, Units) {
  EXPECT_EQ(format_uptime(0), "0s");
  EXPECT_EQ(format_uptime(59), "59s");
  EXPECT_EQ(format_uptime(61), "1m 1s");
  EXPECT_EQ(format_uptime(3605), "1h 5s");
  EXPECT_EQ(format_uptime(90065), "1d 1h 1m 5s");
}
